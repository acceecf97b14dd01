#include <QtTest/QtTest>

#include "core/query/query_parser.h"
#include "Support/retrieval_test_utils.h"

#include <memory>

class TestQueryParser : public QObject {
    Q_OBJECT

private slots:
    void testStopWordsAndShortTokensDropped();
    void testDuplicateTermsCollapsed();
    void testQuotedPhraseKeptWhole();
    void testStopWordOnlyQueryFallsBack();
    void testThaiStopWords();
    void testThaiDenseQueryIsSegmented();
    void testSegmenterFailureDegrades();
    void testSparseThaiNotSegmented();
    void testNormalizeWithoutSegmenter();
};

void TestQueryParser::testStopWordsAndShortTokensDropped()
{
    const dr::QueryParser parser;
    const dr::ParsedQuery parsed =
        parser.parse(QStringLiteral("What is the deposit for a 2 bedroom unit?"));

    QCOMPARE(static_cast<int>(parsed.tokens.size()), 9);
    const QStringList expected = {
        QStringLiteral("what"), QStringLiteral("deposit"), QStringLiteral("bedroom"),
        QStringLiteral("unit"),
    };
    QCOMPARE(parsed.terms, expected);
    QVERIFY(!parsed.segmented);
}

void TestQueryParser::testDuplicateTermsCollapsed()
{
    const dr::QueryParser parser;
    const dr::ParsedQuery parsed = parser.parse(QStringLiteral("Rent rent RENT payment"));
    const QStringList expected = {QStringLiteral("rent"), QStringLiteral("payment")};
    QCOMPARE(parsed.terms, expected);
    QCOMPARE(static_cast<int>(parsed.tokens.size()), 4);
}

void TestQueryParser::testQuotedPhraseKeptWhole()
{
    const dr::QueryParser parser;
    const dr::ParsedQuery parsed =
        parser.parse(QStringLiteral("\"Late Payment\" penalty for tenants"));

    QCOMPARE(parsed.terms.first(), QStringLiteral("late payment"));
    QVERIFY(parsed.terms.contains(QStringLiteral("penalty")));
    QVERIFY(parsed.terms.contains(QStringLiteral("tenants")));
    QVERIFY(!parsed.terms.contains(QStringLiteral("late")));
    QVERIFY(!parsed.terms.contains(QStringLiteral("for")));
    QVERIFY(parsed.tokens.contains(QStringLiteral("payment")));
}

void TestQueryParser::testStopWordOnlyQueryFallsBack()
{
    const dr::QueryParser parser;
    const dr::ParsedQuery parsed = parser.parse(QStringLiteral("To be or not"));
    // Everything is filtered except "not", which is not a stop word.
    QCOMPARE(parsed.terms, QStringList{QStringLiteral("not")});

    const dr::ParsedQuery onlyStops = parser.parse(QStringLiteral("the and of"));
    const QStringList expected = {
        QStringLiteral("the"), QStringLiteral("and"), QStringLiteral("of"),
    };
    QCOMPARE(onlyStops.terms, expected);
}

void TestQueryParser::testThaiStopWords()
{
    QVERIFY(dr::QueryParser::isStopWord(QStringLiteral("ที่")));
    QVERIFY(dr::QueryParser::isStopWord(QStringLiteral("ครับ")));
    QVERIFY(dr::QueryParser::isStopWord(QStringLiteral("the")));
    QVERIFY(!dr::QueryParser::isStopWord(QStringLiteral("บ้าน")));
}

void TestQueryParser::testThaiDenseQueryIsSegmented()
{
    auto segmenter = std::make_shared<dr::test::FakeWordSegmenter>();
    segmenter->segmentations.insert(QStringLiteral("สัญญาเช่าบ้าน"),
                                    QStringLiteral("สัญญา เช่า บ้าน"));
    const dr::QueryParser parser(segmenter);

    const dr::ParsedQuery parsed = parser.parse(QStringLiteral("สัญญาเช่าบ้าน"));
    QVERIFY(parsed.segmented);
    QCOMPARE(segmenter->calls, 1);
    const QStringList expected = {
        QStringLiteral("สัญญา"), QStringLiteral("เช่า"), QStringLiteral("บ้าน"),
    };
    QCOMPARE(parsed.terms, expected);
}

void TestQueryParser::testSegmenterFailureDegrades()
{
    auto segmenter = std::make_shared<dr::test::FakeWordSegmenter>();
    segmenter->fail = true;
    const dr::QueryParser parser(segmenter);

    const dr::ParsedQuery parsed = parser.parse(QStringLiteral("สัญญาเช่าบ้าน"));
    QVERIFY(!parsed.segmented);
    QCOMPARE(segmenter->calls, 1);
    QCOMPARE(parsed.terms, QStringList{QStringLiteral("สัญญาเช่าบ้าน")});
}

void TestQueryParser::testSparseThaiNotSegmented()
{
    auto segmenter = std::make_shared<dr::test::FakeWordSegmenter>();
    const dr::QueryParser parser(segmenter);

    const dr::ParsedQuery parsed =
        parser.parse(QStringLiteral("monthly rent in the central district ก"));
    QCOMPARE(segmenter->calls, 0);
    QVERIFY(!parsed.segmented);
    QVERIFY(parsed.terms.contains(QStringLiteral("district")));
}

void TestQueryParser::testNormalizeWithoutSegmenter()
{
    const dr::QueryParser parser;
    const QStringList tokens = parser.normalize(QStringLiteral("  Move-in   DATE "));
    const QStringList expected = {
        QStringLiteral("move"), QStringLiteral("in"), QStringLiteral("date"),
    };
    QCOMPARE(tokens, expected);
}

QTEST_MAIN(TestQueryParser)
#include "test_query_parser.moc"
