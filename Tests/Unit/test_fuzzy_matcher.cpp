#include <QtTest/QtTest>

#include "core/ranking/fuzzy_matcher.h"

class TestFuzzyMatcher : public QObject {
    Q_OBJECT

private slots:
    void testEditDistance();
    void testSimilarity();
    void testExactTier();
    void testGenericFuzzyTier();
    void testThaiFoldedEquality();
    void testThaiContainment();
    void testPartialContainment();
    void testCompoundSubstring();
    void testShortTokensDoNotMatch();
    void testTierOrderingAndDiscounts();
};

void TestFuzzyMatcher::testEditDistance()
{
    QCOMPARE(dr::FuzzyMatcher::editDistance(QStringLiteral("kitten"), QStringLiteral("sitting")), 3);
    QCOMPARE(dr::FuzzyMatcher::editDistance(QString(), QStringLiteral("abc")), 3);
    QCOMPARE(dr::FuzzyMatcher::editDistance(QStringLiteral("lease"), QStringLiteral("lease")), 0);
}

void TestFuzzyMatcher::testSimilarity()
{
    QCOMPARE(dr::FuzzyMatcher::similarity(QString(), QString()), 1.0);
    QCOMPARE(dr::FuzzyMatcher::similarity(QStringLiteral("abcd"), QStringLiteral("abce")), 0.75);
    QCOMPARE(dr::FuzzyMatcher::thaiSimilarity(QStringLiteral("บ้าน"), QStringLiteral("บาน")), 1.0);
}

void TestFuzzyMatcher::testExactTier()
{
    const dr::TermMatch match = dr::FuzzyMatcher::match(QStringLiteral("xolo"), QStringLiteral("xolo"));
    QCOMPARE(match.tier, dr::MatchTier::Exact);
    QCOMPARE(match.quality, 1.0);
    QCOMPARE(match.weight(), 1.0);
}

void TestFuzzyMatcher::testGenericFuzzyTier()
{
    const dr::TermMatch match =
        dr::FuzzyMatcher::match(QStringLiteral("agreement"), QStringLiteral("agreemnt"));
    QCOMPARE(match.tier, dr::MatchTier::GenericFuzzy);
    QVERIFY(qAbs(match.quality - 8.0 / 9.0) < 1e-9);
    QVERIFY(qAbs(match.weight() - 0.8 * 8.0 / 9.0) < 1e-9);
}

void TestFuzzyMatcher::testThaiFoldedEquality()
{
    // Same word with and without its tone mark and vowel.
    const dr::TermMatch match = dr::FuzzyMatcher::match(QStringLiteral("บ้าน"), QStringLiteral("บาน"));
    QCOMPARE(match.tier, dr::MatchTier::LanguageFuzzy);
    QCOMPARE(match.quality, dr::FuzzyMatcher::kThaiFoldedEqualQuality);
}

void TestFuzzyMatcher::testThaiContainment()
{
    const dr::TermMatch match =
        dr::FuzzyMatcher::match(QStringLiteral("บางกะปิ"), QStringLiteral("บางกะปิเดอะมอล"));
    QCOMPARE(match.tier, dr::MatchTier::LanguageFuzzy);
    QCOMPARE(match.quality, dr::FuzzyMatcher::kThaiContainmentQuality);
}

void TestFuzzyMatcher::testPartialContainment()
{
    const dr::TermMatch match = dr::FuzzyMatcher::match(QStringLiteral("rent"), QStringLiteral("rental"));
    QCOMPARE(match.tier, dr::MatchTier::Partial);
    QVERIFY(qAbs(match.quality - 4.0 / 6.0) < 1e-9);

    // Quality never drops below the floor.
    const dr::TermMatch weak =
        dr::FuzzyMatcher::match(QStringLiteral("pay"), QStringLiteral("prepayment"));
    QCOMPARE(weak.tier, dr::MatchTier::Partial);
    QCOMPARE(weak.quality, dr::FuzzyMatcher::kPartialQualityFloor);
}

void TestFuzzyMatcher::testCompoundSubstring()
{
    const dr::TermMatch match =
        dr::FuzzyMatcher::match(QStringLiteral("late payment"), QStringLiteral("payments"));
    QCOMPARE(match.tier, dr::MatchTier::Substring);
    QVERIFY(qAbs(match.quality - 7.0 / 8.0) < 1e-9);
}

void TestFuzzyMatcher::testShortTokensDoNotMatch()
{
    QVERIFY(!dr::FuzzyMatcher::match(QStringLiteral("ab"), QStringLiteral("abc")).matched());
    QVERIFY(!dr::FuzzyMatcher::match(QStringLiteral("lease"), QStringLiteral("bakery")).matched());
    QVERIFY(!dr::FuzzyMatcher::match(QString(), QStringLiteral("lease")).matched());
}

void TestFuzzyMatcher::testTierOrderingAndDiscounts()
{
    QCOMPARE(dr::cascadeLevel(dr::MatchTier::Exact), 1);
    QCOMPARE(dr::cascadeLevel(dr::MatchTier::LanguageFuzzy), 2);
    QCOMPARE(dr::cascadeLevel(dr::MatchTier::GenericFuzzy), 2);
    QCOMPARE(dr::cascadeLevel(dr::MatchTier::Partial), 3);
    QCOMPARE(dr::cascadeLevel(dr::MatchTier::Substring), 4);

    QCOMPARE(dr::tierDiscount(dr::MatchTier::Exact), 1.0);
    QCOMPARE(dr::tierDiscount(dr::MatchTier::LanguageFuzzy), 0.9);
    QCOMPARE(dr::tierDiscount(dr::MatchTier::GenericFuzzy), 0.8);
    QCOMPARE(dr::tierDiscount(dr::MatchTier::Partial), 0.7);
    QCOMPARE(dr::tierDiscount(dr::MatchTier::Substring), 0.6);

    QCOMPARE(dr::matchTierToString(dr::MatchTier::Partial), QStringLiteral("partial"));
}

QTEST_MAIN(TestFuzzyMatcher)
#include "test_fuzzy_matcher.moc"
