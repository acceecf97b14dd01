#include <QtTest/QtTest>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "core/embedding/process_embedding_provider.h"
#include "core/query/word_segmenter.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/retrieval/retriever_factory.h"
#include "core/shared/settings.h"
#include "core/shared/settings_manager.h"
#include "Support/retrieval_test_utils.h"

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testSaveLoadRoundTrip();
    void testMissingFileReturnsNullopt();
    void testMalformedJsonReturnsNullopt();
    void testPartialJsonKeepsDefaults();
    void testEnvironmentOverridesPath();
    void testRetrieverConfigFromSettings();
    void testFactoryBuildsConfiguredCollaborators();
    void testFactoryWithoutSegmenter();
    void testFactoryFailsOnUnopenableStore();
};

void TestSettingsManager::testDefaults()
{
    const dr::Settings settings;
    QCOMPARE(settings.keywordWeight, 0.5);
    QCOMPARE(settings.vectorWeight, 0.5);
    QCOMPARE(settings.massFraction, 0.3);
    QCOMPARE(settings.minChunks, 2);
    QCOMPARE(settings.documentScopedMinChunks, 5);
    QCOMPARE(settings.maxChunks, 8);
    QCOMPARE(settings.queryTimeoutMs, 30000u);
    QVERIFY(settings.primaryBoostTerms.contains(QStringLiteral("xolo")));
    QVERIFY(settings.secondaryBoostTerms.contains(QStringLiteral("บางกะปิ")));
}

void TestSettingsManager::testSaveLoadRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    dr::Settings settings;
    settings.dbPath = QStringLiteral("/var/lib/docretriever/chunks.db");
    settings.embeddingProgram = QStringLiteral("/usr/local/bin/embed");
    settings.embeddingArguments = {QStringLiteral("--model"), QStringLiteral("small")};
    settings.embeddingDimensions = 384;
    settings.queryTimeoutMs = 12000;
    settings.keywordWeight = 0.7;
    settings.vectorWeight = 0.3;
    settings.maxChunks = 12;
    settings.primaryBoostTerms = {QStringLiteral("acme")};
    settings.secondaryBoost = 0.25;

    QVERIFY(dr::SettingsManager::saveTo(settings, path));
    const auto loaded = dr::SettingsManager::loadFrom(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->dbPath, settings.dbPath);
    QCOMPARE(loaded->embeddingProgram, settings.embeddingProgram);
    QCOMPARE(loaded->embeddingArguments, settings.embeddingArguments);
    QCOMPARE(loaded->embeddingDimensions, 384);
    QCOMPARE(loaded->queryTimeoutMs, 12000u);
    QCOMPARE(loaded->keywordWeight, 0.7);
    QCOMPARE(loaded->vectorWeight, 0.3);
    QCOMPARE(loaded->maxChunks, 12);
    QCOMPARE(loaded->primaryBoostTerms, QStringList{QStringLiteral("acme")});
    QCOMPARE(loaded->secondaryBoost, 0.25);

    // Search parameters and boosts are grouped under their own objects.
    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QJsonObject json = QJsonDocument::fromJson(file.readAll()).object();
    QVERIFY(json.value(QStringLiteral("search")).isObject());
    QCOMPARE(json.value(QStringLiteral("search")).toObject()
                 .value(QStringLiteral("maxChunks")).toInt(), 12);
    QCOMPARE(json.value(QStringLiteral("literalBoosts")).toObject()
                 .value(QStringLiteral("primaryTerms")).toArray().size(), 1);
}

void TestSettingsManager::testMissingFileReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!dr::SettingsManager::loadFrom(dir.filePath(QStringLiteral("absent.json"))).has_value());
}

void TestSettingsManager::testMalformedJsonReturnsNullopt()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("settings.json"));

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ \"search\": ");
    file.close();
    QVERIFY(!dr::SettingsManager::loadFrom(path).has_value());

    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("[1, 2, 3]");
    file.close();
    QVERIFY(!dr::SettingsManager::loadFrom(path).has_value());
}

void TestSettingsManager::testPartialJsonKeepsDefaults()
{
    const QJsonObject json = QJsonDocument::fromJson(
        R"({"search": {"massFraction": 0.5}, "literalBoosts": {"primaryBoost": 0.6}})").object();
    const dr::Settings settings = dr::SettingsManager::fromJson(json);

    QCOMPARE(settings.massFraction, 0.5);
    QCOMPARE(settings.primaryBoost, 0.6);
    QCOMPARE(settings.keywordWeight, 0.5);
    QCOMPARE(settings.maxChunks, 8);
    QCOMPARE(settings.embeddingTimeoutMs, 10000u);
    QVERIFY(settings.primaryBoostTerms.contains(QStringLiteral("kamu")));
}

void TestSettingsManager::testEnvironmentOverridesPath()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("override.json"));

    qputenv("DOCRETRIEVER_SETTINGS", path.toUtf8());
    QCOMPARE(dr::SettingsManager::settingsFilePath(), path);

    dr::Settings settings;
    settings.minChunks = 3;
    QVERIFY(dr::SettingsManager::save(settings));
    const auto loaded = dr::SettingsManager::load();
    qunsetenv("DOCRETRIEVER_SETTINGS");

    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->minChunks, 3);
    QVERIFY(dr::SettingsManager::settingsFilePath() != path);
}

void TestSettingsManager::testRetrieverConfigFromSettings()
{
    dr::Settings settings;
    settings.queryTimeoutMs = 5000;
    settings.embeddingTimeoutMs = 2000;
    settings.keywordWeight = 0.8;
    settings.vectorWeight = 0.2;
    settings.documentScopedMinChunks = 6;
    settings.primaryBoostTerms = {QStringLiteral("acme")};
    settings.primaryBoost = 0.9;

    const dr::RetrieverConfig config = dr::RetrieverConfig::fromSettings(settings);
    QCOMPARE(config.queryTimeoutMs, 5000);
    QCOMPARE(config.embeddingTimeoutMs, 2000);
    QCOMPARE(config.defaultParams.keywordWeight, 0.8);
    QCOMPARE(config.defaultParams.vectorWeight, 0.2);
    QCOMPARE(config.documentScopedMinChunks, 6);
    QCOMPARE(config.literalBoosts.primaryTerms, QStringList{QStringLiteral("acme")});
    QCOMPARE(config.literalBoosts.primaryBoost, 0.9);
}

void TestSettingsManager::testFactoryBuildsConfiguredCollaborators()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    dr::Settings settings;
    settings.dbPath = dir.filePath(QStringLiteral("chunks.db"));
    settings.embeddingProgram = QStringLiteral("/opt/embed/bin/embed");
    settings.embeddingArguments = {QStringLiteral("--model"), QStringLiteral("small")};
    settings.embeddingDimensions = 384;
    settings.embeddingTimeoutMs = 2500;
    settings.segmenterProgram = QStringLiteral("/opt/thai/bin/segment");
    settings.segmenterArguments = {QStringLiteral("--engine"), QStringLiteral("newmm")};
    settings.segmenterTimeoutMs = 1500;
    settings.queryTimeoutMs = 7000;

    std::optional<dr::RetrieverStack> stack = dr::RetrieverFactory::create(settings);
    QVERIFY(stack.has_value());
    QVERIFY(stack->store != nullptr);
    QVERIFY(stack->retriever != nullptr);
    QVERIFY(QFile::exists(settings.dbPath));

    const auto* embedder =
        dynamic_cast<const dr::ProcessEmbeddingProvider*>(stack->embeddingProvider.get());
    QVERIFY(embedder != nullptr);
    QCOMPARE(embedder->program(), settings.embeddingProgram);
    QCOMPARE(embedder->arguments(), settings.embeddingArguments);
    QCOMPARE(embedder->dimensions(), 384);
    QCOMPARE(embedder->timeoutMs(), 2500);

    const auto* segmenter = dynamic_cast<const dr::ProcessWordSegmenter*>(stack->segmenter.get());
    QVERIFY(segmenter != nullptr);
    QCOMPARE(segmenter->program(), settings.segmenterProgram);
    QCOMPARE(segmenter->timeoutMs(), 1500);

    QCOMPARE(stack->retriever->config().queryTimeoutMs, 7000);
    QCOMPARE(stack->retriever->config().embeddingTimeoutMs, 2500);
    QCOMPARE(stack->retriever->embedder().dimensions(), 384);

    // The retriever reads from the configured database.
    QVERIFY(stack->store->insertChunks(
        {dr::test::makeChunk(1, 0, QStringLiteral("lease renewal notice"))}));
    dr::SearchScope scope;
    scope.ownerId = dr::test::kTestOwner;
    dr::SearchParams params;
    params.keywordWeight = 1.0;
    params.vectorWeight = 0.0;
    const dr::SearchOutcome outcome =
        stack->retriever->search(QStringLiteral("lease"), scope, params);
    QVERIFY(outcome.ok());
    QCOMPARE(static_cast<int>(outcome.results.size()), 1);
}

void TestSettingsManager::testFactoryWithoutSegmenter()
{
    dr::Settings settings;
    settings.dbPath = QStringLiteral(":memory:");
    QVERIFY(settings.segmenterProgram.isEmpty());
    QVERIFY(dr::RetrieverFactory::createSegmenter(settings) == nullptr);

    std::optional<dr::RetrieverStack> stack = dr::RetrieverFactory::create(settings);
    QVERIFY(stack.has_value());
    QVERIFY(stack->segmenter == nullptr);
    QCOMPARE(stack->embeddingProvider->dimensions(), settings.embeddingDimensions);
}

void TestSettingsManager::testFactoryFailsOnUnopenableStore()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    dr::Settings settings;
    // A directory cannot be opened as a database file.
    settings.dbPath = dir.path();
    QVERIFY(!dr::RetrieverFactory::create(settings).has_value());
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
