#include <QtTest/QtTest>
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QTemporaryDir>

class TestSettingsManager : public QObject {
    Q_OBJECT

private slots:
    void testDefaults();
    void testJsonRoundTripPreservesValues();
    void testFromJsonKeepsDefaultsForMissingKeys();
    void testFromJsonClampsBatchSizes();
    void testSaveAndLoadFile();
    void testLoadMissingOrCorruptFile();
    void testEnvironmentOverrides();
    void testEnvironmentIgnoresBadNumbers();
    void testApplyLogLevel();
};

void TestSettingsManager::testDefaults()
{
    const sift::Settings settings;
    QCOMPARE(settings.chunkSize, 1000);
    QCOMPARE(settings.chunkOverlap, 200);
    QCOMPARE(settings.maxTokensPerChunk, 512);
    QCOMPARE(settings.embeddingDimensions, 768);
    QCOMPARE(settings.embeddingBatchSize, 50);
    QCOMPARE(settings.topK, 5);
    QCOMPARE(settings.similarityThreshold, 0.3);
    QCOMPARE(settings.hybridVectorWeight, 0.6);
    QCOMPARE(settings.hybridKeywordWeight, 0.4);
    QCOMPARE(settings.rrfK, 60);
    QCOMPARE(settings.rerankerBatchSize, 32);
    QVERIFY(settings.useHybridSearch);
    QVERIFY(!settings.allowDegradedHybrid);
}

void TestSettingsManager::testJsonRoundTripPreservesValues()
{
    sift::Settings settings;
    settings.dbPath = QStringLiteral("/tmp/sift-test.db");
    settings.embeddingModel = QStringLiteral("mini-embed");
    settings.embeddingDimensions = 384;
    settings.chunkSize = 640;
    settings.semanticChunking = false;
    settings.similarityThreshold = 0.55;
    settings.useHybridSearch = false;
    settings.rerankerEnabled = false;
    settings.rerankerTopK = 12;
    settings.logLevel = QStringLiteral("debug");

    const sift::Settings restored =
        sift::SettingsManager::fromJson(sift::SettingsManager::toJson(settings));
    QCOMPARE(restored.dbPath, settings.dbPath);
    QCOMPARE(restored.embeddingModel, settings.embeddingModel);
    QCOMPARE(restored.embeddingDimensions, 384);
    QCOMPARE(restored.chunkSize, 640);
    QVERIFY(!restored.semanticChunking);
    QCOMPARE(restored.similarityThreshold, 0.55);
    QVERIFY(!restored.useHybridSearch);
    QVERIFY(!restored.rerankerEnabled);
    QCOMPARE(restored.rerankerTopK, 12);
    QCOMPARE(restored.logLevel, QStringLiteral("debug"));
}

void TestSettingsManager::testFromJsonKeepsDefaultsForMissingKeys()
{
    QJsonObject json;
    json.insert(QStringLiteral("topK"), 9);
    const sift::Settings settings = sift::SettingsManager::fromJson(json);
    QCOMPARE(settings.topK, 9);
    QCOMPARE(settings.embeddingBaseUrl, QStringLiteral("http://localhost:11434"));
    QCOMPARE(settings.chunkOverlap, 200);
}

void TestSettingsManager::testFromJsonClampsBatchSizes()
{
    QJsonObject json;
    json.insert(QStringLiteral("embeddingBatchSize"), 0);
    json.insert(QStringLiteral("rerankerBatchSize"), -4);
    const sift::Settings settings = sift::SettingsManager::fromJson(json);
    QCOMPARE(settings.embeddingBatchSize, 1);
    QCOMPARE(settings.rerankerBatchSize, 1);
}

void TestSettingsManager::testSaveAndLoadFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/settings.json"));

    sift::Settings settings;
    settings.rrfK = 42;
    settings.modelsDir = QStringLiteral("/opt/models");
    QVERIFY(sift::SettingsManager::saveToFile(settings, path));

    const auto loaded = sift::SettingsManager::loadFromFile(path);
    QVERIFY(loaded.has_value());
    QCOMPARE(loaded->rrfK, 42);
    QCOMPARE(loaded->modelsDir, QStringLiteral("/opt/models"));
}

void TestSettingsManager::testLoadMissingOrCorruptFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QVERIFY(!sift::SettingsManager::loadFromFile(dir.filePath(QStringLiteral("absent.json")))
                 .has_value());

    const QString corrupt = dir.filePath(QStringLiteral("corrupt.json"));
    QFile file(corrupt);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    QVERIFY(!sift::SettingsManager::loadFromFile(corrupt).has_value());
}

void TestSettingsManager::testEnvironmentOverrides()
{
    QProcessEnvironment env;
    env.insert(QStringLiteral("SIFT_DB_PATH"), QStringLiteral("/data/kb.db"));
    env.insert(QStringLiteral("SIFT_EMBED_URL"), QStringLiteral("http://embed:8080"));
    env.insert(QStringLiteral("SIFT_EMBED_MODEL"), QStringLiteral("bge-small"));
    env.insert(QStringLiteral("SIFT_EMBED_DIMENSIONS"), QStringLiteral("384"));
    env.insert(QStringLiteral("SIFT_EMBED_TIMEOUT_MS"), QStringLiteral("5"));
    env.insert(QStringLiteral("SIFT_MODELS_DIR"), QStringLiteral("/models"));
    env.insert(QStringLiteral("SIFT_RERANKER_ENABLED"), QStringLiteral("off"));
    env.insert(QStringLiteral("SIFT_LOG_LEVEL"), QStringLiteral("warning"));

    sift::Settings settings;
    sift::SettingsManager::applyEnvironment(settings, env);
    QCOMPARE(settings.dbPath, QStringLiteral("/data/kb.db"));
    QCOMPARE(settings.embeddingBaseUrl, QStringLiteral("http://embed:8080"));
    QCOMPARE(settings.embeddingModel, QStringLiteral("bge-small"));
    QCOMPARE(settings.embeddingDimensions, 384);
    QCOMPARE(settings.embeddingTimeoutMs, 100);  // clamped to the minimum
    QCOMPARE(settings.modelsDir, QStringLiteral("/models"));
    QVERIFY(!settings.rerankerEnabled);
    QCOMPARE(settings.logLevel, QStringLiteral("warning"));
}

void TestSettingsManager::testEnvironmentIgnoresBadNumbers()
{
    QProcessEnvironment env;
    env.insert(QStringLiteral("SIFT_EMBED_DIMENSIONS"), QStringLiteral("many"));
    env.insert(QStringLiteral("SIFT_RERANKER_ENABLED"), QStringLiteral("yes"));

    sift::Settings settings;
    settings.rerankerEnabled = false;
    sift::SettingsManager::applyEnvironment(settings, env);
    QCOMPARE(settings.embeddingDimensions, 768);
    QVERIFY(settings.rerankerEnabled);
}

void TestSettingsManager::testApplyLogLevel()
{
    QVERIFY(sift::applyLogLevel(QStringLiteral("debug")));
    QVERIFY(siftSearch().isDebugEnabled());

    QVERIFY(sift::applyLogLevel(QStringLiteral("error")));
    QVERIFY(!siftSearch().isWarningEnabled());
    QVERIFY(siftSearch().isCriticalEnabled());

    QVERIFY(!sift::applyLogLevel(QStringLiteral("verbose")));
    QVERIFY(sift::applyLogLevel(QStringLiteral("info")));
}

QTEST_MAIN(TestSettingsManager)
#include "test_settings_manager.moc"
