#include <QtTest/QtTest>
#include "core/index/sqlite_store.h"

#include <QTemporaryDir>

class TestSQLiteStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testOpenCreatesSchema();
    void testInsertAssignsIdsAndReadsBack();
    void testNonContiguousIndicesRejected();
    void testWrongEmbeddingDimensionRejected();
    void testInvalidMetadataRejected();
    void testFailedChunkWriteLeavesNothing();
    void testDeleteCascadesToChunks();
    void testDeleteUnknownDocument();
    void testDeleteAll();
    void testUpdateDocumentMetadataMerges();
    void testForEachEmbeddingAndHydrate();
    void testFuzzyKeywordSearch();
    void testSubstringKeywordSearch();
    void testReopenWithDifferentDimensionFails();

private:
    static constexpr int kDims = 4;

    sift::Document makeDocument(const QString& title) const;
    std::vector<sift::Chunk> makeChunks(const QStringList& contents, bool embed) const;

    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::unique_ptr<sift::SQLiteStore> m_store;
};

void TestSQLiteStore::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    QString error;
    m_store = sift::SQLiteStore::open(m_tempDir->filePath(QStringLiteral("corpus.db")), kDims, &error);
    QVERIFY2(m_store, qPrintable(error));
}

void TestSQLiteStore::cleanup()
{
    m_store.reset();
    m_tempDir.reset();
}

sift::Document TestSQLiteStore::makeDocument(const QString& title) const
{
    sift::Document doc;
    doc.title = title;
    doc.source = title.toLower() + QStringLiteral(".txt");
    doc.fullText = QStringLiteral("full text of ") + title;
    doc.metadata.insert(sift::MetadataKeys::FilePath, QStringLiteral("/docs/") + doc.source);
    return doc;
}

std::vector<sift::Chunk> TestSQLiteStore::makeChunks(const QStringList& contents, bool embed) const
{
    std::vector<sift::Chunk> chunks;
    for (int i = 0; i < contents.size(); ++i) {
        sift::Chunk chunk;
        chunk.chunkIndex = i;
        chunk.content = contents.at(i);
        chunk.tokenCount = sift::estimateTokenCount(chunk.content);
        chunk.metadata.insert(sift::MetadataKeys::ChunkMethod, QStringLiteral("fixed"));
        if (embed) {
            sift::Embedding embedding(kDims, 0.0f);
            embedding[static_cast<size_t>(i % kDims)] = 1.0f;
            chunk.embedding = embedding;
        }
        chunks.push_back(chunk);
    }
    return chunks;
}

void TestSQLiteStore::testOpenCreatesSchema()
{
    QVERIFY(m_store->integrityCheck());
    QCOMPARE(m_store->embeddingDimensions(), kDims);
    QVERIFY(m_store->fuzzyMatcherAvailable());
    QCOMPARE(m_store->getSetting(QStringLiteral("embedding_dimensions")).value_or(QString()),
             QStringLiteral("4"));
    QCOMPARE(m_store->documentCount().value(), static_cast<int64_t>(0));
}

void TestSQLiteStore::testInsertAssignsIdsAndReadsBack()
{
    sift::Document doc = makeDocument(QStringLiteral("Cats"));
    auto chunks = makeChunks({QStringLiteral("cats purr"), QStringLiteral("cats sleep")}, true);

    auto inserted = m_store->insertDocument(doc, chunks);
    QVERIFY(inserted.ok());
    QCOMPARE(static_cast<int>(inserted.value().size()), 2);
    QVERIFY(!doc.id.isEmpty());
    QVERIFY(doc.createdAt.isValid());
    QCOMPARE(chunks[0].documentId, doc.id);
    QCOMPARE(chunks[1].id, sift::computeChunkId(doc.id, 1));

    auto fetched = m_store->getDocument(doc.id);
    QVERIFY(fetched.ok());
    QVERIFY(fetched.value().has_value());
    QCOMPARE(fetched.value()->title, QStringLiteral("Cats"));
    QCOMPARE(fetched.value()->metadata.value(sift::MetadataKeys::FilePath).toString(),
             QStringLiteral("/docs/cats.txt"));

    auto stored = m_store->getChunksByDocument(doc.id);
    QVERIFY(stored.ok());
    QCOMPARE(static_cast<int>(stored.value().size()), 2);
    QCOMPARE(stored.value()[1].content, QStringLiteral("cats sleep"));
    QVERIFY(stored.value()[1].embedding.has_value());
    QCOMPARE(stored.value()[1].embedding->at(1), 1.0f);
    QCOMPARE(m_store->embeddedChunkCount().value(), static_cast<int64_t>(2));

    auto missing = m_store->getDocument(QStringLiteral("nope"));
    QVERIFY(missing.ok());
    QVERIFY(!missing.value().has_value());
}

void TestSQLiteStore::testNonContiguousIndicesRejected()
{
    sift::Document doc = makeDocument(QStringLiteral("Gappy"));
    auto chunks = makeChunks({QStringLiteral("a"), QStringLiteral("b")}, false);
    chunks[1].chunkIndex = 2;

    auto inserted = m_store->insertDocument(doc, chunks);
    QVERIFY(!inserted.ok());
    QCOMPARE(inserted.error().kind, sift::ErrorKind::Validation);
    QCOMPARE(m_store->documentCount().value(), static_cast<int64_t>(0));
}

void TestSQLiteStore::testWrongEmbeddingDimensionRejected()
{
    sift::Document doc = makeDocument(QStringLiteral("Wide"));
    auto chunks = makeChunks({QStringLiteral("a"), QStringLiteral("b")}, true);
    chunks[1].embedding = sift::Embedding(kDims + 3, 0.5f);

    auto inserted = m_store->insertDocument(doc, chunks);
    QVERIFY(!inserted.ok());
    QCOMPARE(inserted.error().kind, sift::ErrorKind::DataIntegrity);
    QCOMPARE(m_store->documentCount().value(), static_cast<int64_t>(0));
    QCOMPARE(m_store->chunkCount().value(), static_cast<int64_t>(0));
}

void TestSQLiteStore::testInvalidMetadataRejected()
{
    sift::Document doc = makeDocument(QStringLiteral("Nested"));
    doc.metadata.insert(QStringLiteral("extra"), QJsonObject{{QStringLiteral("k"), 1}});
    auto chunks = makeChunks({QStringLiteral("a")}, false);

    auto inserted = m_store->insertDocument(doc, chunks);
    QVERIFY(!inserted.ok());
    QCOMPARE(inserted.error().kind, sift::ErrorKind::Validation);
}

void TestSQLiteStore::testFailedChunkWriteLeavesNothing()
{
    // Abort the second chunk insert from inside SQLite.
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_store->rawDb(),
        "CREATE TRIGGER fail_second_chunk BEFORE INSERT ON chunks "
        "WHEN NEW.chunk_index = 1 BEGIN SELECT RAISE(ABORT, 'forced failure'); END;",
        nullptr, nullptr, &errMsg);
    sqlite3_free(errMsg);
    QCOMPARE(rc, SQLITE_OK);

    sift::Document doc = makeDocument(QStringLiteral("Half"));
    auto chunks = makeChunks({QStringLiteral("first"), QStringLiteral("second")}, true);
    auto inserted = m_store->insertDocument(doc, chunks);
    QVERIFY(!inserted.ok());
    QCOMPARE(inserted.error().kind, sift::ErrorKind::Storage);

    QCOMPARE(m_store->documentCount().value(), static_cast<int64_t>(0));
    QCOMPARE(m_store->chunkCount().value(), static_cast<int64_t>(0));
    QVERIFY(chunks[0].id.isEmpty());

    // The connection is usable again once the trigger is gone.
    QCOMPARE(sqlite3_exec(m_store->rawDb(), "DROP TRIGGER fail_second_chunk",
                          nullptr, nullptr, nullptr),
             SQLITE_OK);
    sift::Document retry = makeDocument(QStringLiteral("Whole"));
    auto retryChunks = makeChunks({QStringLiteral("first"), QStringLiteral("second")}, true);
    QVERIFY(m_store->insertDocument(retry, retryChunks).ok());
    QCOMPARE(m_store->chunkCount().value(), static_cast<int64_t>(2));
}

void TestSQLiteStore::testDeleteCascadesToChunks()
{
    sift::Document keep = makeDocument(QStringLiteral("Keep"));
    auto keepChunks = makeChunks({QStringLiteral("stays")}, true);
    QVERIFY(m_store->insertDocument(keep, keepChunks).ok());

    sift::Document drop = makeDocument(QStringLiteral("Drop"));
    auto dropChunks = makeChunks({QStringLiteral("goes"), QStringLiteral("also goes")}, true);
    auto dropRows = m_store->insertDocument(drop, dropChunks);
    QVERIFY(dropRows.ok());

    std::vector<int64_t> removed;
    QVERIFY(m_store->deleteDocument(drop.id, &removed).ok());
    std::sort(removed.begin(), removed.end());
    QVERIFY(removed == dropRows.value());

    QCOMPARE(m_store->documentCount().value(), static_cast<int64_t>(1));
    QCOMPARE(m_store->chunkCount().value(), static_cast<int64_t>(1));
    QVERIFY(m_store->getChunksByDocument(drop.id).value().empty());
}

void TestSQLiteStore::testDeleteUnknownDocument()
{
    const sift::Status status = m_store->deleteDocument(QStringLiteral("missing"));
    QVERIFY(!status.ok());
    QCOMPARE(status.error().kind, sift::ErrorKind::Validation);
}

void TestSQLiteStore::testDeleteAll()
{
    for (const QString& title : {QStringLiteral("One"), QStringLiteral("Two")}) {
        sift::Document doc = makeDocument(title);
        auto chunks = makeChunks({title}, false);
        QVERIFY(m_store->insertDocument(doc, chunks).ok());
    }
    QCOMPARE(m_store->listDocuments().value().size(), static_cast<size_t>(2));

    QVERIFY(m_store->deleteAll().ok());
    QCOMPARE(m_store->documentCount().value(), static_cast<int64_t>(0));
    QCOMPARE(m_store->chunkCount().value(), static_cast<int64_t>(0));
}

void TestSQLiteStore::testUpdateDocumentMetadataMerges()
{
    sift::Document doc = makeDocument(QStringLiteral("Meta"));
    auto chunks = makeChunks({QStringLiteral("x")}, false);
    QVERIFY(m_store->insertDocument(doc, chunks).ok());

    sift::Metadata extra;
    extra.insert(QStringLiteral("reviewed"), true);
    QVERIFY(m_store->updateDocumentMetadata(doc.id, extra).ok());

    const auto fetched = m_store->getDocument(doc.id).value();
    QVERIFY(fetched.has_value());
    QVERIFY(fetched->metadata.value(QStringLiteral("reviewed")).toBool());
    QCOMPARE(fetched->metadata.value(sift::MetadataKeys::FilePath).toString(),
             QStringLiteral("/docs/meta.txt"));

    const sift::Status missing = m_store->updateDocumentMetadata(QStringLiteral("nope"), extra);
    QVERIFY(!missing.ok());
    QCOMPARE(missing.error().kind, sift::ErrorKind::Validation);
}

void TestSQLiteStore::testForEachEmbeddingAndHydrate()
{
    sift::Document doc = makeDocument(QStringLiteral("Mixed"));
    auto chunks = makeChunks({QStringLiteral("one"), QStringLiteral("two"),
                              QStringLiteral("three")}, true);
    chunks[1].embedding.reset();
    auto rows = m_store->insertDocument(doc, chunks);
    QVERIFY(rows.ok());

    std::vector<int64_t> visited;
    QVERIFY(m_store->forEachEmbedding([&visited](int64_t rowId, const sift::Embedding& embedding) {
        QCOMPARE(static_cast<int>(embedding.size()), kDims);
        visited.push_back(rowId);
    }).ok());
    QCOMPARE(static_cast<int>(visited.size()), 2);

    auto hydrated = m_store->hydrateChunks({rows.value()[2], 999999});
    QVERIFY(hydrated.ok());
    QCOMPARE(static_cast<int>(hydrated.value().size()), 1);
    const sift::SearchResult& result = hydrated.value().at(rows.value()[2]);
    QCOMPARE(result.content, QStringLiteral("three"));
    QCOMPARE(result.documentTitle, QStringLiteral("Mixed"));
    QCOMPARE(result.documentSource, QStringLiteral("mixed.txt"));
    QCOMPARE(result.chunkId, sift::computeChunkId(doc.id, 2));
}

void TestSQLiteStore::testFuzzyKeywordSearch()
{
    sift::Document doc = makeDocument(QStringLiteral("Pets"));
    auto chunks = makeChunks({QStringLiteral("Cats are independent animals"),
                              QStringLiteral("Dogs are loyal companions"),
                              QStringLiteral("Cats and dogs can live together")},
                             false);
    QVERIFY(m_store->insertDocument(doc, chunks).ok());

    auto results = m_store->fuzzyKeywordSearch({QStringLiteral("cats"), QStringLiteral("dogs")},
                                               0.3, 10);
    QVERIFY(results.ok());
    QCOMPARE(static_cast<int>(results.value().size()), 3);
    QCOMPARE(results.value()[0].content, QStringLiteral("Cats and dogs can live together"));
    QCOMPARE(results.value()[0].similarity, 1.0);
    QCOMPARE(results.value()[1].similarity, 0.5);

    auto limited = m_store->fuzzyKeywordSearch({QStringLiteral("cats")}, 0.3, 1);
    QVERIFY(limited.ok());
    QCOMPARE(static_cast<int>(limited.value().size()), 1);

    auto none = m_store->fuzzyKeywordSearch({QStringLiteral("giraffe")}, 0.3, 10);
    QVERIFY(none.ok());
    QVERIFY(none.value().empty());
}

void TestSQLiteStore::testSubstringKeywordSearch()
{
    sift::Document doc = makeDocument(QStringLiteral("Pets"));
    auto chunks = makeChunks({QStringLiteral("Cats are independent"),
                              QStringLiteral("Dogs bark"),
                              QStringLiteral("100% fish")},
                             false);
    QVERIFY(m_store->insertDocument(doc, chunks).ok());

    auto results = m_store->substringKeywordSearch({QStringLiteral("cats"), QStringLiteral("bark")},
                                                   10, 0.5);
    QVERIFY(results.ok());
    QCOMPARE(static_cast<int>(results.value().size()), 2);
    QCOMPARE(results.value()[0].content, QStringLiteral("Cats are independent"));
    QCOMPARE(results.value()[1].content, QStringLiteral("Dogs bark"));
    for (const sift::SearchResult& result : results.value()) {
        QCOMPARE(result.similarity, 0.5);
    }

    // LIKE wildcards in keywords are matched literally.
    auto literal = m_store->substringKeywordSearch({QStringLiteral("0%")}, 10, 0.5);
    QVERIFY(literal.ok());
    QCOMPARE(static_cast<int>(literal.value().size()), 1);
    auto wildcard = m_store->substringKeywordSearch({QStringLiteral("d_g")}, 10, 0.5);
    QVERIFY(wildcard.ok());
    QVERIFY(wildcard.value().empty());

    // Only the first three keywords take part.
    auto capped = m_store->substringKeywordSearch(
        {QStringLiteral("zzz"), QStringLiteral("yyy"), QStringLiteral("xxx"), QStringLiteral("fish")},
        10, 0.5);
    QVERIFY(capped.ok());
    QVERIFY(capped.value().empty());
}

void TestSQLiteStore::testReopenWithDifferentDimensionFails()
{
    const QString path = m_tempDir->filePath(QStringLiteral("corpus.db"));
    m_store.reset();

    QString error;
    auto wrong = sift::SQLiteStore::open(path, kDims * 2, &error);
    QVERIFY(!wrong);
    QVERIFY(error.contains(QStringLiteral("dimension")));

    auto same = sift::SQLiteStore::open(path, kDims, &error);
    QVERIFY(same);
    m_store = std::move(same);
}

QTEST_MAIN(TestSQLiteStore)
#include "test_sqlite_store.moc"
