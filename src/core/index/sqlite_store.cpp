#include "core/index/sqlite_store.h"
#include "core/index/schema.h"
#include "core/index/trigram_similarity.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>
#include <QJsonDocument>

#include <algorithm>
#include <cstring>
#include <mutex>

namespace sift {

namespace {

constexpr int kMaxSubstringKeywords = 3;
constexpr size_t kHydrateBatch = 500;

// Finalizes the statement on scope exit.
struct StatementGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StatementGuard() { sqlite3_finalize(stmt); }
};

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), static_cast<int>(utf8.size()),
                      SQLITE_TRANSIENT);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

QString metadataToText(const Metadata& metadata)
{
    return QString::fromUtf8(QJsonDocument(metadata).toJson(QJsonDocument::Compact));
}

Metadata metadataFromText(const QString& text)
{
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8());
    return doc.isObject() ? doc.object() : Metadata{};
}

double toEpochSeconds(const QDateTime& dt)
{
    return static_cast<double>(dt.toMSecsSinceEpoch()) / 1000.0;
}

QDateTime fromEpochSeconds(double seconds)
{
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(seconds * 1000.0), Qt::UTC);
}

std::optional<Embedding> decodeEmbedding(sqlite3_stmt* stmt, int blobColumn, int dims)
{
    if (sqlite3_column_type(stmt, blobColumn) == SQLITE_NULL) {
        return std::nullopt;
    }
    const int bytes = sqlite3_column_bytes(stmt, blobColumn);
    if (dims <= 0 || bytes != dims * static_cast<int>(sizeof(float))) {
        return std::nullopt;
    }
    Embedding embedding(static_cast<size_t>(dims));
    std::memcpy(embedding.data(), sqlite3_column_blob(stmt, blobColumn),
                static_cast<size_t>(bytes));
    return embedding;
}

QString escapeLike(const QString& keyword)
{
    QString escaped;
    escaped.reserve(keyword.size());
    for (const QChar ch : keyword) {
        if (ch == QLatin1Char('%') || ch == QLatin1Char('_') || ch == QLatin1Char('\\')) {
            escaped.append(QLatin1Char('\\'));
        }
        escaped.append(ch);
    }
    return escaped;
}

// SELECT list shared by every query that yields SearchResults.
constexpr const char* kResultColumns =
    "c.id, c.chunk_id, c.document_id, c.content, c.metadata, d.title, d.source";

SearchResult readResultRow(sqlite3_stmt* stmt)
{
    SearchResult result;
    result.chunkId = columnText(stmt, 1);
    result.documentId = columnText(stmt, 2);
    result.content = columnText(stmt, 3);
    result.metadata = metadataFromText(columnText(stmt, 4));
    result.documentTitle = columnText(stmt, 5);
    result.documentSource = columnText(stmt, 6);
    return result;
}

Document readDocumentRow(sqlite3_stmt* stmt)
{
    Document doc;
    doc.id = columnText(stmt, 0);
    doc.title = columnText(stmt, 1);
    doc.source = columnText(stmt, 2);
    doc.fullText = columnText(stmt, 3);
    doc.metadata = metadataFromText(columnText(stmt, 4));
    doc.createdAt = fromEpochSeconds(sqlite3_column_double(stmt, 5));
    doc.updatedAt = fromEpochSeconds(sqlite3_column_double(stmt, 6));
    return doc;
}

} // namespace

SQLiteStore::~SQLiteStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SQLiteStore> SQLiteStore::open(const QString& dbPath,
                                               int embeddingDimensions,
                                               QString* errorOut)
{
    std::unique_ptr<SQLiteStore> store(new SQLiteStore());
    if (!store->init(dbPath, embeddingDimensions, errorOut)) {
        return nullptr;
    }
    return store;
}

bool SQLiteStore::init(const QString& dbPath, int embeddingDimensions, QString* errorOut)
{
    auto fail = [&](const QString& message) {
        LOG_ERROR(siftIndex, "%s", qUtf8Printable(message));
        if (errorOut) {
            *errorOut = message;
        }
        return false;
    };

    if (embeddingDimensions <= 0) {
        return fail(QStringLiteral("Embedding dimension must be positive, got %1")
                        .arg(embeddingDimensions));
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        return fail(QStringLiteral("Failed to open database: %1")
                        .arg(QString::fromUtf8(sqlite3_errmsg(m_db))));
    }

    // Set busy_timeout FIRST via C API, before running any SQL.
    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        return fail(QStringLiteral("Failed to set connection pragmas"));
    }

    bool schemaExists = false;
    {
        StatementGuard guard;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='chunks'",
            -1, &guard.stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(guard.stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(guard.stmt, 0) > 0);
        }
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            return fail(QStringLiteral("Failed to set database pragmas"));
        }

        // Verify WAL mode is active (in-memory databases report "memory")
        {
            StatementGuard guard;
            sqlite3_prepare_v2(m_db, "PRAGMA journal_mode", -1, &guard.stmt, nullptr);
            if (sqlite3_step(guard.stmt) == SQLITE_ROW) {
                const QString mode = columnText(guard.stmt, 0);
                if (mode != QLatin1String("wal") && mode != QLatin1String("memory")) {
                    LOG_WARN(siftIndex, "Expected WAL journal mode, got: %s", qUtf8Printable(mode));
                }
            }
        }

        if (!execSql(kSchemaV1)) {
            return fail(QStringLiteral("Failed to create schema"));
        }
    }

    {
        StatementGuard guard;
        int version = 0;
        if (sqlite3_prepare_v2(m_db, "PRAGMA user_version", -1, &guard.stmt, nullptr) == SQLITE_OK
            && sqlite3_step(guard.stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(guard.stmt, 0);
        }
        if (version > kCurrentSchemaVersion) {
            return fail(QStringLiteral("Database schema version %1 is newer than supported %2")
                            .arg(version)
                            .arg(kCurrentSchemaVersion));
        }
    }

    // The embedding dimension is fixed for the lifetime of a corpus.
    const QString dimsKey = QString::fromLatin1(kEmbeddingDimensionsKey);
    const auto storedDims = getSetting(dimsKey);
    if (storedDims.has_value()) {
        if (storedDims->toInt() != embeddingDimensions) {
            return fail(QStringLiteral("Corpus was built with %1-dimensional embeddings, "
                                       "configured dimension is %2")
                            .arg(*storedDims)
                            .arg(embeddingDimensions));
        }
    } else if (!setSetting(dimsKey, QString::number(embeddingDimensions))) {
        return fail(QStringLiteral("Failed to record embedding dimension"));
    }
    m_embeddingDimensions = embeddingDimensions;

    m_fuzzyAvailable = registerKeywordScoreFunction(m_db);
    if (!m_fuzzyAvailable) {
        LOG_WARN(siftIndex, "Fuzzy keyword scoring unavailable: %s", sqlite3_errmsg(m_db));
    }

    // Restrict database file permissions to owner-only (0600)
    QFile dbFile(dbPath);
    if (dbFile.exists()) {
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }

    LOG_INFO(siftIndex, "Database opened successfully: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(siftIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

Error SQLiteStore::storageError(const char* where) const
{
    const QString message = QStringLiteral("%1: %2")
                                .arg(QString::fromUtf8(where),
                                     QString::fromUtf8(sqlite3_errmsg(m_db)));
    LOG_ERROR(siftIndex, "%s", qUtf8Printable(message));
    return makeError(ErrorKind::Storage, message);
}

// ── Documents + chunks (atomic) ─────────────────────────────

Status SQLiteStore::validateChunks(const std::vector<Chunk>& chunks) const
{
    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        if (chunk.chunkIndex != static_cast<int>(i)) {
            return makeError(ErrorKind::Validation,
                             QStringLiteral("chunk indices must be contiguous from 0; "
                                            "position %1 has index %2")
                                 .arg(static_cast<int>(i))
                                 .arg(chunk.chunkIndex));
        }
        if (chunk.embedding
            && static_cast<int>(chunk.embedding->size()) != m_embeddingDimensions) {
            return makeError(ErrorKind::DataIntegrity,
                             QStringLiteral("chunk %1 embedding has %2 dimensions, expected %3")
                                 .arg(chunk.chunkIndex)
                                 .arg(static_cast<int>(chunk.embedding->size()))
                                 .arg(m_embeddingDimensions));
        }
        Status metadataStatus = validateMetadata(chunk.metadata);
        if (!metadataStatus) {
            return metadataStatus;
        }
    }
    return Status::success();
}

Result<std::vector<int64_t>> SQLiteStore::insertDocument(Document& document,
                                                         std::vector<Chunk>& chunks)
{
    Status metadataStatus = validateMetadata(document.metadata);
    if (!metadataStatus) {
        return metadataStatus.error();
    }
    Status chunkStatus = validateChunks(chunks);
    if (!chunkStatus) {
        return chunkStatus.error();
    }

    if (document.id.isEmpty()) {
        document.id = newDocumentId();
    }
    const QDateTime now = QDateTime::currentDateTimeUtc();
    if (!document.createdAt.isValid()) {
        document.createdAt = now;
    }
    document.updatedAt = now;

    std::unique_lock<std::shared_mutex> lock(m_lock);

    // CRITICAL: document + chunks are inserted atomically.
    if (!execSql("SAVEPOINT insert_document")) {
        return storageError("insertDocument savepoint");
    }
    auto rollback = [this](const char* where) -> Error {
        Error error = storageError(where);
        execSql("ROLLBACK TO SAVEPOINT insert_document");
        execSql("RELEASE SAVEPOINT insert_document");
        return error;
    };

    {
        StatementGuard guard;
        const char* sql = R"(
            INSERT INTO documents (id, title, source, full_text, metadata, created_at, updated_at)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        )";
        if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
            return rollback("document insert prepare");
        }
        bindText(guard.stmt, 1, document.id);
        bindText(guard.stmt, 2, document.title);
        bindText(guard.stmt, 3, document.source);
        bindText(guard.stmt, 4, document.fullText);
        bindText(guard.stmt, 5, metadataToText(document.metadata));
        sqlite3_bind_double(guard.stmt, 6, toEpochSeconds(document.createdAt));
        sqlite3_bind_double(guard.stmt, 7, toEpochSeconds(document.updatedAt));
        if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
            return rollback("document insert");
        }
    }

    std::vector<int64_t> rowIds;
    rowIds.reserve(chunks.size());
    {
        StatementGuard guard;
        const char* sql = R"(
            INSERT INTO chunks (chunk_id, document_id, chunk_index, content,
                                embedding, embedding_dims, token_count, metadata)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
        )";
        if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
            return rollback("chunk insert prepare");
        }

        for (const Chunk& chunk : chunks) {
            sqlite3_reset(guard.stmt);
            sqlite3_clear_bindings(guard.stmt);

            bindText(guard.stmt, 1, computeChunkId(document.id, chunk.chunkIndex));
            bindText(guard.stmt, 2, document.id);
            sqlite3_bind_int(guard.stmt, 3, chunk.chunkIndex);
            bindText(guard.stmt, 4, chunk.content);
            if (chunk.embedding) {
                sqlite3_bind_blob(guard.stmt, 5, chunk.embedding->data(),
                                  static_cast<int>(chunk.embedding->size() * sizeof(float)),
                                  SQLITE_TRANSIENT);
                sqlite3_bind_int(guard.stmt, 6, static_cast<int>(chunk.embedding->size()));
            } else {
                sqlite3_bind_null(guard.stmt, 5);
                sqlite3_bind_null(guard.stmt, 6);
            }
            if (chunk.tokenCount) {
                sqlite3_bind_int(guard.stmt, 7, *chunk.tokenCount);
            } else {
                sqlite3_bind_null(guard.stmt, 7);
            }
            bindText(guard.stmt, 8, metadataToText(chunk.metadata));

            if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
                return rollback("chunk insert");
            }
            rowIds.push_back(sqlite3_last_insert_rowid(m_db));
        }
    }

    if (!execSql("RELEASE SAVEPOINT insert_document")) {
        return rollback("insertDocument commit");
    }

    for (Chunk& chunk : chunks) {
        chunk.documentId = document.id;
        chunk.id = computeChunkId(document.id, chunk.chunkIndex);
    }

    LOG_DEBUG(siftIndex, "Inserted document %s with %d chunks",
              qUtf8Printable(document.id), static_cast<int>(chunks.size()));
    return rowIds;
}

Result<std::optional<Document>> SQLiteStore::getDocument(const QString& documentId)
{
    std::shared_lock<std::shared_mutex> lock(m_lock);

    StatementGuard guard;
    const char* sql = R"(
        SELECT id, title, source, full_text, metadata, created_at, updated_at
        FROM documents WHERE id = ?1
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("getDocument prepare");
    }
    bindText(guard.stmt, 1, documentId);

    const int rc = sqlite3_step(guard.stmt);
    if (rc == SQLITE_ROW) {
        return std::optional<Document>(readDocumentRow(guard.stmt));
    }
    if (rc != SQLITE_DONE) {
        return storageError("getDocument");
    }
    return std::optional<Document>();
}

Result<std::vector<Document>> SQLiteStore::listDocuments(int limit, int offset)
{
    std::shared_lock<std::shared_mutex> lock(m_lock);

    StatementGuard guard;
    const char* sql = R"(
        SELECT id, title, source, full_text, metadata, created_at, updated_at
        FROM documents ORDER BY created_at DESC, id ASC LIMIT ?1 OFFSET ?2
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("listDocuments prepare");
    }
    sqlite3_bind_int(guard.stmt, 1, std::max(0, limit));
    sqlite3_bind_int(guard.stmt, 2, std::max(0, offset));

    std::vector<Document> documents;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        documents.push_back(readDocumentRow(guard.stmt));
    }
    if (rc != SQLITE_DONE) {
        return storageError("listDocuments");
    }
    return documents;
}

Status SQLiteStore::updateDocumentMetadata(const QString& documentId, const Metadata& metadata)
{
    Status metadataStatus = validateMetadata(metadata);
    if (!metadataStatus) {
        return metadataStatus;
    }

    auto existing = getDocument(documentId);
    if (!existing) {
        return existing.error();
    }
    if (!existing.value().has_value()) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("document not found: %1").arg(documentId));
    }

    Metadata merged = existing.value()->metadata;
    for (auto it = metadata.begin(); it != metadata.end(); ++it) {
        merged.insert(it.key(), it.value());
    }

    std::unique_lock<std::shared_mutex> lock(m_lock);
    StatementGuard guard;
    const char* sql = "UPDATE documents SET metadata = ?1, updated_at = ?2 WHERE id = ?3";
    if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("updateDocumentMetadata prepare");
    }
    bindText(guard.stmt, 1, metadataToText(merged));
    sqlite3_bind_double(guard.stmt, 2, toEpochSeconds(QDateTime::currentDateTimeUtc()));
    bindText(guard.stmt, 3, documentId);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        return storageError("updateDocumentMetadata");
    }
    return Status::success();
}

Status SQLiteStore::deleteDocument(const QString& documentId,
                                   std::vector<int64_t>* removedChunkRowIds)
{
    std::unique_lock<std::shared_mutex> lock(m_lock);

    std::vector<int64_t> rowIds;
    {
        StatementGuard guard;
        if (sqlite3_prepare_v2(m_db, "SELECT id FROM chunks WHERE document_id = ?1",
                               -1, &guard.stmt, nullptr) != SQLITE_OK) {
            return storageError("deleteDocument prepare");
        }
        bindText(guard.stmt, 1, documentId);
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
            rowIds.push_back(sqlite3_column_int64(guard.stmt, 0));
        }
        if (rc != SQLITE_DONE) {
            return storageError("deleteDocument chunk scan");
        }
    }

    // Delete document (cascades to chunks)
    StatementGuard guard;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM documents WHERE id = ?1",
                           -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("deleteDocument prepare");
    }
    bindText(guard.stmt, 1, documentId);
    if (sqlite3_step(guard.stmt) != SQLITE_DONE) {
        return storageError("deleteDocument");
    }
    if (sqlite3_changes(m_db) == 0) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("document not found: %1").arg(documentId));
    }

    if (removedChunkRowIds) {
        removedChunkRowIds->insert(removedChunkRowIds->end(), rowIds.begin(), rowIds.end());
    }
    LOG_INFO(siftIndex, "Deleted document %s (%d chunks)",
             qUtf8Printable(documentId), static_cast<int>(rowIds.size()));
    return Status::success();
}

Status SQLiteStore::deleteAll()
{
    std::unique_lock<std::shared_mutex> lock(m_lock);

    // Delete documents; cascades to chunks
    if (!execSql("DELETE FROM documents")) {
        return storageError("deleteAll");
    }
    LOG_INFO(siftIndex, "deleteAll: corpus cleared");
    return Status::success();
}

Result<std::vector<Chunk>> SQLiteStore::getChunksByDocument(const QString& documentId)
{
    std::shared_lock<std::shared_mutex> lock(m_lock);

    StatementGuard guard;
    const char* sql = R"(
        SELECT chunk_id, document_id, chunk_index, content, embedding,
               token_count, metadata
        FROM chunks WHERE document_id = ?1 ORDER BY chunk_index ASC
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("getChunksByDocument prepare");
    }
    bindText(guard.stmt, 1, documentId);

    std::vector<Chunk> chunks;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        Chunk chunk;
        chunk.id = columnText(guard.stmt, 0);
        chunk.documentId = columnText(guard.stmt, 1);
        chunk.chunkIndex = sqlite3_column_int(guard.stmt, 2);
        chunk.content = columnText(guard.stmt, 3);
        chunk.embedding = decodeEmbedding(guard.stmt, 4, m_embeddingDimensions);
        if (sqlite3_column_type(guard.stmt, 5) != SQLITE_NULL) {
            chunk.tokenCount = sqlite3_column_int(guard.stmt, 5);
        }
        chunk.metadata = metadataFromText(columnText(guard.stmt, 6));
        chunks.push_back(std::move(chunk));
    }
    if (rc != SQLITE_DONE) {
        return storageError("getChunksByDocument");
    }
    return chunks;
}

// ── Counts ──────────────────────────────────────────────────

namespace {

Result<int64_t> countRows(sqlite3* db, const char* sql)
{
    StatementGuard guard;
    if (sqlite3_prepare_v2(db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK
        || sqlite3_step(guard.stmt) != SQLITE_ROW) {
        return makeError(ErrorKind::Storage,
                         QStringLiteral("count query failed: %1")
                             .arg(QString::fromUtf8(sqlite3_errmsg(db))));
    }
    return static_cast<int64_t>(sqlite3_column_int64(guard.stmt, 0));
}

} // namespace

Result<int64_t> SQLiteStore::documentCount()
{
    std::shared_lock<std::shared_mutex> lock(m_lock);
    return countRows(m_db, "SELECT COUNT(*) FROM documents");
}

Result<int64_t> SQLiteStore::chunkCount()
{
    std::shared_lock<std::shared_mutex> lock(m_lock);
    return countRows(m_db, "SELECT COUNT(*) FROM chunks");
}

Result<int64_t> SQLiteStore::embeddedChunkCount()
{
    std::shared_lock<std::shared_mutex> lock(m_lock);
    return countRows(m_db, "SELECT COUNT(*) FROM chunks WHERE embedding IS NOT NULL");
}

// ── Retrieval queries ───────────────────────────────────────

Status SQLiteStore::forEachEmbedding(const EmbeddingVisitor& visitor)
{
    std::shared_lock<std::shared_mutex> lock(m_lock);

    StatementGuard guard;
    const char* sql = "SELECT id, embedding FROM chunks WHERE embedding IS NOT NULL ORDER BY id";
    if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("forEachEmbedding prepare");
    }

    int skipped = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        const int64_t rowId = sqlite3_column_int64(guard.stmt, 0);
        auto embedding = decodeEmbedding(guard.stmt, 1, m_embeddingDimensions);
        if (!embedding) {
            ++skipped;
            continue;
        }
        visitor(rowId, *embedding);
    }
    if (rc != SQLITE_DONE) {
        return storageError("forEachEmbedding");
    }
    if (skipped > 0) {
        LOG_WARN(siftIndex, "Skipped %d chunks with malformed embeddings", skipped);
    }
    return Status::success();
}

Result<std::unordered_map<int64_t, SearchResult>> SQLiteStore::hydrateChunks(
    const std::vector<int64_t>& rowIds)
{
    std::unordered_map<int64_t, SearchResult> hydrated;
    if (rowIds.empty()) {
        return hydrated;
    }

    std::shared_lock<std::shared_mutex> lock(m_lock);

    for (size_t begin = 0; begin < rowIds.size(); begin += kHydrateBatch) {
        const size_t end = std::min(rowIds.size(), begin + kHydrateBatch);

        QStringList placeholders;
        for (size_t i = begin; i < end; ++i) {
            placeholders.append(QStringLiteral("?"));
        }
        const QByteArray sql = QStringLiteral(
            "SELECT %1 FROM chunks c JOIN documents d ON d.id = c.document_id "
            "WHERE c.id IN (%2)")
                                   .arg(QString::fromLatin1(kResultColumns),
                                        placeholders.join(QLatin1Char(',')))
                                   .toUtf8();

        StatementGuard guard;
        if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
            return storageError("hydrateChunks prepare");
        }
        for (size_t i = begin; i < end; ++i) {
            sqlite3_bind_int64(guard.stmt, static_cast<int>(i - begin + 1), rowIds[i]);
        }

        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
            hydrated.emplace(sqlite3_column_int64(guard.stmt, 0), readResultRow(guard.stmt));
        }
        if (rc != SQLITE_DONE) {
            return storageError("hydrateChunks");
        }
    }
    return hydrated;
}

Result<std::vector<SearchResult>> SQLiteStore::collectResults(sqlite3_stmt* stmt, const char* where)
{
    std::vector<SearchResult> results;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SearchResult result = readResultRow(stmt);
        result.similarity = sqlite3_column_double(stmt, 7);
        results.push_back(std::move(result));
    }
    if (rc != SQLITE_DONE) {
        return storageError(where);
    }
    return results;
}

Result<std::vector<SearchResult>> SQLiteStore::fuzzyKeywordSearch(const QStringList& keywords,
                                                                  double threshold,
                                                                  int limit)
{
    if (!m_fuzzyAvailable) {
        return makeError(ErrorKind::Unavailable,
                         QStringLiteral("sift_keyword_score is not registered"));
    }
    if (keywords.isEmpty() || limit <= 0) {
        return std::vector<SearchResult>{};
    }

    std::shared_lock<std::shared_mutex> lock(m_lock);

    const QByteArray sql = QStringLiteral(
        "SELECT * FROM ("
        " SELECT %1, sift_keyword_score(?1, c.content) AS score"
        " FROM chunks c JOIN documents d ON d.id = c.document_id"
        ") WHERE score >= ?2 ORDER BY score DESC, id ASC LIMIT ?3")
                               .arg(QString::fromLatin1(kResultColumns))
                               .toUtf8();

    StatementGuard guard;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("fuzzyKeywordSearch prepare");
    }
    bindText(guard.stmt, 1, keywords.join(QLatin1Char(' ')));
    sqlite3_bind_double(guard.stmt, 2, threshold);
    sqlite3_bind_int(guard.stmt, 3, limit);

    return collectResults(guard.stmt, "fuzzyKeywordSearch");
}

Result<std::vector<SearchResult>> SQLiteStore::substringKeywordSearch(const QStringList& keywords,
                                                                      int limit,
                                                                      double flatScore)
{
    if (keywords.isEmpty() || limit <= 0) {
        return std::vector<SearchResult>{};
    }

    const QStringList used = keywords.mid(0, kMaxSubstringKeywords);
    QStringList conditions;
    for (int i = 0; i < used.size(); ++i) {
        conditions.append(QStringLiteral("c.content LIKE ?%1 ESCAPE '\\'").arg(i + 2));
    }

    std::shared_lock<std::shared_mutex> lock(m_lock);

    const QByteArray sql = QStringLiteral(
        "SELECT %1, ?1 AS score FROM chunks c JOIN documents d ON d.id = c.document_id "
        "WHERE %2 ORDER BY c.id ASC LIMIT ?%3")
                               .arg(QString::fromLatin1(kResultColumns),
                                    conditions.join(QStringLiteral(" OR ")),
                                    QString::number(used.size() + 2))
                               .toUtf8();

    StatementGuard guard;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return storageError("substringKeywordSearch prepare");
    }
    sqlite3_bind_double(guard.stmt, 1, flatScore);
    for (int i = 0; i < used.size(); ++i) {
        bindText(guard.stmt, i + 2,
                 QLatin1Char('%') + escapeLike(used.at(i)) + QLatin1Char('%'));
    }
    sqlite3_bind_int(guard.stmt, used.size() + 2, limit);

    return collectResults(guard.stmt, "substringKeywordSearch");
}

// ── Settings ────────────────────────────────────────────────

std::optional<QString> SQLiteStore::getSetting(const QString& key)
{
    StatementGuard guard;
    const char* sql = "SELECT value FROM settings WHERE key = ?1";
    if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    bindText(guard.stmt, 1, key);

    std::optional<QString> result;
    if (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        result = columnText(guard.stmt, 0);
    }
    return result;
}

bool SQLiteStore::setSetting(const QString& key, const QString& value)
{
    StatementGuard guard;
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    if (sqlite3_prepare_v2(m_db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    bindText(guard.stmt, 1, key);
    bindText(guard.stmt, 2, value);
    return sqlite3_step(guard.stmt) == SQLITE_DONE;
}

bool SQLiteStore::integrityCheck() const
{
    if (!m_db) return false;

    StatementGuard guard;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA integrity_check;", -1, &guard.stmt, nullptr);
    if (rc != SQLITE_OK) return false;

    bool ok = false;
    if (sqlite3_step(guard.stmt) == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(guard.stmt, 0));
        ok = (result && strcmp(result, "ok") == 0);
    }
    return ok;
}

} // namespace sift
