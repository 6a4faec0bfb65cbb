#pragma once

#include "core/shared/chunk.h"
#include "core/shared/result.h"
#include "core/shared/search_result.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace sift {

// SQLiteStore: owner of the corpus database.
// Documents, their chunks and chunk embeddings live here; the ANN index is
// rebuilt from the stored embeddings.
//
// CRITICAL INVARIANT:
//   A document and all of its chunks become visible together or not at all.
//   insertDocument() runs in one SAVEPOINT and holds the writer lock for its
//   duration, so readers never observe a partially written document.
class SQLiteStore {
public:
    ~SQLiteStore();

    SQLiteStore(const SQLiteStore&) = delete;
    SQLiteStore& operator=(const SQLiteStore&) = delete;

    // Open or create the database at the given path.
    // Creates schema and sets pragmas on first open. The embedding dimension
    // is recorded on first open and must match on every later one.
    static std::unique_ptr<SQLiteStore> open(const QString& dbPath,
                                             int embeddingDimensions,
                                             QString* errorOut = nullptr);

    // ── Documents + chunks (atomic) ─────────────────────────

    // Insert a document with all its chunks in one transaction.
    // Assigns document id (when empty), timestamps, chunk ids and
    // chunk.documentId. Returns the chunk row ids in chunk order.
    // Validates before writing: contiguous chunk indices, metadata types and
    // embedding dimensions (DataIntegrity on mismatch, nothing written).
    Result<std::vector<int64_t>> insertDocument(Document& document, std::vector<Chunk>& chunks);

    Result<std::optional<Document>> getDocument(const QString& documentId);
    Result<std::vector<Document>> listDocuments(int limit = 100, int offset = 0);

    // Merge keys into a document's metadata and bump updated_at.
    Status updateDocumentMetadata(const QString& documentId, const Metadata& metadata);

    // Delete a document; chunks cascade. Row ids of the removed chunks are
    // appended to removedChunkRowIds when given. Unknown id → Validation.
    Status deleteDocument(const QString& documentId,
                          std::vector<int64_t>* removedChunkRowIds = nullptr);

    // Delete ALL documents and chunks (corpus reset).
    Status deleteAll();

    Result<std::vector<Chunk>> getChunksByDocument(const QString& documentId);

    // ── Counts ──────────────────────────────────────────────

    Result<int64_t> documentCount();
    Result<int64_t> chunkCount();
    Result<int64_t> embeddedChunkCount();

    // ── Retrieval queries ───────────────────────────────────

    using EmbeddingVisitor = std::function<void(int64_t rowId, const Embedding& embedding)>;

    // Visit every stored embedding. Rows with a malformed blob are skipped
    // and logged.
    Status forEachEmbedding(const EmbeddingVisitor& visitor);

    // Load SearchResults (similarity 0) for chunk row ids. Missing ids are
    // absent from the map.
    Result<std::unordered_map<int64_t, SearchResult>> hydrateChunks(
        const std::vector<int64_t>& rowIds);

    // Graded keyword query using sift_keyword_score(); Unavailable when the
    // scoring function could not be registered on this connection.
    Result<std::vector<SearchResult>> fuzzyKeywordSearch(const QStringList& keywords,
                                                         double threshold,
                                                         int limit);

    // Case-insensitive containment of any keyword; every hit gets flatScore.
    Result<std::vector<SearchResult>> substringKeywordSearch(const QStringList& keywords,
                                                             int limit,
                                                             double flatScore);

    bool fuzzyMatcherAvailable() const { return m_fuzzyAvailable; }
    int embeddingDimensions() const { return m_embeddingDimensions; }

    // ── Settings ────────────────────────────────────────────

    std::optional<QString> getSetting(const QString& key);
    bool setSetting(const QString& key, const QString& value);

    // Returns true if database passes PRAGMA integrity_check
    bool integrityCheck() const;

    // Raw handle for tests
    sqlite3* rawDb() const { return m_db; }

private:
    SQLiteStore() = default;
    bool init(const QString& dbPath, int embeddingDimensions, QString* errorOut);
    bool execSql(const char* sql);
    Error storageError(const char* where) const;
    Status validateChunks(const std::vector<Chunk>& chunks) const;
    Result<std::vector<SearchResult>> collectResults(sqlite3_stmt* stmt, const char* where);

    sqlite3* m_db = nullptr;
    int m_embeddingDimensions = 0;
    bool m_fuzzyAvailable = false;

    // Exclusive for multi-statement writes, shared for reads.
    mutable std::shared_mutex m_lock;
};

} // namespace sift
