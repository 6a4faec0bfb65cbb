#pragma once

#include "core/extraction/extractor.h"
#include "core/indexing/chunker.h"
#include "core/shared/result.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace sift {

class Embedder;
class SQLiteStore;
class VectorIndex;

struct IngestedDocument {
    QString documentId;
    QString title;
    QString source;
    int chunks = 0;
    int embeddedChunks = 0;
    int durationMs = 0;   // Extract through index insert
};

struct IngestionItemError {
    QString source;
    Error error;
};

// Summary of one ingestion run. Failures are per file and never abort
// the run.
struct IngestionReport {
    int processed = 0;
    int succeeded = 0;
    int failed = 0;
    int chunksCreated = 0;
    int chunksEmbedded = 0;
    bool stopped = false;
    int durationMs = 0;
    std::vector<IngestedDocument> documents;
    std::vector<IngestionItemError> errors;

    QStringList errorMessages() const;
};

// IngestionPipeline: extract -> chunk -> embed -> write, one file at a time.
//
// Each document is written together with all of its chunks in one store
// transaction; vectors go into the VectorIndex only after that commit, so a
// failed write leaves neither rows nor vectors behind.
class IngestionPipeline {
public:
    // (fileIndex, totalFiles, path), fired before each file.
    using ProgressCallback = std::function<void(int, int, const QString&)>;

    IngestionPipeline(SQLiteStore* store, VectorIndex* index, Embedder* embedder,
                      const ChunkerConfig& chunkerConfig = {});
    ~IngestionPipeline();

    IngestionPipeline(const IngestionPipeline&) = delete;
    IngestionPipeline& operator=(const IngestionPipeline&) = delete;
    IngestionPipeline(IngestionPipeline&&) = delete;
    IngestionPipeline& operator=(IngestionPipeline&&) = delete;

    // Extractors are consulted in registration order. PlainTextExtractor is
    // registered by the constructor.
    void addExtractor(std::unique_ptr<FileExtractor> extractor);

    // Ingest every document file under folder (recursive, sorted by path).
    // cleanBefore deletes the whole corpus first.
    IngestionReport run(const QString& folder, bool cleanBefore = true);

    // Single-file upload. source is the path relative to root, or the file
    // name when root is empty.
    Result<IngestedDocument> ingestFile(const QString& filePath, const QString& root = QString());

    // Cancels a running run() between documents. A document already being
    // written is finished first.
    void requestStop() { m_stopRequested.store(true); }

    void setProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }

    // Files whose extension is a known document format, recursively,
    // sorted. Formats without an extractor are still listed so that they
    // show up as failures in the report.
    static QStringList findDocumentFiles(const QString& folder);

    // First "# " heading within the first 10 lines, else the file stem.
    static QString detectTitle(const QString& content, const QString& filePath);

private:
    FileExtractor* extractorFor(const QString& extension) const;

    SQLiteStore* m_store = nullptr;
    VectorIndex* m_index = nullptr;
    Embedder* m_embedder = nullptr;
    Chunker m_chunker;
    std::vector<std::unique_ptr<FileExtractor>> m_extractors;
    ProgressCallback m_progress;
    std::atomic<bool> m_stopRequested{false};
};

} // namespace sift
