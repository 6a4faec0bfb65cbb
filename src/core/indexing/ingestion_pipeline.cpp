#include "core/indexing/ingestion_pipeline.h"

#include "core/embedding/embedder.h"
#include "core/extraction/text_extractor.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QSet>

#include <algorithm>

namespace sift {

namespace {

constexpr int kTitleSearchLines = 10;

const QSet<QString>& documentExtensions()
{
    static const QSet<QString> exts = {
        QStringLiteral("md"), QStringLiteral("markdown"), QStringLiteral("txt"),
        QStringLiteral("text"), QStringLiteral("rst"),
        QStringLiteral("pdf"),
        QStringLiteral("docx"), QStringLiteral("doc"),
        QStringLiteral("pptx"), QStringLiteral("ppt"),
        QStringLiteral("xlsx"), QStringLiteral("xls"),
        QStringLiteral("html"), QStringLiteral("htm"),
        QStringLiteral("mp3"), QStringLiteral("wav"), QStringLiteral("m4a"), QStringLiteral("flac"),
    };
    return exts;
}

} // namespace

QStringList IngestionReport::errorMessages() const
{
    QStringList messages;
    for (const IngestionItemError& item : errors) {
        messages.append(QStringLiteral("%1: %2").arg(item.source, item.error.message));
    }
    return messages;
}

IngestionPipeline::IngestionPipeline(SQLiteStore* store, VectorIndex* index, Embedder* embedder,
                                     const ChunkerConfig& chunkerConfig)
    : m_store(store)
    , m_index(index)
    , m_embedder(embedder)
    , m_chunker(chunkerConfig)
{
    m_extractors.push_back(std::make_unique<PlainTextExtractor>());
}

IngestionPipeline::~IngestionPipeline() = default;

void IngestionPipeline::addExtractor(std::unique_ptr<FileExtractor> extractor)
{
    if (extractor) {
        m_extractors.push_back(std::move(extractor));
    }
}

FileExtractor* IngestionPipeline::extractorFor(const QString& extension) const
{
    for (const auto& extractor : m_extractors) {
        if (extractor->supports(extension)) {
            return extractor.get();
        }
    }
    return nullptr;
}

QStringList IngestionPipeline::findDocumentFiles(const QString& folder)
{
    QStringList files;
    QDirIterator it(folder, QDir::Files | QDir::Readable, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (documentExtensions().contains(QFileInfo(path).suffix().toLower())) {
            files.append(path);
        }
    }
    files.sort();
    return files;
}

QString IngestionPipeline::detectTitle(const QString& content, const QString& filePath)
{
    const QStringList lines = content.split(QLatin1Char('\n'));
    const int limit = std::min<int>(kTitleSearchLines, static_cast<int>(lines.size()));
    for (int i = 0; i < limit; ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.startsWith(QLatin1String("# "))) {
            const QString title = line.mid(2).trimmed();
            if (!title.isEmpty()) {
                return title;
            }
        }
    }
    return QFileInfo(filePath).completeBaseName();
}

Result<IngestedDocument> IngestionPipeline::ingestFile(const QString& filePath, const QString& root)
{
    if (!m_store || !m_embedder) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("ingestion pipeline not wired"));
    }

    QElapsedTimer timer;
    timer.start();

    const QFileInfo info(filePath);
    FileExtractor* extractor = extractorFor(info.suffix().toLower());
    if (!extractor) {
        return makeError(ErrorKind::PartialItem,
                         QStringLiteral("%1: unsupported file type .%2")
                             .arg(extractionStatusToString(
                                      ExtractionResult::Status::UnsupportedFormat),
                                  info.suffix()));
    }

    ExtractionResult extracted = extractor->extract(filePath);
    if (extracted.status != ExtractionResult::Status::Success || !extracted.content) {
        return makeError(ErrorKind::PartialItem,
                         QStringLiteral("%1: %2")
                             .arg(extractionStatusToString(extracted.status),
                                  extracted.errorMessage.value_or(QStringLiteral("no content"))));
    }

    const QString& content = *extracted.content;
    const QString title = detectTitle(content, filePath);
    const QString source = root.isEmpty() ? info.fileName() : QDir(root).relativeFilePath(filePath);
    const QString absolutePath = info.absoluteFilePath();

    LOG_INFO(siftIngest, "Processing: %s", qUtf8Printable(title));

    Metadata chunkMetadata;
    chunkMetadata.insert(MetadataKeys::FilePath, absolutePath);

    std::vector<Chunk> chunks = m_chunker.chunk(
        content, title, source, chunkMetadata,
        extracted.structure ? &*extracted.structure : nullptr);
    if (chunks.empty()) {
        LOG_WARN(siftIngest, "No chunks created for %s", qUtf8Printable(title));
        return makeError(ErrorKind::PartialItem, QStringLiteral("No chunks created"));
    }

    const EmbedReport embedReport = m_embedder->embedChunks(chunks);
    if (embedReport.failed > 0) {
        LOG_WARN(siftIngest, "%s: %d of %zu chunk(s) stored without embedding",
                 qUtf8Printable(title), embedReport.failed, chunks.size());
    }

    Document document;
    document.title = title;
    document.source = source;
    document.fullText = content;
    document.metadata.insert(MetadataKeys::FilePath, absolutePath);
    document.metadata.insert(MetadataKeys::IngestionDate,
                             QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));

    Result<std::vector<int64_t>> rowIds = m_store->insertDocument(document, chunks);
    if (!rowIds) {
        return rowIds.error();
    }

    // Committed; only now do vectors become searchable.
    int indexed = 0;
    if (m_index) {
        for (size_t i = 0; i < chunks.size(); ++i) {
            if (!chunks[i].embedding) {
                continue;
            }
            if (m_index->addVector(static_cast<uint64_t>(rowIds.value()[i]), *chunks[i].embedding)) {
                ++indexed;
            } else {
                LOG_WARN(siftIngest, "Chunk %d of %s not added to vector index",
                         chunks[i].chunkIndex, qUtf8Printable(document.id));
            }
        }
    }

    const int durationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(siftIngest, "Saved document %s: %zu chunk(s), %d indexed in %d ms",
             qUtf8Printable(document.id), chunks.size(), indexed, durationMs);

    IngestedDocument ingested;
    ingested.documentId = document.id;
    ingested.title = title;
    ingested.source = source;
    ingested.chunks = static_cast<int>(chunks.size());
    ingested.embeddedChunks = embedReport.embedded;
    ingested.durationMs = durationMs;
    return ingested;
}

IngestionReport IngestionPipeline::run(const QString& folder, bool cleanBefore)
{
    QElapsedTimer timer;
    timer.start();
    m_stopRequested.store(false);

    IngestionReport report;
    auto finish = [&]() {
        report.durationMs = static_cast<int>(timer.elapsed());
        return report;
    };

    if (!QFileInfo(folder).isDir()) {
        LOG_ERROR(siftIngest, "Documents folder not found: %s", qUtf8Printable(folder));
        report.errors.push_back({folder, makeError(ErrorKind::Validation,
                                                   QStringLiteral("Documents folder not found"))});
        return finish();
    }

    if (cleanBefore) {
        LOG_WARN(siftIngest, "Cleaning existing data before ingestion");
        const Status cleaned = m_store ? m_store->deleteAll()
                                       : Status(makeError(ErrorKind::Unavailable,
                                                          QStringLiteral("no store")));
        if (!cleaned) {
            report.errors.push_back({folder, cleaned.error()});
            return finish();
        }
        if (m_index) {
            m_index->clear();
        }
    }

    const QStringList files = findDocumentFiles(folder);
    LOG_INFO(siftIngest, "Found %lld document file(s) in %s",
             static_cast<long long>(files.size()), qUtf8Printable(folder));

    for (int i = 0; i < files.size(); ++i) {
        if (m_stopRequested.load()) {
            report.stopped = true;
            LOG_INFO(siftIngest, "Ingestion stopped after %d file(s)", report.processed);
            break;
        }

        const QString& path = files.at(i);
        if (m_progress) {
            m_progress(i + 1, static_cast<int>(files.size()), path);
        }

        ++report.processed;
        Result<IngestedDocument> ingested = ingestFile(path, folder);
        if (ingested) {
            ++report.succeeded;
            report.chunksCreated += ingested.value().chunks;
            report.chunksEmbedded += ingested.value().embeddedChunks;
            report.documents.push_back(std::move(ingested).value());
        } else {
            ++report.failed;
            const QString source = QDir(folder).relativeFilePath(path);
            LOG_WARN(siftIngest, "Failed to ingest %s: %s",
                     qUtf8Printable(source), qUtf8Printable(ingested.error().toString()));
            report.errors.push_back({source, ingested.error()});
        }
    }

    report.durationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(siftIngest, "Ingestion done: %d processed, %d succeeded, %d failed, %d chunks in %d ms",
             report.processed, report.succeeded, report.failed, report.chunksCreated,
             report.durationMs);
    return report;
}

} // namespace sift
