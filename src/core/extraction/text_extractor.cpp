#include "core/extraction/text_extractor.h"
#include "core/extraction/text_cleaner.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QStringConverter>

namespace sift {

namespace {

// 50 MB; larger files are not read into memory
constexpr int64_t kMaxFileSizeBytes = 50 * 1024 * 1024;

} // anonymous namespace

QString extractionStatusToString(ExtractionResult::Status status)
{
    switch (status) {
    case ExtractionResult::Status::Success:           return QStringLiteral("success");
    case ExtractionResult::Status::UnsupportedFormat: return QStringLiteral("unsupported_format");
    case ExtractionResult::Status::SizeExceeded:      return QStringLiteral("size_exceeded");
    case ExtractionResult::Status::Inaccessible:      return QStringLiteral("inaccessible");
    case ExtractionResult::Status::Unknown:           return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

const QSet<QString>& PlainTextExtractor::supportedExtensions()
{
    static const QSet<QString> exts = {
        QStringLiteral("txt"),
        QStringLiteral("text"),
        QStringLiteral("md"),
        QStringLiteral("markdown"),
        QStringLiteral("rst"),
    };
    return exts;
}

bool PlainTextExtractor::isMarkdown(const QString& extension)
{
    const QString ext = extension.toLower();
    return ext == QLatin1String("md") || ext == QLatin1String("markdown");
}

bool PlainTextExtractor::supports(const QString& extension) const
{
    return supportedExtensions().contains(extension.toLower());
}

ExtractionResult PlainTextExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;
    auto fail = [&](ExtractionResult::Status status, const QString& message) {
        result.status = status;
        result.errorMessage = message;
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    };

    const QFileInfo info(filePath);
    if (!supports(info.suffix())) {
        return fail(ExtractionResult::Status::UnsupportedFormat,
                    QStringLiteral("Unsupported file type: .%1").arg(info.suffix()));
    }
    if (!info.exists() || !info.isFile() || !info.isReadable()) {
        return fail(ExtractionResult::Status::Inaccessible,
                    QStringLiteral("File does not exist or is not readable"));
    }
    if (info.size() > kMaxFileSizeBytes) {
        LOG_INFO(siftIngest, "Skipping oversized file: %s (%lld bytes)",
                 qUtf8Printable(filePath), static_cast<long long>(info.size()));
        return fail(ExtractionResult::Status::SizeExceeded,
                    QStringLiteral("File size %1 bytes exceeds limit of %2 bytes")
                        .arg(info.size())
                        .arg(kMaxFileSizeBytes));
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(ExtractionResult::Status::Inaccessible,
                    QStringLiteral("Failed to open file: %1").arg(file.errorString()));
    }
    const QByteArray rawBytes = file.readAll();
    file.close();

    QString decoded;
    {
        auto toUtf16 = QStringDecoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
        decoded = toUtf16(rawBytes);
        if (toUtf16.hasError()) {
            // Latin-1 maps every byte, so this cannot fail.
            decoded = QString::fromLatin1(rawBytes);
            LOG_DEBUG(siftIngest, "UTF-8 decode failed for %s, using Latin-1 fallback",
                      qUtf8Printable(filePath));
        }
    }

    result.content = TextCleaner::clean(decoded);
    if (isMarkdown(info.suffix())) {
        result.structure = MarkdownStructureParser::parse(*result.content);
    }
    result.status = ExtractionResult::Status::Success;
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(siftIngest, "Extracted %lld chars from %s in %d ms",
              static_cast<long long>(result.content->size()),
              qUtf8Printable(filePath),
              result.durationMs);
    return result;
}

} // namespace sift
