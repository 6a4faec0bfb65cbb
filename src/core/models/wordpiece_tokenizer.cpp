#include "core/models/wordpiece_tokenizer.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>

namespace sift {

namespace {

bool isCombiningMark(QChar ch)
{
    const QChar::Category category = ch.category();
    return category == QChar::Mark_NonSpacing
        || category == QChar::Mark_SpacingCombining
        || category == QChar::Mark_Enclosing;
}

bool isPunctuation(QChar ch)
{
    const ushort code = ch.unicode();
    // ASCII symbols count as punctuation for BERT even when Unicode says otherwise.
    if ((code >= 33 && code <= 47) || (code >= 58 && code <= 64)
        || (code >= 91 && code <= 96) || (code >= 123 && code <= 126)) {
        return true;
    }
    return ch.isPunct();
}

} // namespace

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(8, maxSequenceLength))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(siftRanking, "WordPieceTokenizer: cannot open vocab %s", qUtf8Printable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    int64_t index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        LOG_WARN(siftRanking, "WordPieceTokenizer: empty vocab at %s", qUtf8Printable(vocabPath));
        return;
    }

    m_padId = tokenId("[PAD]", m_padId);
    m_unkId = tokenId("[UNK]", m_unkId);
    m_clsId = tokenId("[CLS]", m_clsId);
    m_sepId = tokenId("[SEP]", m_sepId);
    m_loaded = true;
}

int64_t WordPieceTokenizer::tokenId(const char* token, int64_t fallback) const
{
    const auto it = m_vocab.find(token);
    return it != m_vocab.end() ? it->second : fallback;
}

std::vector<QString> WordPieceTokenizer::basicTokens(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    std::vector<QString> tokens;
    QString current;
    auto flush = [&]() {
        if (!current.isEmpty()) {
            tokens.push_back(current);
            current.clear();
        }
    };

    for (const QChar ch : decomposed) {
        if (isCombiningMark(ch) || ch.category() == QChar::Other_Control) {
            continue;
        }
        if (ch.isSpace()) {
            flush();
        } else if (isPunctuation(ch)) {
            flush();
            tokens.push_back(QString(ch));
        } else {
            current.append(ch);
        }
    }
    flush();
    return tokens;
}

void WordPieceTokenizer::appendWordPieces(const QString& word, std::vector<int64_t>* output) const
{
    if (word.size() > kMaxWordChars) {
        output->push_back(m_unkId);
        return;
    }

    std::vector<int64_t> pieces;
    int start = 0;
    const int length = static_cast<int>(word.size());
    while (start < length) {
        int end = length;
        int64_t matched = -1;
        while (end > start) {
            QString candidate = word.mid(start, end - start);
            if (start > 0) {
                candidate.prepend(QStringLiteral("##"));
            }
            const auto it = m_vocab.find(candidate.toStdString());
            if (it != m_vocab.end()) {
                matched = it->second;
                break;
            }
            --end;
        }
        if (matched < 0) {
            // The whole word becomes [UNK] if any part is unknown.
            output->push_back(m_unkId);
            return;
        }
        pieces.push_back(matched);
        start = end;
    }
    output->insert(output->end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::encode(const QString& text) const
{
    std::vector<int64_t> ids;
    if (!m_loaded) {
        return ids;
    }
    for (const QString& word : basicTokens(text)) {
        appendWordPieces(word, &ids);
    }
    return ids;
}

WordPieceTokenizer::PairBatch WordPieceTokenizer::encodePairs(
    const std::vector<std::pair<QString, QString>>& pairs) const
{
    PairBatch batch;
    if (!m_loaded || pairs.empty()) {
        return batch;
    }

    const size_t budget = static_cast<size_t>(m_maxSequenceLength - 3);  // [CLS] + 2x[SEP]

    struct Row {
        std::vector<int64_t> a;
        std::vector<int64_t> b;
    };
    std::vector<Row> rows;
    rows.reserve(pairs.size());
    int longest = 0;

    for (const auto& [textA, textB] : pairs) {
        Row row{encode(textA), encode(textB)};
        // Longest-first: trim whichever segment is currently longer.
        while (row.a.size() + row.b.size() > budget) {
            if (row.a.size() > row.b.size()) {
                row.a.pop_back();
            } else {
                row.b.pop_back();
            }
        }
        longest = std::max(longest, static_cast<int>(row.a.size() + row.b.size() + 3));
        rows.push_back(std::move(row));
    }

    batch.batchSize = static_cast<int>(rows.size());
    batch.sequenceLength = longest;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(longest);
    batch.inputIds.assign(total, m_padId);
    batch.attentionMask.assign(total, 0);
    batch.tokenTypeIds.assign(total, 0);

    for (size_t r = 0; r < rows.size(); ++r) {
        const Row& row = rows[r];
        size_t pos = r * static_cast<size_t>(longest);
        auto put = [&](int64_t id, int64_t segment) {
            batch.inputIds[pos] = id;
            batch.attentionMask[pos] = 1;
            batch.tokenTypeIds[pos] = segment;
            ++pos;
        };

        put(m_clsId, 0);
        for (int64_t id : row.a) {
            put(id, 0);
        }
        put(m_sepId, 0);
        for (int64_t id : row.b) {
            put(id, 1);
        }
        put(m_sepId, 1);
    }

    return batch;
}

} // namespace sift
