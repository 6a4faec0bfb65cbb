#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sift {

// WordPieceTokenizer: BERT-style uncased tokenizer for (query, passage)
// pairs fed to a cross-encoder.
//
// Basic tokenization lowercases, strips accents, splits on whitespace and
// isolates punctuation; each word is then split greedily into the longest
// vocabulary pieces ("##" marks continuations). Special token ids are read
// from the vocabulary, not assumed.
class WordPieceTokenizer {
public:
    struct PairBatch {
        std::vector<int64_t> inputIds;      // flattened [batchSize * sequenceLength]
        std::vector<int64_t> attentionMask;
        std::vector<int64_t> tokenTypeIds;  // 0 for segment A, 1 for segment B
        int batchSize = 0;
        int sequenceLength = 0;
    };

    WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength = 512);

    bool isLoaded() const { return m_loaded; }
    int maxSequenceLength() const { return m_maxSequenceLength; }

    // Word-piece ids without special tokens.
    std::vector<int64_t> encode(const QString& text) const;

    // [CLS] A [SEP] B [SEP] per pair, longest-first truncation to
    // maxSequenceLength, rows padded to the longest row in the batch.
    PairBatch encodePairs(const std::vector<std::pair<QString, QString>>& pairs) const;

private:
    std::vector<QString> basicTokens(const QString& text) const;
    void appendWordPieces(const QString& word, std::vector<int64_t>* output) const;
    int64_t tokenId(const char* token, int64_t fallback) const;

    std::unordered_map<std::string, int64_t> m_vocab;
    int m_maxSequenceLength = 512;
    int64_t m_padId = 0;
    int64_t m_unkId = 100;
    int64_t m_clsId = 101;
    int64_t m_sepId = 102;
    bool m_loaded = false;

    static constexpr int kMaxWordChars = 100;
};

} // namespace sift
