#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace emb {

// Row-major [batch, seq_len] model inputs, right-padded to the longest row.
struct EncodedBatch {
    size_t batch = 0;
    size_t seq_len = 0;
    std::vector<int64_t> ids;
    std::vector<int64_t> mask;   // 1 for real tokens, 0 for padding
};

// BERT-style uncased WordPiece encoder over a vocab.txt (one token per line,
// line number == id).
class WordPieceTokenizer {
public:
    // false if the file is unreadable or lacks [CLS]/[SEP]/[UNK]
    bool load_vocab(const std::string& vocab_path);

    // [CLS] pieces... [SEP], truncated so the result never exceeds max_len
    // (max_len below 2 is treated as 2)
    std::vector<int64_t> encode(const std::string& text, size_t max_len) const;

    // encode() every text, pad with [PAD] (id 0 when the vocab has none)
    EncodedBatch encode_batch(const std::vector<std::string>& texts, size_t max_len) const;

    // whitespace/punctuation split + ascii lowercase; exposed for tests
    std::vector<std::string> basic_tokenize(const std::string& text) const;
    // greedy longest-match split of one word; {"[UNK]"} if no split exists
    std::vector<std::string> wordpiece(const std::string& word) const;

    size_t vocab_size() const { return m_id_to_tok.size(); }
    int64_t id_of(const std::string& tok) const;   // -1 if absent

private:
    static constexpr size_t kMaxWordBytes = 100;

    std::vector<std::string> m_id_to_tok;
    std::unordered_map<std::string, int64_t> m_tok_to_id;
    int64_t m_cls = -1;
    int64_t m_sep = -1;
    int64_t m_unk = -1;
    int64_t m_pad = 0;
};

} // namespace emb
