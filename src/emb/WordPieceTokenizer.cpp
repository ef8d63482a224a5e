#include "emb/WordPieceTokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace emb {

static bool is_space_byte(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// ascii punctuation only; multi-byte utf-8 sequences stay inside words
static bool is_punct_byte(unsigned char c) {
    return c < 0x80 && std::ispunct(c);
}

bool WordPieceTokenizer::load_vocab(const std::string& vocab_path) {
    std::ifstream in(vocab_path);
    if (!in) return false;

    m_id_to_tok.clear();
    m_tok_to_id.clear();

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const int64_t id = (int64_t)m_id_to_tok.size();
        m_id_to_tok.push_back(line);
        m_tok_to_id.emplace(line, id);   // first occurrence wins
    }

    m_cls = id_of("[CLS]");
    m_sep = id_of("[SEP]");
    m_unk = id_of("[UNK]");
    m_pad = std::max<int64_t>(id_of("[PAD]"), 0);
    if (m_cls < 0 || m_sep < 0 || m_unk < 0) {
        std::cerr << "[error] vocab " << vocab_path << " lacks [CLS]/[SEP]/[UNK]\n";
        return false;
    }
    return true;
}

int64_t WordPieceTokenizer::id_of(const std::string& tok) const {
    auto it = m_tok_to_id.find(tok);
    return it == m_tok_to_id.end() ? -1 : it->second;
}

std::vector<std::string> WordPieceTokenizer::basic_tokenize(const std::string& text) const {
    std::vector<std::string> out;
    std::string cur;

    for (unsigned char c : text) {
        if (is_space_byte(c)) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        } else if (is_punct_byte(c)) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
            out.emplace_back(1, (char)c);
        } else {
            cur.push_back(c < 0x80 ? (char)std::tolower(c) : (char)c);
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

std::vector<std::string> WordPieceTokenizer::wordpiece(const std::string& word) const {
    if (word.empty() || word.size() > kMaxWordBytes) return {"[UNK]"};

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < word.size()) {
        std::string match;
        for (size_t end = word.size(); end > start; --end) {
            std::string cand = (start > 0 ? "##" : "") + word.substr(start, end - start);
            if (m_tok_to_id.count(cand)) {
                match = std::move(cand);
                start = end;
                break;
            }
        }
        if (match.empty()) return {"[UNK]"};
        pieces.push_back(std::move(match));
    }
    return pieces;
}

std::vector<int64_t> WordPieceTokenizer::encode(const std::string& text, size_t max_len) const {
    if (max_len < 2) max_len = 2;
    const size_t body_cap = max_len - 2;

    std::vector<int64_t> ids;
    ids.reserve(max_len);
    ids.push_back(m_cls);

    for (const auto& word : basic_tokenize(text)) {
        for (const auto& piece : wordpiece(word)) {
            if (ids.size() - 1 >= body_cap) break;
            const int64_t id = id_of(piece);
            ids.push_back(id < 0 ? m_unk : id);
        }
        if (ids.size() - 1 >= body_cap) break;
    }

    ids.push_back(m_sep);
    return ids;
}

EncodedBatch WordPieceTokenizer::encode_batch(const std::vector<std::string>& texts, size_t max_len) const {
    std::vector<std::vector<int64_t>> rows;
    rows.reserve(texts.size());
    size_t longest = 0;
    for (const auto& t : texts) {
        rows.push_back(encode(t, max_len));
        longest = std::max(longest, rows.back().size());
    }

    EncodedBatch b;
    b.batch = rows.size();
    b.seq_len = longest;
    b.ids.assign(b.batch * b.seq_len, m_pad);
    b.mask.assign(b.batch * b.seq_len, 0);
    for (size_t r = 0; r < rows.size(); ++r) {
        std::copy(rows[r].begin(), rows[r].end(), b.ids.begin() + (std::ptrdiff_t)(r * b.seq_len));
        std::fill_n(b.mask.begin() + (std::ptrdiff_t)(r * b.seq_len), rows[r].size(), (int64_t)1);
    }
    return b;
}

} // namespace emb
