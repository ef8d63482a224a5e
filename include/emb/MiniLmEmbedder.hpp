#pragma once
#include "emb/EmbeddingProvider.hpp"
#include "emb/WordPieceTokenizer.hpp"
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace emb {

// Local sentence-transformer (MiniLM family) run through ONNX Runtime.
// The model is fixed at init(); the model argument of embed_batch is ignored.
class MiniLmEmbedder final : public EmbeddingProvider {
public:
    explicit MiniLmEmbedder(size_t max_len = 256) : m_max_len(max_len) {}

    // false (with the reason on stderr) if the vocab or model cannot be loaded
    bool init(const std::string& model_path, const std::string& vocab_path);

    bool ready() const { return m_session != nullptr; }

    // One padded [n, seq_len] inference for the whole batch; rows come back
    // mean-pooled and L2-normalized. Throws core::UpstreamError before init()
    // or when inference fails.
    std::vector<EmbeddingItem> embed_batch(const std::string& model,
                                           const std::vector<std::string>& texts) override;

private:
    size_t m_max_len;
    WordPieceTokenizer m_tok;

    Ort::Env m_env{ORT_LOGGING_LEVEL_WARNING, "resume-index"};
    Ort::SessionOptions m_opts;
    std::unique_ptr<Ort::Session> m_session;

    std::vector<std::string> m_inputs;   // ids, mask, token types
    std::string m_output;
};

} // namespace emb
