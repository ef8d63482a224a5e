#pragma once

#include "emb/EmbeddingProvider.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace emb {

// POSTs to <base_url>/embeddings through the curl binary. One call per batch,
// no retries; any failure surfaces as core::UpstreamError.
class OpenAiEmbeddingProvider final : public EmbeddingProvider {
public:
    struct Config {
        std::string api_key;
        std::string base_url = "https://api.openai.com/v1";
        std::filesystem::path work_dir;   // request/response scratch files; temp dir if empty

        // OPENAI_API_KEY (required), OPENAI_BASE_URL (optional)
        static Config from_env();
    };

    explicit OpenAiEmbeddingProvider(Config cfg);
    // removes the scratch directory if this provider created it
    ~OpenAiEmbeddingProvider() override;

    OpenAiEmbeddingProvider(const OpenAiEmbeddingProvider&) = delete;
    OpenAiEmbeddingProvider& operator=(const OpenAiEmbeddingProvider&) = delete;

    const std::filesystem::path& work_dir() const { return cfg_.work_dir; }

    std::vector<EmbeddingItem> embed_batch(const std::string& model,
                                           const std::vector<std::string>& texts) override;

private:
    Config cfg_;
    unsigned call_seq_ = 0;
    bool owns_work_dir_ = false;

    std::string run_curl_json(const std::string& payload);
};

// Parses an embeddings response body ({"data":[{"index":..,"embedding":[..]}]}).
// Items keep the order they appear in the body.
std::vector<EmbeddingItem> parse_embeddings_response(const std::string& body);

} // namespace emb
