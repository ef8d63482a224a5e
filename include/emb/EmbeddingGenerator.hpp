#pragma once
#include <string>
#include <vector>

#include "emb/EmbeddingProvider.hpp"

namespace emb {

// Drives a provider over consecutive chunks of at most batch_size texts,
// strictly one chunk at a time, and returns one vector per input text in
// input order. Providers may reorder results within a chunk; the order is
// restored from the returned indices.
class EmbeddingGenerator {
public:
    explicit EmbeddingGenerator(EmbeddingProvider& provider) : m_provider(provider) {}

    // Throws core::ConfigurationError for batch_size <= 0 and
    // core::UpstreamError when the provider fails or its response does not
    // line up with the request.
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                          const std::string& model,
                                          int batch_size);

private:
    EmbeddingProvider& m_provider;
};

} // namespace emb
