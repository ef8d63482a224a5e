#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace emb {

struct EmbeddingItem {
    size_t index = 0;            // position of the source text within the request
    std::vector<float> embedding;
};

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    // One request for the whole list. Items may come back in any order; each
    // carries the index of the text it belongs to.
    virtual std::vector<EmbeddingItem> embed_batch(const std::string& model,
                                                   const std::vector<std::string>& texts) = 0;
};

} // namespace emb
