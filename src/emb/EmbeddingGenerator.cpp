#include "emb/EmbeddingGenerator.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <sstream>

namespace emb {

static std::string chunk_label(size_t begin, size_t end) {
    std::ostringstream oss;
    oss << "chunk [" << begin << ", " << end << ")";
    return oss.str();
}

std::vector<std::vector<float>> EmbeddingGenerator::embed(const std::vector<std::string>& texts,
                                                          const std::string& model,
                                                          int batch_size) {
    if (batch_size <= 0) {
        throw core::ConfigurationError("batch_size must be greater than 0 (got " + std::to_string(batch_size) + ")");
    }

    std::vector<std::vector<float>> out;
    out.reserve(texts.size());

    const size_t step = (size_t)batch_size;
    for (size_t begin = 0; begin < texts.size(); begin += step) {
        const size_t end = std::min(begin + step, texts.size());
        const std::vector<std::string> chunk(texts.begin() + (std::ptrdiff_t)begin,
                                             texts.begin() + (std::ptrdiff_t)end);
        const std::string label = chunk_label(begin, end);

        std::vector<EmbeddingItem> items;
        try {
            items = m_provider.embed_batch(model, chunk);
        } catch (const core::Error&) {
            throw;
        } catch (const std::exception& e) {
            throw core::UpstreamError("embedding provider failed on " + label + ": " + e.what());
        }

        if (items.size() != chunk.size()) {
            std::ostringstream oss;
            oss << "provider returned " << items.size() << " embeddings for " << label
                << " (expected " << chunk.size() << ")";
            throw core::UpstreamError(oss.str());
        }

        std::sort(items.begin(), items.end(),
                  [](const EmbeddingItem& a, const EmbeddingItem& b) { return a.index < b.index; });

        for (size_t i = 0; i < items.size(); ++i) {
            if (items[i].index != i) {
                std::ostringstream oss;
                oss << "provider returned indices that do not cover " << label
                    << " (position " << i << " has index " << items[i].index << ")";
                throw core::UpstreamError(oss.str());
            }
            out.push_back(std::move(items[i].embedding));
        }
    }

    if (out.size() != texts.size()) {
        std::ostringstream oss;
        oss << "embedding count " << out.size() << " did not match text count " << texts.size();
        throw core::UpstreamError(oss.str());
    }

    return out;
}

} // namespace emb
