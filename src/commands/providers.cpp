#include "commands/providers.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "emb/OpenAiEmbeddingProvider.hpp"
#include "util/TextUtil.hpp"

#include <iostream>

std::unique_ptr<emb::EmbeddingProvider> make_provider(const std::string& provider,
                                                      const std::string& model,
                                                      const std::string& vocab,
                                                      size_t max_len) {
    const std::string p = textutil::to_lower(textutil::trim(provider));

    if (p == "openai") {
        return std::make_unique<emb::OpenAiEmbeddingProvider>(emb::OpenAiEmbeddingProvider::Config::from_env());
    }

    if (p == "onnx") {
        auto e = std::make_unique<emb::MiniLmEmbedder>(max_len);
        if (!e->init(model, vocab)) {
            std::cerr << "[error] failed to init MiniLmEmbedder (model=" << model << ", vocab=" << vocab << ")\n";
            return nullptr;
        }
        return e;
    }

    std::cerr << "[error] unknown provider: " << provider << " (expected openai|onnx)\n";
    return nullptr;
}
