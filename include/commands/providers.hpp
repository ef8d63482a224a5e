#pragma once
#include <memory>
#include <string>

#include "emb/EmbeddingProvider.hpp"

// --provider openai|onnx. For onnx, model is the .onnx file path.
// Returns nullptr (after printing the reason) when the provider cannot start.
std::unique_ptr<emb::EmbeddingProvider> make_provider(const std::string& provider,
                                                      const std::string& model,
                                                      const std::string& vocab,
                                                      size_t max_len);
