#include "emb/MiniLmEmbedder.hpp"
#include "core/Errors.hpp"
#include "emb/Pooling.hpp"

#include <iostream>

namespace emb {

bool MiniLmEmbedder::init(const std::string& model_path, const std::string& vocab_path) {
    m_session.reset();

    if (!m_tok.load_vocab(vocab_path)) {
        std::cerr << "[error] MiniLmEmbedder: failed to load vocab: " << vocab_path << "\n";
        return false;
    }

    try {
        m_opts.SetIntraOpNumThreads(1);
        m_opts.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

#ifdef _WIN32
        std::wstring wmodel(model_path.begin(), model_path.end());
        auto session = std::make_unique<Ort::Session>(m_env, wmodel.c_str(), m_opts);
#else
        auto session = std::make_unique<Ort::Session>(m_env, model_path.c_str(), m_opts);
#endif

        if (session->GetInputCount() < 3 || session->GetOutputCount() < 1) {
            std::cerr << "[error] MiniLmEmbedder: model needs 3 inputs and 1 output, has "
                      << session->GetInputCount() << "/" << session->GetOutputCount() << "\n";
            return false;
        }

        Ort::AllocatorWithDefaultOptions allocator;
        m_inputs.clear();
        for (size_t i = 0; i < 3; ++i) {
            m_inputs.emplace_back(session->GetInputNameAllocated(i, allocator).get());
        }
        m_output = session->GetOutputNameAllocated(0, allocator).get();

        m_session = std::move(session);
        return true;
    } catch (const Ort::Exception& e) {
        std::cerr << "[error] MiniLmEmbedder: cannot load " << model_path << ": " << e.what() << "\n";
        return false;
    }
}

std::vector<EmbeddingItem> MiniLmEmbedder::embed_batch(const std::string&,
                                                       const std::vector<std::string>& texts) {
    if (!m_session) throw core::UpstreamError("MiniLmEmbedder used before a successful init()");
    if (texts.empty()) return {};

    EncodedBatch in = m_tok.encode_batch(texts, m_max_len);
    std::vector<int64_t> type_ids(in.ids.size(), 0);
    const std::vector<int64_t> shape{(int64_t)in.batch, (int64_t)in.seq_len};

    std::vector<std::vector<float>> pooled;
    try {
        Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

        std::vector<Ort::Value> values;
        values.push_back(Ort::Value::CreateTensor<int64_t>(mem, in.ids.data(), in.ids.size(), shape.data(), shape.size()));
        values.push_back(Ort::Value::CreateTensor<int64_t>(mem, in.mask.data(), in.mask.size(), shape.data(), shape.size()));
        values.push_back(Ort::Value::CreateTensor<int64_t>(mem, type_ids.data(), type_ids.size(), shape.data(), shape.size()));

        const char* in_names[3] = {m_inputs[0].c_str(), m_inputs[1].c_str(), m_inputs[2].c_str()};
        const char* out_names[1] = {m_output.c_str()};

        auto outs = m_session->Run(Ort::RunOptions{nullptr}, in_names, values.data(), values.size(), out_names, 1);

        const auto out_shape = outs[0].GetTensorTypeAndShapeInfo().GetShape();
        if (out_shape.size() != 3 || out_shape[0] != (int64_t)in.batch || out_shape[1] != (int64_t)in.seq_len) {
            throw core::UpstreamError("ONNX model output is not [batch, seq_len, hidden]");
        }
        pooled = masked_mean_pool(outs[0].GetTensorData<float>(), in.mask, in.batch, in.seq_len,
                                  (size_t)out_shape[2]);
    } catch (const Ort::Exception& e) {
        throw core::UpstreamError(std::string("ONNX inference failed: ") + e.what());
    }

    std::vector<EmbeddingItem> items;
    items.reserve(pooled.size());
    for (size_t i = 0; i < pooled.size(); ++i) {
        items.push_back({i, std::move(pooled[i])});
    }
    return items;
}

} // namespace emb
