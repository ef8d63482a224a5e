#include <gtest/gtest.h>

#include <fstream>

#include "TestUtil.hpp"
#include "core/Errors.hpp"
#include "emb/EmbeddingGenerator.hpp"
#include "emb/MiniLmEmbedder.hpp"

class MiniLmEmbedderTest : public testutil::TempDirTest {
protected:
    std::string vocab() {
        const auto p = dir_ / "vocab.txt";
        std::ofstream f(p);
        f << "[PAD]\n[UNK]\n[CLS]\n[SEP]\nsenior\nengineer\n";
        return p.string();
    }
};

TEST_F(MiniLmEmbedderTest, EmbedBeforeInitIsUpstreamError) {
    emb::MiniLmEmbedder e(16);
    EXPECT_FALSE(e.ready());
    EXPECT_THROW(e.embed_batch("ignored", {"senior engineer"}), core::UpstreamError);
}

TEST_F(MiniLmEmbedderTest, InitFailsWithoutVocab) {
    emb::MiniLmEmbedder e(16);
    EXPECT_FALSE(e.init((dir_ / "model.onnx").string(), (dir_ / "missing.txt").string()));
    EXPECT_FALSE(e.ready());
}

TEST_F(MiniLmEmbedderTest, InitFailsOnUnreadableModel) {
    const auto model = dir_ / "model.onnx";
    {
        std::ofstream f(model, std::ios::binary);
        f << "not an onnx graph";
    }

    emb::MiniLmEmbedder e(16);
    EXPECT_FALSE(e.init(model.string(), vocab()));
    EXPECT_FALSE(e.ready());
    EXPECT_FALSE(e.init((dir_ / "absent.onnx").string(), vocab()));
}

TEST_F(MiniLmEmbedderTest, GeneratorSurfacesUninitializedProvider) {
    emb::MiniLmEmbedder e(16);
    emb::EmbeddingGenerator gen(e);
    EXPECT_THROW(gen.embed({"senior engineer"}, "ignored", 4), core::UpstreamError);
}
