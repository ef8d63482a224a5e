#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "core/Errors.hpp"
#include "emb/EmbeddingGenerator.hpp"
#include "emb/OpenAiEmbeddingProvider.hpp"

namespace {

std::vector<std::string> numbered_texts(size_t n) {
    std::vector<std::string> texts;
    for (size_t i = 0; i < n; ++i) texts.push_back("t" + std::to_string(i));
    return texts;
}

// Returns whatever it was told to, regardless of the request.
class CannedProvider : public emb::EmbeddingProvider {
public:
    explicit CannedProvider(std::vector<emb::EmbeddingItem> items) : items_(std::move(items)) {}

    std::vector<emb::EmbeddingItem> embed_batch(const std::string&, const std::vector<std::string>&) override {
        return items_;
    }

private:
    std::vector<emb::EmbeddingItem> items_;
};

class ThrowingProvider : public emb::EmbeddingProvider {
public:
    std::vector<emb::EmbeddingItem> embed_batch(const std::string&, const std::vector<std::string>&) override {
        throw std::runtime_error("connection reset");
    }
};

} // namespace

TEST(EmbeddingGeneratorTest, RestoresInputOrderAcrossShuffledChunks) {
    for (unsigned seed = 1; seed <= 20; ++seed) {
        testutil::ShufflingProvider prov(seed);
        emb::EmbeddingGenerator gen(prov);

        const auto texts = numbered_texts(23);
        const auto vecs = gen.embed(texts, "m", 5);

        ASSERT_EQ(vecs.size(), texts.size());
        for (size_t i = 0; i < vecs.size(); ++i) {
            ASSERT_EQ(vecs[i].size(), 2u);
            EXPECT_FLOAT_EQ(vecs[i][0], (float)i) << "seed " << seed;
        }
        EXPECT_EQ(prov.batch_sizes, (std::vector<size_t>{5, 5, 5, 5, 3}));
    }
}

TEST(EmbeddingGeneratorTest, RejectsNonPositiveBatchSize) {
    testutil::ShufflingProvider prov(1);
    emb::EmbeddingGenerator gen(prov);
    EXPECT_THROW(gen.embed(numbered_texts(2), "m", 0), core::ConfigurationError);
    EXPECT_THROW(gen.embed(numbered_texts(2), "m", -3), core::ConfigurationError);
    EXPECT_TRUE(prov.batch_sizes.empty());
}

TEST(EmbeddingGeneratorTest, EmptyInputMakesNoCalls) {
    testutil::ShufflingProvider prov(1);
    emb::EmbeddingGenerator gen(prov);
    EXPECT_TRUE(gen.embed({}, "m", 4).empty());
    EXPECT_TRUE(prov.batch_sizes.empty());
}

TEST(EmbeddingGeneratorTest, CountMismatchIsUpstreamError) {
    CannedProvider short_prov(std::vector<emb::EmbeddingItem>{{0, {1.0f}}});
    emb::EmbeddingGenerator gen(short_prov);
    try {
        gen.embed(numbered_texts(2), "m", 8);
        FAIL() << "expected UpstreamError";
    } catch (const core::UpstreamError& e) {
        EXPECT_NE(std::string(e.what()).find("chunk [0, 2)"), std::string::npos) << e.what();
    }
}

TEST(EmbeddingGeneratorTest, DuplicateIndicesAreUpstreamError) {
    CannedProvider dup({{0, {1.0f}}, {0, {2.0f}}});
    emb::EmbeddingGenerator gen(dup);
    EXPECT_THROW(gen.embed(numbered_texts(2), "m", 2), core::UpstreamError);
}

TEST(EmbeddingGeneratorTest, ProviderFailureIsWrappedAsUpstreamError) {
    ThrowingProvider prov;
    emb::EmbeddingGenerator gen(prov);
    try {
        gen.embed(numbered_texts(3), "m", 2);
        FAIL() << "expected UpstreamError";
    } catch (const core::UpstreamError& e) {
        EXPECT_NE(std::string(e.what()).find("connection reset"), std::string::npos);
    }
}

TEST(OpenAiResponseTest, ParsesDataItemsWithIndices) {
    const auto items = emb::parse_embeddings_response(R"({
        "object": "list",
        "data": [
            {"object": "embedding", "index": 1, "embedding": [0.5, 0.25]},
            {"object": "embedding", "index": 0, "embedding": [1, 0]}
        ],
        "model": "text-embedding-3-large"
    })");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].index, 1u);
    EXPECT_FLOAT_EQ(items[0].embedding[1], 0.25f);
    EXPECT_EQ(items[1].index, 0u);
}

TEST(OpenAiResponseTest, ErrorBodyIsUpstreamError) {
    try {
        emb::parse_embeddings_response(R"({"error": {"message": "Incorrect API key provided"}})");
        FAIL() << "expected UpstreamError";
    } catch (const core::UpstreamError& e) {
        EXPECT_NE(std::string(e.what()).find("Incorrect API key"), std::string::npos);
    }
    EXPECT_THROW(emb::parse_embeddings_response("not json"), core::UpstreamError);
    EXPECT_THROW(emb::parse_embeddings_response(R"({"data": [{"index": 0}]})"), core::UpstreamError);
}

class OpenAiProviderTest : public testutil::TempDirTest {
protected:
    static emb::OpenAiEmbeddingProvider::Config config() {
        emb::OpenAiEmbeddingProvider::Config cfg;
        cfg.api_key = "test-key";
        return cfg;
    }
};

TEST_F(OpenAiProviderTest, RemovesItsScratchDirectory) {
    std::filesystem::path first, second;
    {
        emb::OpenAiEmbeddingProvider a(config());
        emb::OpenAiEmbeddingProvider b(config());
        first = a.work_dir();
        second = b.work_dir();
        EXPECT_NE(first.string(), second.string());
        EXPECT_TRUE(std::filesystem::is_directory(first));
        EXPECT_TRUE(std::filesystem::is_directory(second));
    }
    EXPECT_FALSE(std::filesystem::exists(first));
    EXPECT_FALSE(std::filesystem::exists(second));
}

TEST_F(OpenAiProviderTest, KeepsCallerSuppliedWorkDir) {
    auto cfg = config();
    cfg.work_dir = dir_ / "scratch";
    {
        emb::OpenAiEmbeddingProvider p(cfg);
        EXPECT_EQ(p.work_dir().string(), (dir_ / "scratch").string());
    }
    EXPECT_TRUE(std::filesystem::is_directory(dir_ / "scratch"));
}

TEST_F(OpenAiProviderTest, MissingApiKeyIsConfigurationError) {
    EXPECT_THROW({ emb::OpenAiEmbeddingProvider p{emb::OpenAiEmbeddingProvider::Config{}}; }, core::ConfigurationError);
}
