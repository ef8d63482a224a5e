#include <gtest/gtest.h>

#include <fstream>

#include "TestUtil.hpp"
#include "core/Errors.hpp"
#include "index/IndexBuilder.hpp"
#include "index/VectorIndex.hpp"
#include "pipeline/QueryResolver.hpp"

namespace fs = std::filesystem;

using pipeline::resolve_query;
using store::ProfileStore;

class QueryResolverTest : public testutil::TempDirTest {
protected:
    void SetUp() override {
        testutil::TempDirTest::SetUp();
        knn::IndexBuilder builder(dir_ / "indexes");
        artifact_ = builder.build({{1.0f, 0.0f}, {0.0f, 1.0f}, {0.6f, 0.8f}});
    }

    fs::path db() const { return dir_ / "resume_profiles.db"; }

    // Rows attached to artifact_ in id order.
    void seed_store(size_t rows) {
        ProfileStore st = ProfileStore::create(db());
        std::vector<int64_t> ids;
        for (size_t i = 0; i < rows; ++i) {
            const std::string name = "person-" + std::to_string(i);
            st.upsert(name, testutil::tiny_profile("Person " + std::to_string(i), "Go"), "sha");
            ids.push_back((int64_t)(i + 1));
        }
        st.attach_index_artifact(ids, knn::artifact_ref(artifact_));
    }

    fs::path artifact_;
};

TEST_F(QueryResolverTest, NearestNeighbourResolvesToItsRow) {
    seed_store(3);
    ProfileStore st = ProfileStore::open(db());

    const auto hits = resolve_query({1.0f, 0.0f}, artifact_, &st, 3);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0].rank, 1u);
    EXPECT_EQ(hits[0].position, 0u);
    EXPECT_FLOAT_EQ(hits[0].distance, 0.0f);
    ASSERT_TRUE(hits[0].profile.has_value());
    EXPECT_EQ(hits[0].profile->id, 1);
    EXPECT_EQ(hits[0].profile->display_name, "Person 0");

    EXPECT_EQ(hits[1].position, 2u);
    EXPECT_EQ(hits[2].position, 1u);
    EXPECT_LE(hits[0].distance, hits[1].distance);
    EXPECT_LE(hits[1].distance, hits[2].distance);
}

TEST_F(QueryResolverTest, TopKIsClampedToIndexSize) {
    const auto hits = resolve_query({0.0f, 1.0f}, artifact_, nullptr, 50);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits.back().rank, 3u);
}

TEST_F(QueryResolverTest, NonPositiveTopKIsConfigurationError) {
    EXPECT_THROW(resolve_query({1.0f, 0.0f}, artifact_, nullptr, 0), core::ConfigurationError);
    EXPECT_THROW(resolve_query({1.0f, 0.0f}, artifact_, nullptr, -1), core::ConfigurationError);
}

TEST_F(QueryResolverTest, MissingArtifactIsNotFound) {
    EXPECT_THROW(resolve_query({1.0f, 0.0f}, dir_ / "nope.ridx", nullptr, 1), core::NotFoundError);
}

TEST_F(QueryResolverTest, EmptyArtifactIsNotFound) {
    const fs::path empty = dir_ / "empty.ridx";
    knn::VectorIndex(4).save(empty.string());
    EXPECT_THROW(resolve_query({1.0f, 0.0f, 0.0f, 0.0f}, empty, nullptr, 1), core::NotFoundError);
}

TEST_F(QueryResolverTest, DimensionMismatchReportsBothSizes) {
    try {
        resolve_query({1.0f, 0.0f, 0.0f}, artifact_, nullptr, 1);
        FAIL() << "expected DimensionMismatchError";
    } catch (const core::DimensionMismatchError& e) {
        EXPECT_EQ(e.expected(), 2u);
        EXPECT_EQ(e.actual(), 3u);
    }
}

TEST_F(QueryResolverTest, PositionsBeyondMappedRowsStayUnresolved) {
    seed_store(2);
    ProfileStore st = ProfileStore::open(db());

    const auto hits = resolve_query({0.6f, 0.8f}, artifact_, &st, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].position, 2u);
    EXPECT_FALSE(hits[0].profile.has_value());
}

TEST_F(QueryResolverTest, UnknownArtifactResolvesNothing) {
    seed_store(3);
    ProfileStore st = ProfileStore::open(db());

    knn::IndexBuilder other(dir_ / "other");
    const fs::path stray = other.build({{1.0f, 0.0f}});
    const auto hits = resolve_query({1.0f, 0.0f}, stray, &st, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_FALSE(hits[0].profile.has_value());
}

TEST_F(QueryResolverTest, RelativeArtifactPathMatchesStoredReference) {
    seed_store(3);
    ProfileStore st = ProfileStore::open(db());

    const fs::path dotted = artifact_.parent_path() / "." / artifact_.filename();
    const auto hits = resolve_query({0.0f, 1.0f}, dotted, &st, 1);
    ASSERT_TRUE(hits[0].profile.has_value());
    EXPECT_EQ(hits[0].profile->external_id, "person-1");
}

TEST_F(QueryResolverTest, MissingStorePathLeavesResultsUnresolved) {
    const std::optional<fs::path> store_path = dir_ / "absent.db";
    const auto hits = resolve_query({1.0f, 0.0f}, artifact_, store_path, 2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_FALSE(hits[0].profile.has_value());
    EXPECT_FALSE(fs::exists(dir_ / "absent.db"));
}

TEST_F(QueryResolverTest, StorePathOverloadResolvesRows) {
    seed_store(3);
    const std::optional<fs::path> store_path = db();
    const auto hits = resolve_query({0.6f, 0.8f}, artifact_, store_path, 1);
    ASSERT_TRUE(hits[0].profile.has_value());
    EXPECT_EQ(hits[0].profile->external_id, "person-2");
}

TEST_F(QueryResolverTest, ForeignDatabaseIsNotModified) {
    testutil::exec_raw_sql(db(), "CREATE TABLE unrelated (x INTEGER);");

    const std::optional<fs::path> store_path = db();
    const auto hits = resolve_query({1.0f, 0.0f}, artifact_, store_path, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].position, 0u);
    EXPECT_FALSE(hits[0].profile.has_value());

    EXPECT_EQ(testutil::schema_names(db()), (std::vector<std::string>{"unrelated"}));
}

TEST_F(QueryResolverTest, ReadOnlyStoreFileStillResolves) {
    seed_store(3);
    fs::permissions(db(), fs::perms::owner_read | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    const std::optional<fs::path> store_path = db();
    const auto hits = resolve_query({0.0f, 1.0f}, artifact_, store_path, 1);
    ASSERT_TRUE(hits[0].profile.has_value());
    EXPECT_EQ(hits[0].profile->external_id, "person-1");

    fs::permissions(db(), fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
}
