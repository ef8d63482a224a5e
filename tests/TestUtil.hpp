#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <sqlite3.h>
#include <unistd.h>

#include "emb/EmbeddingProvider.hpp"
#include "profile/Models.hpp"

namespace testutil {

// Fresh directory per test, removed afterwards.
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("resume_index_") + info->test_suite_name() + "_" + info->name() + "_" +
                std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

// Runs sql against a database file directly, bypassing ProfileStore.
inline void exec_raw_sql(const std::filesystem::path& db, const std::string& sql) {
    sqlite3* raw = nullptr;
    ASSERT_EQ(sqlite3_open(db.string().c_str(), &raw), SQLITE_OK);
    char* err = nullptr;
    const int rc = sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, &err);
    const std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(raw);
    ASSERT_EQ(rc, SQLITE_OK) << msg;
}

// First column of every row sql returns, read over a read-only connection.
inline std::vector<std::string> query_strings(const std::filesystem::path& db, const std::string& sql) {
    std::vector<std::string> names;
    sqlite3* raw = nullptr;
    if (sqlite3_open_v2(db.string().c_str(), &raw, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        sqlite3_close(raw);
        return names;
    }
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(raw, sql.c_str(), -1, &st, nullptr) == SQLITE_OK) {
        while (sqlite3_step(st) == SQLITE_ROW) {
            const unsigned char* txt = sqlite3_column_text(st, 0);
            names.emplace_back(txt ? reinterpret_cast<const char*>(txt) : "");
        }
    }
    sqlite3_finalize(st);
    sqlite3_close(raw);
    return names;
}

inline std::vector<std::string> schema_names(const std::filesystem::path& db) {
    return query_strings(db, "SELECT name FROM sqlite_master ORDER BY name");
}

inline profile::ResumeProfile sample_profile(const std::string& full_name) {
    profile::ResumeProfile p;
    p.personal_information.full_name = full_name;
    p.personal_information.headline = "Senior Software Engineer at Stealth Startup";
    p.personal_information.location = "San Francisco, CA";
    p.personal_information.linkedin_url = "https://www.linkedin.com/in/example";
    p.skills.top_skills = {"JavaScript", "Node.js", "React.js"};
    p.skills.languages = {"English"};

    profile::ExperienceEntry e1;
    e1.company = "Stealth";
    e1.title = "Software Engineer";
    e1.start_date = "Nov 2022";
    e1.end_date = "Present";
    e1.location = "Remote";

    profile::ExperienceEntry e2;
    e2.company = "Tesla";
    e2.title = "Senior Software Engineer";
    e2.start_date = "Feb 2021";
    e2.end_date = "Nov 2022";
    e2.location = "Palo Alto, CA";
    p.experience = {e1, e2};

    profile::EducationEntry ed;
    ed.institution = "UIUC";
    ed.degree = "B.S.";
    ed.field_of_study = "Computer Science";
    ed.start_year = "2011";
    ed.end_year = "2015";
    p.education = {ed};
    return p;
}

// Name + one skill, so different names flatten to different texts.
inline profile::ResumeProfile tiny_profile(const std::string& full_name, const std::string& skill) {
    profile::ResumeProfile p;
    p.personal_information.full_name = full_name;
    p.skills.top_skills = {skill};
    return p;
}

// Looks texts up in a fixed table; unknown text is a provider failure.
class TableProvider : public emb::EmbeddingProvider {
public:
    explicit TableProvider(std::map<std::string, std::vector<float>> table) : table_(std::move(table)) {}

    std::vector<emb::EmbeddingItem> embed_batch(const std::string&,
                                                const std::vector<std::string>& texts) override {
        ++calls;
        std::vector<emb::EmbeddingItem> items;
        for (size_t i = 0; i < texts.size(); ++i) {
            auto it = table_.find(texts[i]);
            if (it == table_.end()) throw std::runtime_error("no embedding for text: " + texts[i]);
            items.push_back({i, it->second});
        }
        return items;
    }

    int calls = 0;

private:
    std::map<std::string, std::vector<float>> table_;
};

// Embeds "t<N>" as {N, -N} and returns each batch in a shuffled order.
class ShufflingProvider : public emb::EmbeddingProvider {
public:
    explicit ShufflingProvider(unsigned seed) : rng_(seed) {}

    std::vector<emb::EmbeddingItem> embed_batch(const std::string&,
                                                const std::vector<std::string>& texts) override {
        batch_sizes.push_back(texts.size());
        std::vector<emb::EmbeddingItem> items;
        for (size_t i = 0; i < texts.size(); ++i) {
            const float n = std::stof(texts[i].substr(1));
            items.push_back({i, {n, -n}});
        }
        std::shuffle(items.begin(), items.end(), rng_);
        return items;
    }

    std::vector<size_t> batch_sizes;

private:
    std::mt19937 rng_;
};

} // namespace testutil
