#include "recall/corpus.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace recall;
namespace fs = std::filesystem;

class CorpusTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("recall-corpus-" + std::to_string(stamp));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream out(dir_ / name, std::ios::binary);
        out << content;
    }
};

TEST_F(CorpusTest, MissingDirectoryYieldsEmptyCorpus) {
    EXPECT_TRUE(load_corpus(dir_ / "absent").empty());
}

TEST_F(CorpusTest, LoadsFilesInNameOrderAndTagsProject) {
    write("web.json", R"({"project": "web", "sessions": [{"date": "2024-05-02", "summary": "css"}]})");
    write("api.json", R"({"project": "api", "sessions": [
        {"date": "2024-05-01", "summary": "routes", "project": "other"},
        {"date": "2024-05-03", "summary": "auth"}
    ]})");
    write("notes.txt", "not a memory file");

    const auto corpus = load_corpus(dir_);
    ASSERT_EQ(corpus.size(), 3u);
    EXPECT_EQ(corpus[0].project, "api");
    EXPECT_EQ(corpus[0].summary, "routes");
    EXPECT_EQ(corpus[1].summary, "auth");
    EXPECT_EQ(corpus[2].project, "web");
    EXPECT_EQ(corpus[2].timestamp, "2024-05-02");
}

TEST_F(CorpusTest, SkipsMalformedFiles) {
    write("a.json", R"({"project": "a", "sessions": [{"summary": "kept"}]})");
    write("b.json", R"({"project": "b", "sessions": [)");
    write("c.json", R"(["not", "an", "object"])");

    const auto corpus = load_corpus(dir_);
    ASSERT_EQ(corpus.size(), 1u);
    EXPECT_EQ(corpus[0].summary, "kept");
}

TEST_F(CorpusTest, ProjectDefaultsToFileStem) {
    write("billing.json", R"({"sessions": [{"summary": "invoices"}, 7]})");
    const auto sessions = load_project_sessions(dir_ / "billing.json");
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].project, "billing");
}

TEST_F(CorpusTest, LoadProjectSessionsThrowsOnBadFiles) {
    write("bad.json", "{");
    EXPECT_THROW(load_project_sessions(dir_ / "bad.json"), std::runtime_error);
    EXPECT_THROW(load_project_sessions(dir_ / "missing.json"), std::runtime_error);
}
