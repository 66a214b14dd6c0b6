#include "recall/settings.hpp"
#include <gtest/gtest.h>

#include <cstdlib>
#include <map>
#include <string>

using namespace recall;

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kVariables) {
            if (const char* value = std::getenv(name)) {
                saved_[name] = value;
            }
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
        for (const auto& [name, value] : saved_) {
            setenv(name.c_str(), value.c_str(), 1);
        }
    }

    static constexpr const char* kVariables[] = {
        "HOME",
        "RECALL_DATA_DIR",
        "RECALL_MIN_SCORE",
        "RECALL_MAX_SESSIONS",
        "RECALL_FALLBACK_SESSIONS",
        "ANTHROPIC_API_KEY",
        "RECALL_SUMMARY_ENDPOINT",
        "RECALL_SUMMARY_MODEL",
        "RECALL_SUMMARY_MAX_TOKENS",
        "RECALL_HTTP_TIMEOUT_MS",
    };

    std::map<std::string, std::string> saved_;
};

TEST_F(SettingsTest, Defaults) {
    setenv("HOME", "/home/tester", 1);
    const RecallSettings settings = resolve_settings();
    EXPECT_EQ(settings.data_dir, std::filesystem::path("/home/tester/.session-recall"));
    EXPECT_EQ(settings.memories_dir(), std::filesystem::path("/home/tester/.session-recall/memories"));
    EXPECT_DOUBLE_EQ(settings.selection.min_score, 0.1);
    EXPECT_EQ(settings.selection.max_results, 5u);
    EXPECT_EQ(settings.selection.fallback_results, 3u);
    EXPECT_TRUE(settings.summary.api_key.empty());
    EXPECT_EQ(settings.summary.endpoint, "https://api.anthropic.com/v1/messages");
    EXPECT_EQ(settings.summary.max_tokens, 300u);
    EXPECT_EQ(settings.summary.timeout_ms, 15000);
}

TEST_F(SettingsTest, EnvironmentOverrides) {
    setenv("RECALL_DATA_DIR", "/tmp/recall-data", 1);
    setenv("RECALL_MIN_SCORE", "0.25", 1);
    setenv("RECALL_MAX_SESSIONS", "8", 1);
    setenv("RECALL_FALLBACK_SESSIONS", "1", 1);
    setenv("ANTHROPIC_API_KEY", "secret", 1);
    setenv("RECALL_SUMMARY_MODEL", "custom-model", 1);
    setenv("RECALL_HTTP_TIMEOUT_MS", "2500", 1);

    const RecallSettings settings = resolve_settings();
    EXPECT_EQ(settings.data_dir, std::filesystem::path("/tmp/recall-data"));
    EXPECT_DOUBLE_EQ(settings.selection.min_score, 0.25);
    EXPECT_EQ(settings.selection.max_results, 8u);
    EXPECT_EQ(settings.selection.fallback_results, 1u);
    EXPECT_EQ(settings.summary.api_key, "secret");
    EXPECT_EQ(settings.summary.model, "custom-model");
    EXPECT_EQ(settings.summary.timeout_ms, 2500);
}

TEST_F(SettingsTest, InvalidValuesKeepDefaults) {
    setenv("RECALL_MIN_SCORE", "high", 1);
    setenv("RECALL_MAX_SESSIONS", "5x", 1);
    setenv("RECALL_SUMMARY_MAX_TOKENS", "0", 1);
    setenv("ANTHROPIC_API_KEY", "", 1);

    const RecallSettings settings = resolve_settings();
    EXPECT_DOUBLE_EQ(settings.selection.min_score, 0.1);
    EXPECT_EQ(settings.selection.max_results, 5u);
    EXPECT_EQ(settings.summary.max_tokens, 300u);
    EXPECT_TRUE(settings.summary.api_key.empty());
}

TEST_F(SettingsTest, PaddedValuesAreTrimmedAndNegativesRejected) {
    setenv("RECALL_MAX_SESSIONS", " -1", 1);
    setenv("RECALL_FALLBACK_SESSIONS", "  7 ", 1);
    setenv("RECALL_MIN_SCORE", " 0.3\t", 1);
    setenv("RECALL_SUMMARY_MAX_TOKENS", "+40", 1);

    const RecallSettings settings = resolve_settings();
    EXPECT_EQ(settings.selection.max_results, 5u);
    EXPECT_EQ(settings.selection.fallback_results, 7u);
    EXPECT_DOUBLE_EQ(settings.selection.min_score, 0.3);
    EXPECT_EQ(settings.summary.max_tokens, 300u);
}

TEST_F(SettingsTest, ReadEnvTreatsEmptyAsUnset) {
    setenv("RECALL_SUMMARY_MODEL", "", 1);
    EXPECT_FALSE(read_env("RECALL_SUMMARY_MODEL").has_value());
    setenv("RECALL_SUMMARY_MODEL", "m", 1);
    EXPECT_EQ(read_env("RECALL_SUMMARY_MODEL").value_or(""), "m");
}
