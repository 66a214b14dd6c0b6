#include "../include/recall/settings.hpp"

#include "../include/recall/text.hpp"

#include <cmath>
#include <cstdlib>
#include <memory>
#include <stdexcept>

namespace recall {

namespace {

std::optional<std::size_t> parse_size_env(const char* name) {
    if (auto raw = read_env(name)) {
        const std::string value = strip(*raw);
        if (value.empty() || value.front() == '-' || value.front() == '+') {
            return std::nullopt;
        }
        try {
            std::size_t consumed = 0;
            const unsigned long long parsed = std::stoull(value, &consumed);
            if (consumed == value.size()) {
                return static_cast<std::size_t>(parsed);
            }
        } catch (const std::logic_error&) {
        }
    }
    return std::nullopt;
}

std::optional<double> parse_double_env(const char* name) {
    if (auto raw = read_env(name)) {
        const std::string value = strip(*raw);
        try {
            std::size_t consumed = 0;
            const double parsed = std::stod(value, &consumed);
            if (consumed == value.size() && std::isfinite(parsed)) {
                return parsed;
            }
        } catch (const std::logic_error&) {
        }
    }
    return std::nullopt;
}

std::filesystem::path default_data_dir() {
    if (auto home = read_env("HOME")) {
        return std::filesystem::path(*home) / ".session-recall";
    }
    if (auto profile = read_env("USERPROFILE")) {
        return std::filesystem::path(*profile) / ".session-recall";
    }
    return std::filesystem::path(".session-recall");
}

} // namespace

std::optional<std::string> read_env(const char* name) {
#ifdef _WIN32
    size_t required = 0;
    char* buffer = nullptr;
    if (_dupenv_s(&buffer, &required, name) != 0) {
        return std::nullopt;
    }
    std::unique_ptr<char, decltype(&std::free)> holder(buffer, &std::free);
    if (!buffer || *buffer == '\0') {
        return std::nullopt;
    }
    return std::string(buffer);
#else
    if (const char* value = std::getenv(name); value && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
#endif
}

RecallSettings resolve_settings() {
    RecallSettings settings;
    settings.data_dir = default_data_dir();
    if (auto dir = read_env("RECALL_DATA_DIR")) {
        settings.data_dir = *dir;
    }

    if (auto min_score = parse_double_env("RECALL_MIN_SCORE")) {
        settings.selection.min_score = *min_score;
    }
    if (auto max_sessions = parse_size_env("RECALL_MAX_SESSIONS")) {
        settings.selection.max_results = *max_sessions;
    }
    if (auto fallback = parse_size_env("RECALL_FALLBACK_SESSIONS")) {
        settings.selection.fallback_results = *fallback;
    }

    if (auto key = read_env("ANTHROPIC_API_KEY")) {
        settings.summary.api_key = *key;
    }
    if (auto endpoint = read_env("RECALL_SUMMARY_ENDPOINT")) {
        settings.summary.endpoint = *endpoint;
    }
    if (auto model = read_env("RECALL_SUMMARY_MODEL")) {
        settings.summary.model = *model;
    }
    if (auto max_tokens = parse_size_env("RECALL_SUMMARY_MAX_TOKENS"); max_tokens && *max_tokens > 0) {
        settings.summary.max_tokens = *max_tokens;
    }
    if (auto timeout = parse_size_env("RECALL_HTTP_TIMEOUT_MS"); timeout && *timeout > 0) {
        settings.summary.timeout_ms = static_cast<long>(*timeout);
    }
    return settings;
}

} // namespace recall
