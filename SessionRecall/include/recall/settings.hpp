#pragma once

#include "selection.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace recall {

struct SummaryServiceSettings {
    std::string api_key;
    std::string endpoint = "https://api.anthropic.com/v1/messages";
    std::string model = "claude-3-5-haiku-20241022";
    std::size_t max_tokens = 300;
    long timeout_ms = 15000;
};

struct RecallSettings {
    std::filesystem::path data_dir;
    SelectionPolicy selection;
    SummaryServiceSettings summary;

    std::filesystem::path memories_dir() const { return data_dir / "memories"; }
};

std::optional<std::string> read_env(const char* name);

// Defaults overridden by RECALL_* variables and ANTHROPIC_API_KEY. Unset,
// empty or unparsable values keep the default.
RecallSettings resolve_settings();

} // namespace recall
