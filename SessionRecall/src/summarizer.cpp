#include "../include/recall/summarizer.hpp"

#include "../include/recall/json.hpp"
#include "../include/recall/log.hpp"
#include "../include/recall/net/http.hpp"
#include "../include/recall/text.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace recall {

namespace {

constexpr std::size_t kMaxListedFiles = 5;
constexpr std::size_t kMaxListedCommands = 2;
constexpr std::size_t kCommandPreviewLength = 30;
constexpr std::size_t kQuestionPreviewLength = 50;

constexpr std::array<const char*, 5> kNotableCommands = {"git", "npm", "yarn", "pip", "docker"};

std::string base_name(const std::string& path) {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool is_notable_command(const std::string& command) {
    const std::string program = command.substr(0, command.find(' '));
    return std::find(kNotableCommands.begin(), kNotableCommands.end(), program) != kNotableCommands.end();
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << parts[i];
    }
    return oss.str();
}

} // namespace

std::string summary_kind_to_string(SummaryKind kind) {
    switch (kind) {
    case SummaryKind::Ai:
        return "ai";
    case SummaryKind::Local:
        return "local";
    }
    return "local";
}

std::string LocalSummarizer::summarize(const SessionActivity& activity) {
    std::vector<std::pair<std::string, std::size_t>> tool_counts;
    std::vector<std::string> files;
    std::unordered_set<std::string> seen_files;
    std::vector<std::string> commands;
    std::vector<std::string> questions;
    bool failed = false;

    for (const auto& conversation : activity.conversations) {
        if (conversation.type == MessageType::Question) {
            questions.push_back(truncate_utf8(conversation.message, kQuestionPreviewLength));
        }
    }

    for (const auto& observation : activity.observations) {
        auto counted = std::find_if(tool_counts.begin(), tool_counts.end(), [&](const auto& entry) {
            return entry.first == observation.tool;
        });
        if (counted == tool_counts.end()) {
            tool_counts.emplace_back(observation.tool, 1);
        } else {
            ++counted->second;
        }

        if (observation.details.file) {
            std::string name = base_name(*observation.details.file);
            if (seen_files.insert(name).second) {
                files.push_back(std::move(name));
            }
        }

        if (observation.tool == "Bash" && observation.details.command && is_notable_command(*observation.details.command)) {
            commands.push_back(truncate_utf8(*observation.details.command, kCommandPreviewLength));
        }

        if (observation.details.success && !*observation.details.success) {
            failed = true;
        }
    }

    std::vector<std::string> tools;
    tools.reserve(tool_counts.size());
    for (const auto& [tool, count] : tool_counts) {
        tools.push_back(tool + "(" + std::to_string(count) + ")");
    }

    std::ostringstream summary;
    summary << "Tools: " << (tools.empty() ? std::string("none") : join(tools, ", "));

    if (!files.empty()) {
        const std::size_t listed = std::min(files.size(), kMaxListedFiles);
        summary << " | Files: " << join(std::vector<std::string>(files.begin(), files.begin() + static_cast<std::ptrdiff_t>(listed)), ", ");
        if (files.size() > kMaxListedFiles) {
            summary << " and " << (files.size() - kMaxListedFiles) << " more";
        }
    }

    if (!commands.empty()) {
        if (commands.size() > kMaxListedCommands) {
            commands.resize(kMaxListedCommands);
        }
        summary << " | Commands: " << join(commands, ", ");
    }

    if (failed) {
        summary << " | some steps failed";
    }

    if (!questions.empty()) {
        summary << " | Question: \"" << questions.front() << '"';
        if (questions.size() > 1) {
            summary << " and " << (questions.size() - 1) << " more";
        }
    }

    return summary.str();
}

RemoteSummarizer::RemoteSummarizer(SummaryServiceSettings settings)
    : m_settings(std::move(settings)) {
    if (m_settings.api_key.empty()) {
        throw std::invalid_argument("remote summarizer requires an API key");
    }
}

std::string RemoteSummarizer::build_request(const SessionActivity& activity) const {
    std::ostringstream conversations;
    for (const auto& conversation : activity.conversations) {
        conversations << "- [" << message_type_to_string(conversation.type) << "] \"" << conversation.message << "\"\n";
    }

    std::ostringstream observations;
    for (const auto& observation : activity.observations) {
        observations << "- [" << observation.tool << "] " << observation.summary << '\n';
        if (observation.last_user_message) {
            observations << "  user request: \"" << *observation.last_user_message << "\"\n";
        }
    }

    std::ostringstream prompt;
    prompt << "You summarize software development sessions.\n\n"
           << "Project: " << activity.project << "\n\n"
           << "Conversation in this session:\n"
           << (activity.conversations.empty() ? std::string("(no conversation)\n") : conversations.str())
           << "\nWork performed in this session:\n"
           << (activity.observations.empty() ? std::string("(no work)\n") : observations.str())
           << "\nSummarize the session in this format:\n"
           << "1. Main topic (1-2 sentences): what was discussed or worked on\n"
           << "2. Key questions: the important questions the user asked\n"
           << "3. Changes: what was changed or completed, if anything\n\n"
           << "Be brief and clear. Stay under 250 characters.";

    JsonObject message;
    message["role"] = Json("user");
    message["content"] = Json(prompt.str());

    JsonObject payload;
    payload["model"] = Json(m_settings.model);
    payload["max_tokens"] = Json(m_settings.max_tokens);
    payload["messages"] = Json(JsonArray{Json(message)});
    return Json(payload).dump();
}

std::string RemoteSummarizer::parse_response(const std::string& body) {
    const Json parsed = Json::parse(body);
    if (const Json* content = parsed.find("content"); content && content->is_array() && !content->as_array().empty()) {
        if (auto text = content->as_array().front().string_at("text")) {
            return strip(*text);
        }
    }
    throw std::runtime_error("[summary] response carries no content text");
}

std::string RemoteSummarizer::summarize(const SessionActivity& activity) {
    const net::HeaderList headers = {
        {"x-api-key", m_settings.api_key},
        {"anthropic-version", "2023-06-01"},
    };
    const std::string response = net::post_json(m_settings.endpoint, build_request(activity), headers, m_settings.timeout_ms);
    return parse_response(response);
}

SummarizerPtr make_summarizer(const RecallSettings& settings) {
    if (!settings.summary.api_key.empty()) {
        return std::make_unique<RemoteSummarizer>(settings.summary);
    }
    return std::make_unique<LocalSummarizer>();
}

Summary summarize_with_fallback(Summarizer& primary, const SessionActivity& activity) {
    try {
        std::string text = primary.summarize(activity);
        if (!text.empty()) {
            return Summary{std::move(text), primary.kind()};
        }
        log("Summarizer", "empty summary returned, using local digest");
    } catch (const std::exception& ex) {
        log("Summarizer", std::string("summary request failed, using local digest: ") + ex.what());
    }
    LocalSummarizer local;
    return Summary{local.summarize(activity), SummaryKind::Local};
}

} // namespace recall
