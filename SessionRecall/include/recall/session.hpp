#pragma once

#include "json.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace recall {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class MessageType {
    Question,
    Request,
    Feedback,
    Statement
};

struct Conversation {
    std::string message;
    MessageType type = MessageType::Statement;
};

struct ObservationDetails {
    std::optional<std::string> file;
    std::optional<std::string> command;
    std::optional<bool> success;
};

struct Observation {
    std::string tool;
    std::string summary;
    ObservationDetails details;
    // Last user message seen in the transcript when the tool ran.
    std::optional<std::string> last_user_message;
};

// One recorded unit of past work. The ranking engine reads it and never
// modifies it.
struct SessionRecord {
    std::string timestamp;
    std::string project;
    std::string summary;
    std::string summary_type;
    std::vector<Conversation> conversations;
    std::vector<Observation> observations;
    std::vector<std::string> keywords;
    // Observations recorded in the session; the stored list may be truncated.
    std::size_t observation_count = 0;
};

struct CurrentContext {
    std::string working_directory;
    std::vector<std::string> recent_files;
};

struct ScoredSession {
    const SessionRecord* session = nullptr;
    std::size_t corpus_index = 0;
    double similarity = 0.0;
    double time_weight = 0.0;
    double structural_bonus = 0.0;
    double score = 0.0;
};

// Parses ISO-8601 date-times such as "2024-05-01T10:20:30Z",
// "2024-05-01T10:20:30.123+09:00" or "2024-05-01". Returns std::nullopt for
// anything else.
std::optional<TimePoint> parse_timestamp(const std::string& text);

// UTC, millisecond precision, trailing 'Z'.
std::string format_timestamp(TimePoint time);

MessageType parse_message_type(const std::string& name);
std::string message_type_to_string(MessageType type);

// Lenient decoders: absent or mistyped members become empty values.
Conversation conversation_from_json(const Json& value);
Observation observation_from_json(const Json& value);
SessionRecord session_from_json(const Json& value);

} // namespace recall
