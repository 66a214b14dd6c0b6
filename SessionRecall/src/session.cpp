#include "../include/recall/session.hpp"

#include "../include/recall/text.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace recall {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& year, unsigned& month, unsigned& day) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

bool is_leap(std::int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(std::int64_t year, unsigned month) {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

class Cursor {
public:
    explicit Cursor(const std::string& text) : m_text(text) {}

    bool done() const noexcept { return m_pos >= m_text.size(); }
    char peek() const noexcept { return done() ? '\0' : m_text[m_pos]; }
    void advance() noexcept { ++m_pos; }

    bool consume(char expected) noexcept {
        if (peek() != expected) {
            return false;
        }
        ++m_pos;
        return true;
    }

    std::optional<unsigned> digits(std::size_t count) {
        if (m_pos + count > m_text.size()) {
            return std::nullopt;
        }
        unsigned value = 0;
        for (std::size_t i = 0; i < count; ++i) {
            const char c = m_text[m_pos + i];
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        m_pos += count;
        return value;
    }

private:
    const std::string& m_text;
    std::size_t m_pos = 0;
};

std::vector<std::string> string_array(const Json* value) {
    std::vector<std::string> result;
    if (!value || !value->is_array()) {
        return result;
    }
    for (const auto& entry : value->as_array()) {
        if (entry.is_string()) {
            result.push_back(entry.as_string());
        }
    }
    return result;
}

} // namespace

std::optional<TimePoint> parse_timestamp(const std::string& raw) {
    const std::string text = strip(raw);
    if (text.empty()) {
        return std::nullopt;
    }
    Cursor cursor(text);

    const auto year = cursor.digits(4);
    if (!year || !cursor.consume('-')) {
        return std::nullopt;
    }
    const auto month = cursor.digits(2);
    if (!month || *month < 1 || *month > 12 || !cursor.consume('-')) {
        return std::nullopt;
    }
    const auto day = cursor.digits(2);
    if (!day || *day < 1 || *day > days_in_month(*year, *month)) {
        return std::nullopt;
    }

    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    std::chrono::nanoseconds fraction{0};
    std::chrono::minutes offset{0};

    if (!cursor.done()) {
        if (!cursor.consume('T') && !cursor.consume('t') && !cursor.consume(' ')) {
            return std::nullopt;
        }
        const auto h = cursor.digits(2);
        if (!h || *h > 23 || !cursor.consume(':')) {
            return std::nullopt;
        }
        const auto m = cursor.digits(2);
        if (!m || *m > 59) {
            return std::nullopt;
        }
        hour = *h;
        minute = *m;
        if (cursor.consume(':')) {
            const auto s = cursor.digits(2);
            if (!s || *s > 60) {
                return std::nullopt;
            }
            second = *s;
            if (cursor.consume('.') || cursor.consume(',')) {
                std::int64_t nanos = 0;
                int places = 0;
                while (!cursor.done() && std::isdigit(static_cast<unsigned char>(cursor.peek()))) {
                    if (places < 9) {
                        nanos = nanos * 10 + (cursor.peek() - '0');
                        ++places;
                    }
                    cursor.advance();
                }
                if (places == 0) {
                    return std::nullopt;
                }
                for (; places < 9; ++places) {
                    nanos *= 10;
                }
                fraction = std::chrono::nanoseconds(nanos);
            }
        }

        if (cursor.consume('Z') || cursor.consume('z')) {
            // UTC
        } else if (cursor.peek() == '+' || cursor.peek() == '-') {
            const bool negative = cursor.peek() == '-';
            cursor.advance();
            const auto oh = cursor.digits(2);
            if (!oh || *oh > 23) {
                return std::nullopt;
            }
            cursor.consume(':');
            const auto om = cursor.digits(2);
            if (!om || *om > 59) {
                return std::nullopt;
            }
            offset = std::chrono::hours(*oh) + std::chrono::minutes(*om);
            if (negative) {
                offset = -offset;
            }
        }
        if (!cursor.done()) {
            return std::nullopt;
        }
    }

    const std::int64_t days = days_from_civil(*year, *month, *day);
    const std::chrono::seconds whole = std::chrono::hours(days * 24) + std::chrono::hours(hour)
                                       + std::chrono::minutes(minute) + std::chrono::seconds(second) - offset;

    // Clock::duration may be nanoseconds, which spans only a few centuries
    // around 1970. Dates outside it are unrepresentable.
    const auto earliest = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::min().time_since_epoch());
    const auto latest = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::max().time_since_epoch());
    if (whole <= earliest || whole >= latest) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::duration_cast<Clock::duration>(whole)
                     + std::chrono::duration_cast<Clock::duration>(fraction));
}

std::string format_timestamp(TimePoint time) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch());
    std::int64_t millis = since_epoch.count();
    std::int64_t days = millis / 86400000;
    std::int64_t remainder = millis % 86400000;
    if (remainder < 0) {
        remainder += 86400000;
        --days;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-' << std::setw(2) << day
        << 'T' << std::setw(2) << remainder / 3600000 << ':' << std::setw(2) << (remainder / 60000) % 60 << ':'
        << std::setw(2) << (remainder / 1000) % 60 << '.' << std::setw(3) << remainder % 1000 << 'Z';
    return oss.str();
}

MessageType parse_message_type(const std::string& name) {
    if (name == "question") return MessageType::Question;
    if (name == "request") return MessageType::Request;
    if (name == "feedback") return MessageType::Feedback;
    return MessageType::Statement;
}

std::string message_type_to_string(MessageType type) {
    switch (type) {
    case MessageType::Question: return "question";
    case MessageType::Request: return "request";
    case MessageType::Feedback: return "feedback";
    case MessageType::Statement: return "statement";
    }
    return "statement";
}

Conversation conversation_from_json(const Json& value) {
    Conversation conversation;
    conversation.message = value.string_at("message").value_or(std::string());
    conversation.type = parse_message_type(value.string_at("type").value_or(std::string()));
    return conversation;
}

Observation observation_from_json(const Json& value) {
    Observation observation;
    observation.tool = value.string_at("tool").value_or(std::string());
    observation.summary = value.string_at("summary").value_or(std::string());
    if (const Json* details = value.find("details"); details && details->is_object()) {
        observation.details.file = details->string_at("file");
        observation.details.command = details->string_at("command");
        observation.details.success = details->bool_at("success");
    }
    if (const Json* context = value.find("context"); context && context->is_object()) {
        observation.last_user_message = context->string_at("lastUserMessage");
    }
    return observation;
}

SessionRecord session_from_json(const Json& value) {
    SessionRecord session;
    if (!value.is_object()) {
        return session;
    }
    session.timestamp = value.string_at("date").value_or(value.string_at("timestamp").value_or(std::string()));
    session.project = value.string_at("project").value_or(std::string());
    session.summary = value.string_at("summary").value_or(std::string());
    session.summary_type = value.string_at("summary_type").value_or(std::string());
    session.keywords = string_array(value.find("keywords"));

    if (const Json* conversations = value.find("conversations"); conversations && conversations->is_array()) {
        for (const auto& entry : conversations->as_array()) {
            if (entry.is_object()) {
                session.conversations.push_back(conversation_from_json(entry));
            }
        }
    }
    if (const Json* observations = value.find("observations"); observations && observations->is_array()) {
        for (const auto& entry : observations->as_array()) {
            if (entry.is_object()) {
                session.observations.push_back(observation_from_json(entry));
            }
        }
    }
    session.observation_count = session.observations.size();
    if (auto count = value.number_at("observation_count"); count && *count >= 0.0 && *count < 1e9) {
        session.observation_count = static_cast<std::size_t>(*count);
    }
    return session;
}

} // namespace recall
