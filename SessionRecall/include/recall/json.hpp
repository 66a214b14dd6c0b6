#pragma once

#include <string>
#include <string_view>
#include <map>
#include <vector>
#include <variant>
#include <optional>
#include <sstream>

namespace recall {

class Json;

using JsonObject = std::map<std::string, Json>;
using JsonArray = std::vector<Json>;

class Json {
public:
    using Value = std::variant<std::nullptr_t, bool, double, std::string, JsonArray, JsonObject>;

    Json() : m_value(nullptr) {}
    Json(std::nullptr_t) : m_value(nullptr) {}
    Json(bool b) : m_value(b) {}
    Json(double d) : m_value(d) {}
    Json(int i) : m_value(static_cast<double>(i)) {}
    Json(std::size_t n) : m_value(static_cast<double>(n)) {}
    Json(std::string s) : m_value(std::move(s)) {}
    Json(const char* s) : m_value(std::string(s)) {}
    Json(JsonArray arr) : m_value(std::move(arr)) {}
    Json(JsonObject obj) : m_value(std::move(obj)) {}

    const Value& value() const noexcept { return m_value; }

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(m_value); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(m_value); }
    bool is_number() const noexcept { return std::holds_alternative<double>(m_value); }
    bool is_object() const noexcept { return std::holds_alternative<JsonObject>(m_value); }
    bool is_array() const noexcept { return std::holds_alternative<JsonArray>(m_value); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(m_value); }

    bool as_bool() const { return std::get<bool>(m_value); }
    double as_number() const { return std::get<double>(m_value); }
    const JsonObject& as_object() const { return std::get<JsonObject>(m_value); }
    const JsonArray& as_array() const { return std::get<JsonArray>(m_value); }
    const std::string& as_string() const { return std::get<std::string>(m_value); }

    JsonObject& as_object() { return std::get<JsonObject>(m_value); }
    JsonArray& as_array() { return std::get<JsonArray>(m_value); }

    // Member lookup on objects. Returns nullptr for non-objects and missing keys.
    const Json* find(const std::string& key) const;

    // Typed member accessors; absent or mistyped members yield std::nullopt.
    std::optional<std::string> string_at(const std::string& key) const;
    std::optional<double> number_at(const std::string& key) const;
    std::optional<bool> bool_at(const std::string& key) const;

    std::string dump() const {
        std::ostringstream oss;
        dump_internal(oss);
        return oss.str();
    }

    static Json parse(std::string_view text);

private:
    Value m_value;

    void dump_internal(std::ostringstream& oss) const;
    static void skip_ws(std::string_view text, std::size_t& pos);
    static Json parse_value(std::string_view text, std::size_t& pos);
    static Json parse_number(std::string_view text, std::size_t& pos);
    static Json parse_string(std::string_view text, std::size_t& pos);
    static Json parse_array(std::string_view text, std::size_t& pos);
    static Json parse_object(std::string_view text, std::size_t& pos);
};

} // namespace recall
