#pragma once

#include <string>
#include <string_view>

namespace recall {

// Local wall-clock time with millisecond precision, "YYYY-MM-DD HH:MM:SS.mmm".
std::string timestamp_now();

// Writes "[component timestamp] message" to stderr. Stdout is reserved for
// command output consumed by the host tool.
void log(std::string_view component, std::string_view message);

} // namespace recall
