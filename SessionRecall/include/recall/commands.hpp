#pragma once

#include "settings.hpp"
#include "summarizer.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>

namespace recall {

// Hook request for "recall context": {"cwd": ..., "recent_files": [...]}.
// Ranks the stored sessions against it and writes the selected ones to out.
void run_context(const RecallSettings& settings, std::istream& in, std::ostream& out);

// Hook request for "recall summarize": {"cwd": ..., "observations": [...],
// "conversations": [...]}. Writes the summary, its kind and keywords to out.
void run_summarize(Summarizer& summarizer, std::istream& in, std::ostream& out);

// "recall search <query>": stored sessions mentioning query, newest first,
// at most kSearchResultLimit of them with the total match count.
void run_search(const RecallSettings& settings, const std::string& query, std::ostream& out);

// "recall timeline [n]": the n most recent stored sessions.
void run_timeline(const RecallSettings& settings, std::size_t count, std::ostream& out);

// Timeline length from a command-line argument. Missing, malformed or
// non-positive values give kDefaultTimelineLength.
std::size_t parse_timeline_length(const std::string& argument);

// Project name for a working directory: its last non-empty path segment.
std::string project_name(const std::string& working_directory);

} // namespace recall
