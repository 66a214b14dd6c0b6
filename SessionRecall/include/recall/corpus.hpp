#pragma once

#include "session.hpp"

#include <filesystem>
#include <vector>

namespace recall {

// Reads one per-project memory file, {"project": ..., "sessions": [...]}.
// Every session is tagged with the file's project, falling back to the file
// stem when the file names none. Throws std::runtime_error when the file
// cannot be read or is not a JSON object.
std::vector<SessionRecord> load_project_sessions(const std::filesystem::path& file);

// Concatenates the sessions of every *.json file in memories_dir, files taken
// in name order. Unreadable or malformed files are logged and skipped; a
// missing directory yields an empty corpus.
std::vector<SessionRecord> load_corpus(const std::filesystem::path& memories_dir);

} // namespace recall
