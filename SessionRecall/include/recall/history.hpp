#pragma once

#include "session.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace recall {

inline constexpr std::size_t kSearchResultLimit = 10;
inline constexpr std::size_t kMatchedObservationLimit = 3;
inline constexpr std::size_t kDefaultTimelineLength = 10;
inline constexpr std::size_t kMaxTimelineLength = 20;

// Sessions newest first. Sessions whose timestamp cannot be parsed follow in
// corpus order.
std::vector<const SessionRecord*> sessions_by_recency(const std::vector<SessionRecord>& corpus);

struct SearchHit {
    const SessionRecord* session = nullptr;
    // Observations whose summary or triggering user message mention the query.
    std::vector<const Observation*> matched_observations;
};

// Case-insensitive substring search over summaries, keywords and observation
// summaries, files, commands and user messages. Every match is returned,
// newest first. An empty query matches nothing.
std::vector<SearchHit> search_sessions(const std::vector<SessionRecord>& corpus, const std::string& query);

// The requested number of most recent sessions, at most kMaxTimelineLength.
std::vector<const SessionRecord*> recent_sessions(const std::vector<SessionRecord>& corpus, std::size_t count);

} // namespace recall
