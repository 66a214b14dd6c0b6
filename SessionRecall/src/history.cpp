#include "../include/recall/history.hpp"

#include "../include/recall/text.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace recall {

namespace {

bool observation_mentions(const Observation& observation, const std::string& needle) {
    if (contains_lowered(observation.summary, needle)) {
        return true;
    }
    if (observation.details.file && contains_lowered(*observation.details.file, needle)) {
        return true;
    }
    if (observation.details.command && contains_lowered(*observation.details.command, needle)) {
        return true;
    }
    return observation.last_user_message && contains_lowered(*observation.last_user_message, needle);
}

bool session_mentions(const SessionRecord& session, const std::string& needle) {
    if (contains_lowered(session.summary, needle)) {
        return true;
    }
    const bool in_keywords = std::any_of(session.keywords.begin(), session.keywords.end(), [&](const std::string& keyword) {
        return contains_lowered(keyword, needle);
    });
    if (in_keywords) {
        return true;
    }
    return std::any_of(session.observations.begin(), session.observations.end(), [&](const Observation& observation) {
        return observation_mentions(observation, needle);
    });
}

} // namespace

std::vector<const SessionRecord*> sessions_by_recency(const std::vector<SessionRecord>& corpus) {
    struct Dated {
        const SessionRecord* session;
        std::optional<TimePoint> time;
    };
    std::vector<Dated> dated;
    dated.reserve(corpus.size());
    for (const auto& session : corpus) {
        dated.push_back({&session, parse_timestamp(session.timestamp)});
    }
    std::stable_sort(dated.begin(), dated.end(), [](const Dated& a, const Dated& b) {
        if (!a.time || !b.time) {
            return a.time.has_value() && !b.time.has_value();
        }
        return *a.time > *b.time;
    });

    std::vector<const SessionRecord*> ordered;
    ordered.reserve(dated.size());
    for (const auto& entry : dated) {
        ordered.push_back(entry.session);
    }
    return ordered;
}

std::vector<SearchHit> search_sessions(const std::vector<SessionRecord>& corpus, const std::string& query) {
    std::vector<SearchHit> hits;
    const std::string needle = lower_ascii(strip(query));
    if (needle.empty()) {
        return hits;
    }

    for (const SessionRecord* session : sessions_by_recency(corpus)) {
        if (!session_mentions(*session, needle)) {
            continue;
        }
        SearchHit hit;
        hit.session = session;
        for (const auto& observation : session->observations) {
            if (hit.matched_observations.size() >= kMatchedObservationLimit) {
                break;
            }
            const bool matched = contains_lowered(observation.summary, needle)
                                 || (observation.last_user_message && contains_lowered(*observation.last_user_message, needle));
            if (matched) {
                hit.matched_observations.push_back(&observation);
            }
        }
        hits.push_back(std::move(hit));
    }
    return hits;
}

std::vector<const SessionRecord*> recent_sessions(const std::vector<SessionRecord>& corpus, std::size_t count) {
    std::vector<const SessionRecord*> ordered = sessions_by_recency(corpus);
    const std::size_t limit = std::min(count, kMaxTimelineLength);
    if (ordered.size() > limit) {
        ordered.resize(limit);
    }
    return ordered;
}

} // namespace recall
