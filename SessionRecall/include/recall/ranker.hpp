#pragma once

#include "session.hpp"
#include "tfidf.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace recall {

// Fusion weights. similarity and time weight are scaled; the conversation
// bonus is added as is, so the three sum to 1.0 at their maxima.
inline constexpr double kSimilarityWeight = 0.4;
inline constexpr double kTimeWeight = 0.45;
inline constexpr double kConversationBonus = 0.15;

inline constexpr double kFreshWindowHours = 24.0;
inline constexpr double kDecayDays = 14.0;

inline constexpr std::size_t kDefaultKeywordLimit = 50;

// Context document: path keywords of the working directory followed by those
// of every recent file.
Document context_tokens(const CurrentContext& context);

// Session document: summary, conversation messages, then per observation its
// summary, file path, command and the user message that triggered it.
Document session_tokens(const SessionRecord& session);

// Distinct keywords in first-seen order, capped at limit. Sources are
// conversation messages, then observation summaries, file paths and commands.
std::vector<std::string> session_keywords(const std::vector<Observation>& observations,
                                          const std::vector<Conversation>& conversations,
                                          std::size_t limit = kDefaultKeywordLimit);

// Recency weight from hours elapsed. Up to 24 hours the weight falls linearly
// from 1.0 to 0.5; after that it jumps to exp(-days / 14) and decays from
// about 0.93. The jump is intentional: sessions from the same day win.
double time_weight(double hours_elapsed);

// Missing timestamps are treated as maximally stale and weigh 0.
double time_weight(const std::optional<TimePoint>& timestamp, TimePoint now);

double structural_bonus(const SessionRecord& session);

// similarity * 0.4 + time_weight * 0.45 + bonus, clamped to at most 1.0.
double fuse_score(double similarity, double recency, double bonus);

// Ranks every session of the corpus against the context, most relevant first.
// Sessions with equal scores keep their corpus order. The returned entries
// point into corpus, which must outlive them.
std::vector<ScoredSession> rank_sessions(const CurrentContext& context,
                                         const std::vector<SessionRecord>& corpus,
                                         TimePoint now);
std::vector<ScoredSession> rank_sessions(const CurrentContext& context,
                                         const std::vector<SessionRecord>& corpus);

} // namespace recall
