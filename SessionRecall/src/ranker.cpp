#include "../include/recall/ranker.hpp"

#include "../include/recall/log.hpp"
#include "../include/recall/similarity.hpp"
#include "../include/recall/tokenizer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace recall {

namespace {

void append(Document& document, const std::vector<std::string>& tokens) {
    document.insert(document.end(), tokens.begin(), tokens.end());
}

void append_observation(Document& document, const Observation& observation) {
    append(document, tokenize(observation.summary));
    if (observation.details.file) {
        append(document, tokenize_path(*observation.details.file));
    }
    if (observation.details.command) {
        append(document, tokenize(*observation.details.command));
    }
    if (observation.last_user_message) {
        append(document, tokenize(*observation.last_user_message));
    }
}

ScoredSession score_session(const SessionRecord& session,
                            std::size_t index,
                            const Document& tokens,
                            const TermVector& context_vector,
                            const DocumentFrequency& df,
                            std::size_t total_documents,
                            TimePoint now) {
    ScoredSession scored;
    scored.session = &session;
    scored.corpus_index = index;
    scored.similarity = cosine_similarity(context_vector, tfidf(tokens, df, total_documents));
    scored.time_weight = time_weight(parse_timestamp(session.timestamp), now);
    scored.structural_bonus = structural_bonus(session);
    scored.score = fuse_score(scored.similarity, scored.time_weight, scored.structural_bonus);
    return scored;
}

} // namespace

Document context_tokens(const CurrentContext& context) {
    Document document = tokenize_path(context.working_directory);
    for (const auto& file : context.recent_files) {
        append(document, tokenize_path(file));
    }
    return document;
}

Document session_tokens(const SessionRecord& session) {
    Document document = tokenize(session.summary);
    for (const auto& conversation : session.conversations) {
        append(document, tokenize(conversation.message));
    }
    for (const auto& observation : session.observations) {
        append_observation(document, observation);
    }
    return document;
}

std::vector<std::string> session_keywords(const std::vector<Observation>& observations,
                                          const std::vector<Conversation>& conversations,
                                          std::size_t limit) {
    std::vector<std::string> keywords;
    std::unordered_set<std::string> seen;
    auto add_all = [&](const std::vector<std::string>& tokens) {
        for (const auto& token : tokens) {
            if (seen.insert(token).second) {
                keywords.push_back(token);
            }
        }
    };

    for (const auto& conversation : conversations) {
        add_all(tokenize(conversation.message));
    }
    for (const auto& observation : observations) {
        add_all(tokenize(observation.summary));
        if (observation.details.file) {
            add_all(tokenize_path(*observation.details.file));
        }
        if (observation.details.command) {
            add_all(tokenize(*observation.details.command));
        }
    }

    if (keywords.size() > limit) {
        keywords.resize(limit);
    }
    return keywords;
}

double time_weight(double hours_elapsed) {
    if (hours_elapsed <= kFreshWindowHours) {
        return 1.0 - hours_elapsed / (2.0 * kFreshWindowHours);
    }
    const double days = hours_elapsed / 24.0;
    return std::exp(-days / kDecayDays);
}

double time_weight(const std::optional<TimePoint>& timestamp, TimePoint now) {
    if (!timestamp) {
        return 0.0;
    }
    const std::chrono::duration<double, std::ratio<3600>> elapsed = now - *timestamp;
    if (!std::isfinite(elapsed.count())) {
        return 0.0;
    }
    return time_weight(elapsed.count());
}

double structural_bonus(const SessionRecord& session) {
    return session.conversations.empty() ? 0.0 : kConversationBonus;
}

double fuse_score(double similarity, double recency, double bonus) {
    const double fused = similarity * kSimilarityWeight + recency * kTimeWeight + bonus;
    return std::min(fused, 1.0);
}

std::vector<ScoredSession> rank_sessions(const CurrentContext& context,
                                         const std::vector<SessionRecord>& corpus,
                                         TimePoint now) {
    std::vector<ScoredSession> ranking;
    if (corpus.empty()) {
        return ranking;
    }

    const Document context_document = context_tokens(context);

    std::vector<Document> documents;
    documents.reserve(corpus.size() + 1);
    documents.push_back(context_document);
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        try {
            documents.push_back(session_tokens(corpus[i]));
        } catch (const std::exception& ex) {
            log("Ranker", "failed to tokenize session " + std::to_string(i) + ": " + ex.what());
            documents.emplace_back();
        }
    }

    const DocumentFrequency df = document_frequency(documents);
    const std::size_t total_documents = corpus.size() + 1;
    const TermVector context_vector = tfidf(context_document, df, total_documents);

    ranking.reserve(corpus.size());
    for (std::size_t i = 0; i < corpus.size(); ++i) {
        try {
            ranking.push_back(score_session(corpus[i], i, documents[i + 1], context_vector, df, total_documents, now));
        } catch (const std::exception& ex) {
            log("Ranker", "failed to score session " + std::to_string(i) + ": " + ex.what());
            ScoredSession degraded;
            degraded.session = &corpus[i];
            degraded.corpus_index = i;
            ranking.push_back(degraded);
        }
    }

    std::stable_sort(ranking.begin(), ranking.end(), [](const ScoredSession& a, const ScoredSession& b) {
        return a.score > b.score;
    });
    return ranking;
}

std::vector<ScoredSession> rank_sessions(const CurrentContext& context, const std::vector<SessionRecord>& corpus) {
    return rank_sessions(context, corpus, Clock::now());
}

} // namespace recall
