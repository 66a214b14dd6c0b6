#include "recall/ranker.hpp"
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

using namespace recall;

namespace {

TimePoint at(const std::string& text) {
    auto parsed = parse_timestamp(text);
    EXPECT_TRUE(parsed.has_value()) << text;
    return parsed.value_or(TimePoint{});
}

SessionRecord make_session(const std::string& timestamp, const std::string& summary) {
    SessionRecord session;
    session.timestamp = timestamp;
    session.project = "auth-service";
    session.summary = summary;
    return session;
}

Conversation question(const std::string& message) {
    return Conversation{message, MessageType::Question};
}

} // namespace

class RankerTest : public ::testing::Test {
protected:
    const TimePoint now_ = at("2024-06-15T12:00:00Z");
    CurrentContext context_{"/home/user/projects/auth-service", {}};
};

// Recency
TEST_F(RankerTest, TimeWeightBoundaries) {
    EXPECT_DOUBLE_EQ(time_weight(0.0), 1.0);
    EXPECT_DOUBLE_EQ(time_weight(12.0), 0.75);
    EXPECT_DOUBLE_EQ(time_weight(24.0), 0.5);
    EXPECT_NEAR(time_weight(24.0 * 14.0), std::exp(-1.0), 1e-12);
}

TEST_F(RankerTest, TimeWeightJumpsAfterFirstDay) {
    const double just_after = time_weight(24.5);
    EXPECT_GT(just_after, 0.9);
    EXPECT_LT(just_after, 1.0);
    EXPECT_GT(time_weight(48.0), time_weight(72.0));
}

TEST_F(RankerTest, TimeWeightFromTimestamps) {
    EXPECT_DOUBLE_EQ(time_weight(at("2024-06-14T12:00:00Z"), now_), 0.5);
    EXPECT_NEAR(time_weight(at("2024-06-01T12:00:00Z"), now_), std::exp(-1.0), 1e-12);
    EXPECT_DOUBLE_EQ(time_weight(std::nullopt, now_), 0.0);
}

// Fusion
TEST_F(RankerTest, ScoreIsClampedToOne) {
    EXPECT_DOUBLE_EQ(fuse_score(1.0, 1.0, kConversationBonus), 1.0);
    EXPECT_NEAR(fuse_score(1.0, 1.0, 0.0), 0.85, 1e-12);
    EXPECT_NEAR(fuse_score(0.5, 0.5, 0.0), 0.425, 1e-12);
}

TEST_F(RankerTest, StructuralBonusRequiresConversation) {
    SessionRecord session = make_session("2024-06-15T10:00:00Z", "notes");
    EXPECT_DOUBLE_EQ(structural_bonus(session), 0.0);
    session.conversations.push_back(question("anything"));
    EXPECT_DOUBLE_EQ(structural_bonus(session), kConversationBonus);
}

// Documents
TEST_F(RankerTest, ContextTokensIncludeRecentFiles) {
    CurrentContext context{"/work/billing", {"src/InvoiceTable.tsx"}};
    EXPECT_EQ(context_tokens(context), (Document{"work", "billing", "src", "invoice", "table"}));
}

TEST_F(RankerTest, SessionTokensCoverObservations) {
    SessionRecord session = make_session("2024-06-15T10:00:00Z", "Fixed login");
    Observation edit;
    edit.tool = "Edit";
    edit.summary = "edited token refresh";
    edit.details.file = "src/authGuard.ts";
    edit.details.command = "npm test";
    edit.last_user_message = "please retry";
    session.observations.push_back(edit);
    EXPECT_EQ(session_tokens(session), (Document{"fixed", "login", "edited", "token", "refresh", "src", "auth",
                                                 "guard", "npm", "test", "please", "retry"}));
}

TEST_F(RankerTest, SessionKeywordsAreDistinctAndCapped) {
    std::vector<Conversation> conversations = {question("login fails login again")};
    Observation edit;
    edit.summary = "login patched";
    edit.details.file = "src/login.ts";
    const auto keywords = session_keywords({edit}, conversations);
    EXPECT_EQ(keywords, (std::vector<std::string>{"login", "fails", "again", "patched", "src"}));
    EXPECT_EQ(session_keywords({edit}, conversations, 2), (std::vector<std::string>{"login", "fails"}));
}

// Ranking
TEST_F(RankerTest, EmptyCorpusYieldsEmptyRanking) {
    EXPECT_TRUE(rank_sessions(context_, {}, now_).empty());
}

TEST_F(RankerTest, RankingHasOneEntryPerSessionInRange) {
    std::vector<SessionRecord> corpus = {
        make_session("2024-06-15T10:00:00Z", "auth login"),
        make_session("2023-01-01T00:00:00Z", "unrelated billing"),
        make_session("not a date", "service"),
    };
    corpus[0].conversations.push_back(question("why"));
    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), corpus.size());
    for (const auto& entry : ranking) {
        EXPECT_GE(entry.score, 0.0);
        EXPECT_LE(entry.score, 1.0);
        EXPECT_GE(entry.similarity, 0.0);
        EXPECT_LE(entry.similarity, 1.0);
    }
    EXPECT_TRUE(std::is_sorted(ranking.begin(), ranking.end(), [](const auto& a, const auto& b) {
        return a.score > b.score;
    }));
}

TEST_F(RankerTest, UnparsableTimestampWeighsZero) {
    const std::vector<SessionRecord> corpus = {make_session("yesterday", "auth service")};
    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), 1u);
    EXPECT_DOUBLE_EQ(ranking[0].time_weight, 0.0);
    EXPECT_GT(ranking[0].similarity, 0.0);
}

TEST_F(RankerTest, SessionMatchingContextRanksFirst) {
    const std::vector<SessionRecord> corpus = {
        make_session(format_timestamp(now_), "billing dashboard charts"),
        make_session(format_timestamp(now_), "home user projects auth service"),
    };
    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), 2u);
    EXPECT_EQ(ranking[0].corpus_index, 1u);
    EXPECT_EQ(ranking[0].session, &corpus[1]);
    EXPECT_NEAR(ranking[0].similarity, 1.0, 1e-9);
    EXPECT_NEAR(ranking[0].score, 0.85, 1e-9);
    EXPECT_DOUBLE_EQ(ranking[1].similarity, 0.0);
}

TEST_F(RankerTest, ConversationBonusIsAdditive) {
    SessionRecord plain = make_session("2024-06-14T00:00:00Z", "auth login refactor");
    SessionRecord talked = plain;
    // Only stopwords, so the token stream is unchanged.
    talked.conversations.push_back(question("is it"));
    const std::vector<SessionRecord> corpus = {plain, talked};

    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), 2u);
    EXPECT_EQ(ranking[0].corpus_index, 1u);
    EXPECT_NEAR(ranking[0].score - ranking[1].score, kConversationBonus, 1e-12);
    EXPECT_DOUBLE_EQ(ranking[0].similarity, ranking[1].similarity);
}

TEST_F(RankerTest, AncientTimestampNeverOutranksFreshSession) {
    const std::vector<SessionRecord> corpus = {
        make_session("2024-06-15T10:00:00Z", "unrelated billing"),
        make_session("1500-01-01T00:00:00Z", "unrelated billing"),
    };
    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), 2u);
    EXPECT_EQ(ranking[0].corpus_index, 0u);
    EXPECT_LT(ranking[1].time_weight, 1e-6);
    EXPECT_LT(ranking[1].score, 1e-6);
}

TEST_F(RankerTest, TiesKeepCorpusOrder) {
    const std::vector<SessionRecord> corpus = {
        make_session("2024-06-10T00:00:00Z", "same words"),
        make_session("2024-06-10T00:00:00Z", "same words"),
        make_session("2024-06-10T00:00:00Z", "same words"),
    };
    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), 3u);
    EXPECT_EQ(ranking[0].corpus_index, 0u);
    EXPECT_EQ(ranking[1].corpus_index, 1u);
    EXPECT_EQ(ranking[2].corpus_index, 2u);
}

TEST_F(RankerTest, RecentConversationBeatsOldMatchBeatsStaleNoise) {
    SessionRecord recent = make_session("2024-06-15T10:00:00Z", "Refactored the billing dashboard charts");
    recent.conversations.push_back(question("How do I fix chart colors?"));

    SessionRecord stale = make_session("2024-06-05T12:00:00Z", "Updated documentation for deployment scripts");

    SessionRecord relevant = make_session("2024-05-16T12:00:00Z", "Fixed auth service login flow");
    relevant.conversations.push_back(question("Why does login fail in auth service?"));
    Observation edit;
    edit.tool = "Edit";
    edit.details.file = "/home/user/projects/auth-service/src/login.ts";
    relevant.observations.push_back(edit);

    const std::vector<SessionRecord> corpus = {recent, stale, relevant};
    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), 3u);

    EXPECT_EQ(ranking[0].corpus_index, 0u);
    EXPECT_EQ(ranking[1].corpus_index, 2u);
    EXPECT_EQ(ranking[2].corpus_index, 1u);

    EXPECT_DOUBLE_EQ(ranking[0].similarity, 0.0);
    EXPECT_GT(ranking[1].similarity, 0.3);
    EXPECT_NEAR(ranking[0].score, 0.45 * (1.0 - 2.0 / 48.0) + 0.15, 1e-9);
    EXPECT_NEAR(ranking[2].score, 0.45 * std::exp(-10.0 / 14.0), 1e-9);
}

TEST_F(RankerTest, AuthServiceScenario) {
    SessionRecord jwt = make_session("2024-06-15T10:00:00Z", "implemented JWT refresh token logic");
    jwt.conversations.push_back(question("how often should refresh tokens rotate?"));

    SessionRecord css = make_session("2024-06-05T12:00:00Z", "fixed CSS layout bug");

    SessionRecord login = make_session("2024-05-16T12:00:00Z", "refactored auth service login flow");
    login.conversations.push_back(question("login keeps failing"));

    const std::vector<SessionRecord> corpus = {jwt, css, login};
    const auto ranking = rank_sessions(context_, corpus, now_);
    ASSERT_EQ(ranking.size(), 3u);

    EXPECT_EQ(ranking[0].session->summary, "implemented JWT refresh token logic");
    EXPECT_EQ(ranking[1].session->summary, "refactored auth service login flow");
    EXPECT_EQ(ranking[2].session->summary, "fixed CSS layout bug");

    EXPECT_NEAR(ranking[0].score, 0.45 * (1.0 - 2.0 / 48.0) + 0.15, 1e-9);
    EXPECT_GT(ranking[1].similarity, 0.2);
    EXPECT_DOUBLE_EQ(ranking[2].similarity, 0.0);
    EXPECT_DOUBLE_EQ(ranking[2].structural_bonus, 0.0);
}
