#pragma once

#include "session.hpp"
#include "settings.hpp"

#include <memory>
#include <string>
#include <vector>

namespace recall {

// Activity buffered during one working session, before it is stored.
struct SessionActivity {
    std::string project;
    std::vector<Observation> observations;
    std::vector<Conversation> conversations;

    bool empty() const noexcept { return observations.empty() && conversations.empty(); }
};

enum class SummaryKind {
    Ai,
    Local
};

std::string summary_kind_to_string(SummaryKind kind);

struct Summary {
    std::string text;
    SummaryKind kind = SummaryKind::Local;
};

class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual std::string summarize(const SessionActivity& activity) = 0;
    virtual SummaryKind kind() const noexcept = 0;
};

using SummarizerPtr = std::unique_ptr<Summarizer>;

// Rule-based one-line digest. Never throws for well-formed activity.
class LocalSummarizer final : public Summarizer {
public:
    std::string summarize(const SessionActivity& activity) override;
    SummaryKind kind() const noexcept override { return SummaryKind::Local; }
};

// Asks a Messages-API compatible endpoint for a short summary.
class RemoteSummarizer final : public Summarizer {
public:
    explicit RemoteSummarizer(SummaryServiceSettings settings);

    std::string summarize(const SessionActivity& activity) override;
    SummaryKind kind() const noexcept override { return SummaryKind::Ai; }

    std::string build_request(const SessionActivity& activity) const;
    static std::string parse_response(const std::string& body);

private:
    SummaryServiceSettings m_settings;
};

SummarizerPtr make_summarizer(const RecallSettings& settings);

// Runs primary; when it throws or yields nothing, the local digest is used.
Summary summarize_with_fallback(Summarizer& primary, const SessionActivity& activity);

} // namespace recall
