#include "../include/recall/commands.hpp"

#include "../include/recall/corpus.hpp"
#include "../include/recall/history.hpp"
#include "../include/recall/json.hpp"
#include "../include/recall/log.hpp"
#include "../include/recall/ranker.hpp"
#include "../include/recall/selection.hpp"
#include "../include/recall/text.hpp"

#include <filesystem>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

namespace recall {

namespace {

constexpr std::size_t kTimelineSummaryLength = 60;

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Empty or unparsable hook input is treated as an empty request.
Json read_request(std::istream& in, const char* component) {
    const std::string input = read_all(in);
    if (input.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Json(JsonObject{});
    }
    try {
        Json request = Json::parse(input);
        if (request.is_object()) {
            return request;
        }
        log(component, "hook input is not a JSON object");
    } catch (const std::exception& ex) {
        log(component, std::string("invalid hook input: ") + ex.what());
    }
    return Json(JsonObject{});
}

std::string current_directory() {
    std::error_code ec;
    const auto path = std::filesystem::current_path(ec);
    return ec ? std::string() : path.string();
}

// The hook's cwd, or the process directory when the hook sends none.
std::string working_directory(const Json& request) {
    std::string cwd = request.string_at("cwd").value_or(std::string());
    return cwd.empty() ? current_directory() : cwd;
}

JsonArray string_list(const std::vector<std::string>& values) {
    JsonArray array;
    array.reserve(values.size());
    for (const auto& value : values) {
        array.emplace_back(value);
    }
    return array;
}

JsonObject search_hit_to_json(const SearchHit& hit) {
    JsonArray matched;
    for (const Observation* observation : hit.matched_observations) {
        JsonObject entry;
        entry["summary"] = Json(observation->summary);
        if (observation->last_user_message) {
            entry["last_user_message"] = Json(*observation->last_user_message);
        }
        matched.emplace_back(std::move(entry));
    }

    JsonObject entry;
    entry["project"] = Json(hit.session->project);
    entry["date"] = Json(hit.session->timestamp);
    entry["summary"] = Json(hit.session->summary);
    entry["summary_type"] = Json(hit.session->summary_type);
    entry["keywords"] = Json(string_list(hit.session->keywords));
    entry["matched_observations"] = Json(std::move(matched));
    return entry;
}

JsonObject timeline_entry_to_json(const SessionRecord& session) {
    std::string summary = truncate_utf8(session.summary, kTimelineSummaryLength);
    if (summary.size() < session.summary.size()) {
        summary += "...";
    }

    JsonObject entry;
    entry["project"] = Json(session.project);
    entry["date"] = Json(session.timestamp);
    entry["summary"] = Json(std::move(summary));
    entry["summary_type"] = Json(session.summary_type);
    entry["observation_count"] = Json(session.observation_count);
    return entry;
}

JsonObject scored_to_json(const ScoredSession& scored) {
    JsonObject entry;
    entry["project"] = Json(scored.session->project);
    entry["date"] = Json(scored.session->timestamp);
    entry["summary"] = Json(scored.session->summary);
    entry["score"] = Json(scored.score);
    entry["similarity"] = Json(scored.similarity);
    entry["time_weight"] = Json(scored.time_weight);
    entry["structural_bonus"] = Json(scored.structural_bonus);
    return entry;
}

} // namespace

std::string project_name(const std::string& working_directory) {
    std::string trimmed = working_directory;
    while (trimmed.size() > 1 && (trimmed.back() == '/' || trimmed.back() == '\\')) {
        trimmed.pop_back();
    }
    const auto slash = trimmed.find_last_of("/\\");
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

void run_context(const RecallSettings& settings, std::istream& in, std::ostream& out) {
    const Json request = read_request(in, "Context");

    CurrentContext context;
    context.working_directory = working_directory(request);
    if (const Json* files = request.find("recent_files"); files && files->is_array()) {
        for (const auto& file : files->as_array()) {
            if (file.is_string()) {
                context.recent_files.push_back(file.as_string());
            }
        }
    }

    const std::vector<SessionRecord> corpus = load_corpus(settings.memories_dir());
    const std::vector<ScoredSession> ranking = rank_sessions(context, corpus);
    const std::vector<ScoredSession> selected = select_relevant(ranking, settings.selection);

    JsonArray sessions;
    sessions.reserve(selected.size());
    for (const auto& scored : selected) {
        sessions.emplace_back(scored_to_json(scored));
    }

    JsonObject response;
    response["project"] = Json(project_name(context.working_directory));
    response["sessions"] = Json(std::move(sessions));
    out << Json(response).dump() << '\n';
    out.flush();
}

void run_search(const RecallSettings& settings, const std::string& query, std::ostream& out) {
    const std::vector<SessionRecord> corpus = load_corpus(settings.memories_dir());
    const std::vector<SearchHit> hits = search_sessions(corpus, query);

    JsonArray sessions;
    for (std::size_t i = 0; i < hits.size() && i < kSearchResultLimit; ++i) {
        sessions.emplace_back(search_hit_to_json(hits[i]));
    }

    JsonObject response;
    response["query"] = Json(query);
    response["total"] = Json(hits.size());
    response["sessions"] = Json(std::move(sessions));
    out << Json(response).dump() << '\n';
    out.flush();
}

void run_timeline(const RecallSettings& settings, std::size_t count, std::ostream& out) {
    const std::vector<SessionRecord> corpus = load_corpus(settings.memories_dir());

    JsonArray sessions;
    for (const SessionRecord* session : recent_sessions(corpus, count)) {
        sessions.emplace_back(timeline_entry_to_json(*session));
    }

    JsonObject response;
    response["total"] = Json(corpus.size());
    response["sessions"] = Json(std::move(sessions));
    out << Json(response).dump() << '\n';
    out.flush();
}

std::size_t parse_timeline_length(const std::string& argument) {
    const std::string trimmed = strip(argument);
    if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos || trimmed.size() > 9) {
        return kDefaultTimelineLength;
    }
    const std::size_t value = static_cast<std::size_t>(std::stoul(trimmed));
    return value == 0 ? kDefaultTimelineLength : value;
}

void run_summarize(Summarizer& summarizer, std::istream& in, std::ostream& out) {
    const Json request = read_request(in, "Summarize");

    SessionActivity activity;
    activity.project = project_name(working_directory(request));
    if (const Json* observations = request.find("observations"); observations && observations->is_array()) {
        for (const auto& entry : observations->as_array()) {
            if (entry.is_object()) {
                activity.observations.push_back(observation_from_json(entry));
            }
        }
    }
    if (const Json* conversations = request.find("conversations"); conversations && conversations->is_array()) {
        for (const auto& entry : conversations->as_array()) {
            if (entry.is_object()) {
                activity.conversations.push_back(conversation_from_json(entry));
            }
        }
    }

    JsonObject response;
    if (activity.empty()) {
        response["success"] = Json(true);
        response["message"] = Json("nothing to summarize");
        out << Json(response).dump() << '\n';
        out.flush();
        return;
    }

    const Summary summary = summarize_with_fallback(summarizer, activity);

    JsonArray keywords;
    for (auto& keyword : session_keywords(activity.observations, activity.conversations)) {
        keywords.emplace_back(std::move(keyword));
    }

    response["summary"] = Json(summary.text);
    response["summary_type"] = Json(summary_kind_to_string(summary.kind));
    response["keywords"] = Json(std::move(keywords));
    out << Json(response).dump() << '\n';
    out.flush();
}

} // namespace recall
