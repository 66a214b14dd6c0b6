#include "../include/recall/corpus.hpp"

#include "../include/recall/log.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace recall {

namespace {

std::string read_file(const std::filesystem::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("[corpus] unable to open " + file.string());
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

} // namespace

std::vector<SessionRecord> load_project_sessions(const std::filesystem::path& file) {
    const Json document = Json::parse(read_file(file));
    if (!document.is_object()) {
        throw std::runtime_error("[corpus] " + file.string() + " is not a JSON object");
    }

    const std::string project = document.string_at("project").value_or(file.stem().string());

    std::vector<SessionRecord> sessions;
    const Json* entries = document.find("sessions");
    if (!entries || !entries->is_array()) {
        return sessions;
    }
    sessions.reserve(entries->as_array().size());
    for (const auto& entry : entries->as_array()) {
        if (!entry.is_object()) {
            continue;
        }
        SessionRecord session = session_from_json(entry);
        session.project = project;
        sessions.push_back(std::move(session));
    }
    return sessions;
}

std::vector<SessionRecord> load_corpus(const std::filesystem::path& memories_dir) {
    std::vector<SessionRecord> corpus;

    std::error_code ec;
    if (!std::filesystem::is_directory(memories_dir, ec)) {
        return corpus;
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(memories_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        log("Corpus", "failed to list " + memories_dir.string() + ": " + ec.message());
    }
    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return a.filename() < b.filename();
    });

    for (const auto& file : files) {
        try {
            auto sessions = load_project_sessions(file);
            corpus.insert(corpus.end(),
                          std::make_move_iterator(sessions.begin()),
                          std::make_move_iterator(sessions.end()));
        } catch (const std::exception& ex) {
            log("Corpus", "skipping " + file.filename().string() + ": " + ex.what());
        }
    }
    return corpus;
}

} // namespace recall
