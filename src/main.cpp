#include "../SessionRecall/include/recall/commands.hpp"
#include "../SessionRecall/include/recall/log.hpp"
#include "../SessionRecall/include/recall/settings.hpp"
#include "../SessionRecall/include/recall/summarizer.hpp"

#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& out) {
    out << "usage: recall <command> [args]\n"
        << "\n"
        << "commands:\n"
        << "  context           rank stored sessions against the hook context read from stdin\n"
        << "  summarize         summarize the session activity read from stdin\n"
        << "  search <keyword>  list stored sessions mentioning keyword\n"
        << "  timeline [n]      list the n most recent stored sessions (default 10, max 20)\n";
}

// Hook commands never block the host tool: failures are logged and the
// process still exits cleanly.
int run_hook(const std::string& command) {
    using namespace recall;
    try {
        const RecallSettings settings = resolve_settings();
        if (command == "context") {
            run_context(settings, std::cin, std::cout);
        } else {
            SummarizerPtr summarizer = make_summarizer(settings);
            run_summarize(*summarizer, std::cin, std::cout);
        }
    } catch (const std::exception& ex) {
        log("Recall", command + " failed: " + ex.what());
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    using namespace recall;

    if (argc < 2) {
        print_usage(std::cerr);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(std::cout);
        return 0;
    }
    if (command == "context" || command == "summarize") {
        return run_hook(command);
    }
    if (command == "search" && argc < 3) {
        std::cerr << "search requires a keyword\n\n";
        print_usage(std::cerr);
        return 1;
    }
    if (command != "search" && command != "timeline") {
        std::cerr << "unknown command: " << command << "\n\n";
        print_usage(std::cerr);
        return 1;
    }

    try {
        const RecallSettings settings = resolve_settings();
        if (command == "search") {
            run_search(settings, argv[2], std::cout);
        } else {
            run_timeline(settings, parse_timeline_length(argc > 2 ? argv[2] : ""), std::cout);
        }
    } catch (const std::exception& ex) {
        log("Recall", command + " failed: " + ex.what());
        return 1;
    }
    return 0;
}
