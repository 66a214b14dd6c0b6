#include "../include/recall/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace recall {

namespace {

std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::string timestamp_now() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto time = clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << milliseconds.count();
    return oss.str();
}

void log(std::string_view component, std::string_view message) {
    const std::string stamp = timestamp_now();
    std::scoped_lock lock(log_mutex());
    std::cerr << '[' << component << ' ' << stamp << "] " << message << std::endl;
}

} // namespace recall
