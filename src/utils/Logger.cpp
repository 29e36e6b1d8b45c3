#include "utils/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Logger {

namespace {
std::mutex g_mutex;
Level g_level = Level::INFO;
std::ostream *g_out = nullptr;

const char *colorFor(Level level) {
    switch (level) {
    case Level::DEBUG:
        return "\033[36m";
    case Level::INFO:
        return "\033[37m";
    case Level::WARN:
        return "\033[33m";
    case Level::ERROR:
        return "\033[31m";
    default:
        return "\033[0m";
    }
}

constexpr const char *kDim = "\033[90m";
constexpr const char *kReset = "\033[0m";

std::string timestamp() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);

    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour << ":" << std::setw(2) << tm.tm_min << ":" << std::setw(2)
        << tm.tm_sec << "." << std::setw(3) << ms.count();
    return oss.str();
}

bool enabled(Level level) {
    if (level == Level::NONE || g_level == Level::NONE)
        return false;
    return static_cast<int>(level) >= static_cast<int>(g_level);
}
} // namespace

void setLevel(Level level) {
    std::scoped_lock lock(g_mutex);
    g_level = level;
}

Level getLevel() {
    std::scoped_lock lock(g_mutex);
    return g_level;
}

const char *toString(Level level) {
    switch (level) {
    case Level::DEBUG:
        return "DEBUG";
    case Level::INFO:
        return "INFO";
    case Level::WARN:
        return "WARN";
    case Level::ERROR:
        return "ERROR";
    case Level::NONE:
        return "NONE";
    }
    return "INFO";
}

std::optional<Level> levelFromString(const std::string &name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "debug")
        return Level::DEBUG;
    if (lowered == "info")
        return Level::INFO;
    if (lowered == "warn" || lowered == "warning")
        return Level::WARN;
    if (lowered == "error")
        return Level::ERROR;
    if (lowered == "none" || lowered == "off")
        return Level::NONE;
    return std::nullopt;
}

bool configureFromEnvironment() {
    const char *value = std::getenv("THREADLINE_LOG_LEVEL");
    if (value == nullptr) {
        return false;
    }

    auto level = levelFromString(value);
    if (!level.has_value()) {
        warn(std::string("Ignoring unknown THREADLINE_LOG_LEVEL: ") + value);
        return false;
    }

    setLevel(*level);
    return true;
}

void setOutput(std::ostream *out) {
    std::scoped_lock lock(g_mutex);
    g_out = out;
}

void debug(const std::string &message) { log(Level::DEBUG, "", message); }
void info(const std::string &message) { log(Level::INFO, "", message); }
void warn(const std::string &message) { log(Level::WARN, "", message); }
void error(const std::string &message) { log(Level::ERROR, "", message); }

void log(Level level, const std::string &prefix, const std::string &message) {
    std::scoped_lock lock(g_mutex);
    if (!enabled(level))
        return;

    const bool colored = g_out == nullptr;
    std::ostream &out = colored ? std::cout : *g_out;

    std::ostringstream line;
    line << (colored ? kDim : "") << timestamp() << (colored ? kReset : "") << " ";
    if (!prefix.empty()) {
        line << (colored ? kDim : "") << "[" << prefix << "] " << (colored ? kReset : "");
    }
    line << (colored ? colorFor(level) : "") << "[" << toString(level) << "] " << message << (colored ? kReset : "");

    out << line.str() << "\n";
    out.flush();
}

} // namespace Logger
