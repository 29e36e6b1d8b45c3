#include "utils/Time.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

namespace {
std::time_t toUtcTime(std::tm *tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

std::tm toUtcTm(const std::chrono::system_clock::time_point &tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    return tm;
}
} // namespace

std::optional<std::chrono::system_clock::time_point> parseISO8601(const std::string &iso) {
    if (iso.empty()) {
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    auto tp = std::chrono::system_clock::from_time_t(toUtcTime(&tm));
    if (ss.peek() == '.') {
        ss.ignore();
        std::string fraction;
        while (std::isdigit(ss.peek())) {
            fraction += static_cast<char>(ss.get());
        }

        if (!fraction.empty()) {
            fraction.resize(6, '0');
            tp += std::chrono::microseconds(std::stoll(fraction));
        }
    }

    return tp;
}

std::string formatISO8601(const std::chrono::system_clock::time_point &tp) {
    std::tm tm = toUtcTm(tp);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");

    auto sinceEpoch = tp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(sinceEpoch - seconds);
    if (micros.count() > 0) {
        ss << '.' << std::setfill('0') << std::setw(6) << micros.count();
    }

    ss << "+00:00";
    return ss.str();
}

std::string formatClock(const std::chrono::system_clock::time_point &tp) {
    std::tm tm = toUtcTm(tp);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M");
    return ss.str();
}

} // namespace TimeUtils
