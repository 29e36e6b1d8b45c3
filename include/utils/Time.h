#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace TimeUtils {

/**
 * @brief Parse an ISO 8601 UTC timestamp ("2024-12-22T15:30:45.123Z" or with "+00:00")
 * @return time_point if parsing succeeds, std::nullopt otherwise
 */
std::optional<std::chrono::system_clock::time_point> parseISO8601(const std::string &iso);

/**
 * @brief Format a time_point as ISO 8601 in UTC, with microseconds when non-zero
 */
std::string formatISO8601(const std::chrono::system_clock::time_point &tp);

/**
 * @brief Format the UTC wall-clock time as "HH:MM", used for timestamp captions
 */
std::string formatClock(const std::chrono::system_clock::time_point &tp);

} // namespace TimeUtils
