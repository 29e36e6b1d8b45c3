#pragma once

#include <optional>
#include <ostream>
#include <string>

#ifdef ERROR
#undef ERROR
#endif

namespace Logger {
enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, NONE = 4 };

void setLevel(Level level);
Level getLevel();

/**
 * @brief Parse a level name ("debug", "info", "warn", "error", "none"), case-insensitive
 * @return The level, or std::nullopt for an unknown name
 */
std::optional<Level> levelFromString(const std::string &name);
const char *toString(Level level);

/**
 * @brief Apply THREADLINE_LOG_LEVEL if it is set to a known level
 * @return true if the environment changed the level
 */
bool configureFromEnvironment();

/**
 * @brief Redirect output (stdout by default). Passing nullptr restores stdout.
 * Colour codes are only emitted for stdout.
 */
void setOutput(std::ostream *out);

void debug(const std::string &message);
void info(const std::string &message);
void warn(const std::string &message);
void error(const std::string &message);

void log(Level level, const std::string &prefix, const std::string &message);
} // namespace Logger
