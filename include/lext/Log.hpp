#ifndef LEXT_LOG_HPP
#define LEXT_LOG_HPP

#include <sstream>
#include <string>

namespace lext {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/**
 * @brief Set the minimum level written to stderr
 */
void setLevel(Level level);

/**
 * @brief Current minimum level (initialised from LEXT_LOG_LEVEL)
 */
Level level();

/**
 * @brief Parse "debug", "info", "warn", "error" or "off"
 * @return Level::Info for unknown names
 */
Level parseLevel(const std::string &name);

/**
 * @brief Write one "LEVEL: message" line to std::cerr
 *
 * Lines from concurrent workers are serialized.
 */
void write(Level lvl, const std::string &message);

template <typename... Args>
void emit(Level lvl, const Args &...args) {
  if (lvl < level()) {
    return;
  }
  std::ostringstream out;
  (out << ... << args);
  write(lvl, out.str());
}

template <typename... Args> void debug(const Args &...args) {
  emit(Level::Debug, args...);
}
template <typename... Args> void info(const Args &...args) {
  emit(Level::Info, args...);
}
template <typename... Args> void warn(const Args &...args) {
  emit(Level::Warn, args...);
}
template <typename... Args> void error(const Args &...args) {
  emit(Level::Error, args...);
}

} // namespace log
} // namespace lext

#endif // LEXT_LOG_HPP
