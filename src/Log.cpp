#include "lext/Log.hpp"
#include "lext/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace lext {
namespace log {

namespace {

Level levelFromEnvironment() {
  const char *envLevel = std::getenv("LEXT_LOG_LEVEL");
  if (envLevel != nullptr) {
    return parseLevel(envLevel);
  }
  return Level::Info;
}

std::atomic<int> &currentLevel() {
  static std::atomic<int> value{static_cast<int>(levelFromEnvironment())};
  return value;
}

std::mutex &outputMutex() {
  static std::mutex mutex;
  return mutex;
}

const char *prefix(Level lvl) {
  switch (lvl) {
  case Level::Debug:
    return "DEBUG: ";
  case Level::Info:
    return "INFO: ";
  case Level::Warn:
    return "WARN: ";
  case Level::Error:
    return "ERROR: ";
  case Level::Off:
    break;
  }
  return "";
}

} // anonymous namespace

void setLevel(Level lvl) { currentLevel().store(static_cast<int>(lvl)); }

Level level() { return static_cast<Level>(currentLevel().load()); }

Level parseLevel(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    return Level::Debug;
  } else if (lower == "info") {
    return Level::Info;
  } else if (lower == "warn" || lower == "warning") {
    return Level::Warn;
  } else if (lower == "error") {
    return Level::Error;
  } else if (lower == "off" || lower == "none") {
    return Level::Off;
  }
  return Level::Info;
}

void write(Level lvl, const std::string &message) {
  if (lvl < level() || lvl == Level::Off) {
    return;
  }
  std::lock_guard<std::mutex> lock(outputMutex());
  std::cerr << prefix(lvl) << message << std::endl;
}

} // namespace log

std::string toString(WarningKind kind) {
  switch (kind) {
  case WarningKind::PageDegraded:
    return "PageDegraded";
  case WarningKind::EngineUnavailable:
    return "EngineUnavailable";
  case WarningKind::ClassificationAmbiguous:
    return "ClassificationAmbiguous";
  }
  return "PageDegraded";
}

Warning makeWarning(WarningKind kind, int page, const std::string &message) {
  Warning warning;
  warning.kind = kind;
  warning.page = page;
  warning.message = message;
  log::warn(toString(kind), " (page ", page, "): ", message);
  return warning;
}

} // namespace lext
