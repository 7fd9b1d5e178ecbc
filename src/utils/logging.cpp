#include "toolmesh/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace toolmesh {
namespace logging {

namespace {
std::atomic<Level> g_level{Level::Info};

std::mutex g_handler_mutex;
LogHandler g_handler = defaultHandler;

// Serialises writes from the default handler so lines never interleave
std::mutex g_stderr_mutex;
} // namespace

std::string levelToString(Level level) {
  switch (level) {
  case Level::Trace:
    return "TRACE";
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARNING";
  case Level::Error:
    return "ERROR";
  case Level::Fatal:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

Level levelFromString(const std::string &level_str) {
  std::string lowered = level_str;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "trace") {
    return Level::Trace;
  } else if (lowered == "debug") {
    return Level::Debug;
  } else if (lowered == "info") {
    return Level::Info;
  } else if (lowered == "warning" || lowered == "warn") {
    return Level::Warning;
  } else if (lowered == "error") {
    return Level::Error;
  } else if (lowered == "fatal") {
    return Level::Fatal;
  } else {
    throw std::invalid_argument("Invalid log level: " + level_str);
  }
}

void setLevel(Level level) { g_level = level; }

Level getLevel() { return g_level; }

void setHandler(LogHandler handler) {
  std::lock_guard<std::mutex> lock(g_handler_mutex);
  g_handler = handler ? std::move(handler) : LogHandler(defaultHandler);
}

void log(Level level, const std::string &message, const std::string &file,
         int line) {
  if (level >= g_level) {
    LogHandler handler;
    {
      std::lock_guard<std::mutex> lock(g_handler_mutex);
      handler = g_handler;
    }
    handler(level, message, file, line);
  }
}

bool isEnabled(Level level) { return level >= g_level; }

void configureFromEnvironment() {
  const char *value = std::getenv("TOOLMESH_LOG_LEVEL");
  if (!value || *value == '\0') {
    return;
  }

  try {
    setLevel(levelFromString(value));
  } catch (const std::invalid_argument &e) {
    log(Level::Warning,
        std::string("Ignoring TOOLMESH_LOG_LEVEL: ") + e.what());
  }
}

void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line) {
  std::time_t t = std::time(nullptr);
  std::tm tm = *std::localtime(&t);

  std::ostringstream ss;
  ss << "[" << levelToString(level) << "] ["
     << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";

  // Format: [LEVEL] [time] [file:line] message
  if (!file.empty()) {
    ss << "[" << file << ":" << line << "] ";
  }
  ss << message;

  std::lock_guard<std::mutex> lock(g_stderr_mutex);
  std::cerr << ss.str() << std::endl;
}

ScopedHandler::ScopedHandler(LogHandler handler) {
  std::lock_guard<std::mutex> lock(g_handler_mutex);
  previous_ = g_handler;
  g_handler = handler ? std::move(handler) : LogHandler(defaultHandler);
}

ScopedHandler::~ScopedHandler() { setHandler(previous_); }

} // namespace logging
} // namespace toolmesh
