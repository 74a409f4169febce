#pragma once
#include <functional>
#include <string_view>

namespace cs {

enum class LogLevel { Info, Warn, Error };

// Diagnostic channel. An empty sink means "write to stderr".
using LogSink = std::function<void(LogLevel, std::string_view)>;

// "[INFO] msg" / "[WARN] msg" / "[ERROR] msg" on std::cerr.
void log_to_stderr(LogLevel level, std::string_view msg);

inline void log_line(const LogSink& sink, LogLevel level, std::string_view msg) {
  if (sink) sink(level, msg);
  else log_to_stderr(level, msg);
}

const char* level_tag(LogLevel level) noexcept;

}
