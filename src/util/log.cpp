#include "credstream/log.hpp"
#include <iostream>
#include <mutex>

namespace cs {

const char* level_tag(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::Info:  return "[INFO]";
    case LogLevel::Warn:  return "[WARN]";
    case LogLevel::Error: return "[ERROR]";
  }
  return "[?]";
}

void log_to_stderr(LogLevel level, std::string_view msg) {
  // a counting pass may log from another thread
  static std::mutex mu;
  std::lock_guard<std::mutex> lk(mu);
  std::cerr << level_tag(level) << ' ' << msg << "\n";
}

}
