#include "common/logging.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace keel {
namespace common {

std::string Logger::level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

bool Logger::parse_level(const std::string &name, LogLevel &out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  static const std::unordered_map<std::string, LogLevel> levels = {
      {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
      {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
      {"error", LogLevel::ERROR}, {"critical", LogLevel::CRITICAL}};

  auto it = levels.find(lower);
  if (it == levels.end()) {
    return false;
  }
  out = it->second;
  return true;
}

namespace {

std::string iso_timestamp(std::chrono::system_clock::time_point timestamp) {
  auto seconds = std::chrono::system_clock::to_time_t(timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                timestamp.time_since_epoch()) %
            1000;
  std::ostringstream out;
  out << std::put_time(std::gmtime(&seconds), "%Y-%m-%dT%H:%M:%S") << "."
      << std::setfill('0') << std::setw(3) << ms.count() << "Z";
  return out.str();
}

} // namespace

std::string Logger::format_json(const LogEntry &entry) const {
  nlohmann::json line = {{"timestamp", iso_timestamp(entry.timestamp)},
                         {"level", level_to_string(entry.level)},
                         {"module", entry.module},
                         {"message", entry.message}};
  if (!entry.error_code.empty()) {
    line["error_code"] = entry.error_code;
  }
  if (!entry.context.empty()) {
    line["context"] = entry.context;
  }
  // Program output may carry arbitrary bytes
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);

  text << "[" << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S")
       << "] " << "[" << level_to_string(entry.level) << "] " << "["
       << entry.module << "] " << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    text << " {";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

} // namespace common
} // namespace keel
