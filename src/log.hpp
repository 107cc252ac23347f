#pragma once
/*
 * Log
 *
 * Purpose: background log for failures the user should not be interrupted by.
 * Lines go to the configured log file (if any); the latest warn/error line is
 * kept as the status-line message.
 */
#include <filesystem>
#include <string>

enum class LogLevel { Info, Warn, Error };

class Log {
public:
  static bool open(const std::filesystem::path& path, std::string& msg);
  static void close();
  static void write(LogLevel level, const std::string& tag, const std::string& text);
  // Latest warn/error line; cleared by take_status().
  static std::string take_status();
  static void set_min_level(LogLevel level);
};

inline void log_info(const std::string& tag, const std::string& text) { Log::write(LogLevel::Info, tag, text); }
inline void log_warn(const std::string& tag, const std::string& text) { Log::write(LogLevel::Warn, tag, text); }
inline void log_error(const std::string& tag, const std::string& text) { Log::write(LogLevel::Error, tag, text); }
