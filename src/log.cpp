#include "log.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>

static std::mutex g_mu;
static std::ofstream g_out;
static std::string g_status;
static LogLevel g_min = LogLevel::Info;

static const char* level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

bool Log::open(const std::filesystem::path& path, std::string& msg) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_out.is_open()) g_out.close();
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  g_out.open(path, std::ios::app);
  if (!g_out) { msg = "can not open log file: " + path.string(); return false; }
  msg = "logging to " + path.string();
  return true;
}

void Log::close() {
  std::lock_guard<std::mutex> lk(g_mu);
  if (g_out.is_open()) g_out.close();
}

void Log::set_min_level(LogLevel level) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_min = level;
}

void Log::write(LogLevel level, const std::string& tag, const std::string& text) {
  std::lock_guard<std::mutex> lk(g_mu);
  if (level != LogLevel::Info) g_status = "[" + tag + "] " + text;
  if (static_cast<int>(level) < static_cast<int>(g_min) || !g_out.is_open()) return;
  std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  g_out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ' ' << level_name(level) << " [" << tag << "] " << text << '\n';
  g_out.flush();
}

std::string Log::take_status() {
  std::lock_guard<std::mutex> lk(g_mu);
  std::string s;
  s.swap(g_status);
  return s;
}
