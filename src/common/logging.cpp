#include "logging.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <strings.h>
#include <thread>

namespace mender {

bool parse_log_level(const char *name, LogLevel &out) {
  static const struct {
    const char *name;
    LogLevel level;
  } names[] = {{"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},
               {"info", LogLevel::INFO},   {"warn", LogLevel::WARN},
               {"error", LogLevel::ERROR}, {"critical", LogLevel::CRITICAL},
               {"off", LogLevel::OFF}};
  if (!name)
    return false;
  for (const auto &n : names) {
    if (::strcasecmp(name, n.name) == 0) {
      out = n.level;
      return true;
    }
  }
  return false;
}

Logger::Logger() {
  LogLevel lvl;
  if (parse_log_level(std::getenv("MENDER_LOG_LEVEL"), lvl))
    level_ = lvl;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::set_sink(std::FILE *sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = sink;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
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
  default:
    return "CRITICAL";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (!enabled(lvl))
    return;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  // short tag so interleaved repairs can be told apart
  unsigned tid =
      (unsigned)(std::hash<std::thread::id>()(std::this_thread::get_id()) &
                 0xFFFF);

  std::lock_guard<std::mutex> lk(mtx_);
  std::FILE *out = sink_ ? sink_ : stderr;
  std::fprintf(out, "%s.%03d [%s] <%04x> ", ts, (int)ms, level_str(lvl), tid);
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  if (lvl >= LogLevel::ERROR)
    std::fflush(out);
}

} // namespace mender
