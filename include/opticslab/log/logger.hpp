#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace opticslab::log {

enum class Level : int { debug = 1, info = 2, warn = 3, error = 4, off = 6 };

inline std::string_view to_string(Level lv) {
  switch (lv) {
  case Level::debug:
    return "D";
  case Level::info:
    return "I";
  case Level::warn:
    return "W";
  case Level::error:
    return "E";
  default:
    return "O";
  }
}

class Logger {
public:
  static Logger &instance() {
    static Logger L;
    return L;
  }

  void set_level(Level lv) {
    level_.store(lv, std::memory_order_relaxed);
  }

  Level level() const {
    return level_.load(std::memory_order_relaxed);
  }

  bool enabled(Level lv) const {
    return lv >= level();
  }

  template <class... Args>
  void log(Level lv, fmt::format_string<Args...> fmt, Args &&...args) {
    if (!enabled(lv))
      return;
    write(lv, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void log(Level lv, const std::string &msg) {
    if (!enabled(lv))
      return;
    write(lv, msg);
  }

private:
  std::atomic<Level> level_{Level::info}; // default INFO
  std::mutex mu_;

  void write(Level lv, const std::string &body) {
    // timestamp (HH:MM:SS)
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char tbuf[9];
    std::strftime(tbuf, sizeof(tbuf), "%H:%M:%S", &tm);

    std::string line = fmt::format("[{} {}] {}\n", tbuf, to_string(lv), body);

    std::scoped_lock lk(mu_);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
};

// convenience macros
#define OLOG_DEBUG(...)                                                        \
  ::opticslab::log::Logger::instance().log(::opticslab::log::Level::debug,     \
                                           __VA_ARGS__)
#define OLOG_INFO(...)                                                         \
  ::opticslab::log::Logger::instance().log(::opticslab::log::Level::info,      \
                                           __VA_ARGS__)
#define OLOG_WARN(...)                                                         \
  ::opticslab::log::Logger::instance().log(::opticslab::log::Level::warn,      \
                                           __VA_ARGS__)
#define OLOG_ERROR(...)                                                        \
  ::opticslab::log::Logger::instance().log(::opticslab::log::Level::error,     \
                                           __VA_ARGS__)

} // namespace opticslab::log
