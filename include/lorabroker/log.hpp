/**
 * @file log.hpp
 * @brief Minimal level-filtered line logger for the broker and its wrappers.
 *
 * @details
 * One event, one line, shell-friendly:
 *
 * ```
 * [WARN ] Broker: uplink rejected devaddr=02030203 kind=behavioural reason=no device authenticates this frame
 * ```
 *
 * - Writes to any `std::ostream` (std::cerr by default).
 * - `with_tag()` hands out a child logger sharing the same sink and level,
 *   so each component labels its own lines.
 * - Safe to share between threads: the sink is guarded by a mutex owned by
 *   the root logger, and the level is atomic so set_level() may race with
 *   logging calls on other threads.
 */
#ifndef LORABROKER_LOG_HPP
#define LORABROKER_LOG_HPP

#include <stdint.h>
#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace lorabroker {

enum class LogLevel : uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// @brief Parse "debug|info|warn|error|off" (case-sensitive). Returns false on anything else.
bool parse_log_level(const std::string& s, LogLevel& out);

const char* to_string(LogLevel level);

class Logger {
public:
  /// @brief Root logger writing to `out`. `out` must outlive every logger derived from it.
  explicit Logger(std::ostream& out, LogLevel min = LogLevel::Info, std::string tag = "lorabroker");

  /// @brief Child logger with another tag, same sink, same level.
  Logger with_tag(const std::string& tag) const;

  void set_level(LogLevel min) { min_->store(min, std::memory_order_relaxed); }
  LogLevel level() const { return min_->load(std::memory_order_relaxed); }
  bool enabled(LogLevel lvl) const { return lvl >= level() && lvl != LogLevel::Off; }

  void log(LogLevel lvl, const std::string& msg) const;
  void debug(const std::string& msg) const { log(LogLevel::Debug, msg); }
  void info (const std::string& msg) const { log(LogLevel::Info,  msg); }
  void warn (const std::string& msg) const { log(LogLevel::Warn,  msg); }
  void error(const std::string& msg) const { log(LogLevel::Error, msg); }

private:
  struct Sink {
    std::ostream* out;
    std::mutex    mu;
  };

  using Level = std::atomic<LogLevel>;

  Logger(std::shared_ptr<Sink> sink, std::shared_ptr<Level> min, std::string tag);

  std::shared_ptr<Sink>  sink_;
  std::shared_ptr<Level> min_;   // shared so set_level() reaches every child
  std::string            tag_;
};

} // namespace lorabroker

#endif // LORABROKER_LOG_HPP
