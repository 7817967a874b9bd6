#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <source_location>
#include <string>
#include <string_view>

namespace mapikit {

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) {
    switch (level) {
      case LogLevel::TRACE:
        spdlog::set_level(spdlog::level::trace);
        break;
      case LogLevel::DEBUG:
        spdlog::set_level(spdlog::level::debug);
        break;
      case LogLevel::INFO:
        spdlog::set_level(spdlog::level::info);
        break;
      case LogLevel::WARN:
        spdlog::set_level(spdlog::level::warn);
        break;
      case LogLevel::ERROR:
        spdlog::set_level(spdlog::level::err);
        break;
      case LogLevel::OFF:
        spdlog::set_level(spdlog::level::off);
        break;
    }
  }

  LogLevel getLevel() const {
    switch (spdlog::get_level()) {
      case spdlog::level::trace:
        return LogLevel::TRACE;
      case spdlog::level::debug:
        return LogLevel::DEBUG;
      case spdlog::level::info:
        return LogLevel::INFO;
      case spdlog::level::warn:
        return LogLevel::WARN;
      case spdlog::level::err:
      case spdlog::level::critical:
        return LogLevel::ERROR;
      case spdlog::level::off:
      case spdlog::level::n_levels:
        return LogLevel::OFF;
    }
    return LogLevel::INFO;
  }

  bool isDebugEnabled() const {
    return spdlog::should_log(spdlog::level::debug);
  }

  void setLogToFile(const std::string& filename) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true);
      auto file_logger =
          std::make_shared<spdlog::logger>("mapikit_file", file_sink);
      file_logger->set_level(spdlog::get_level());
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::error("Log initialization failed: {}", ex.what());
    }
  }

  template <typename... Args>
  void log(spdlog::level::level_enum level,
           const std::source_location& location,
           spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if (!spdlog::should_log(level)) {
      return;
    }
    std::string_view path(location.file_name());
    size_t pos = path.find_last_of("/\\");
    std::string_view filename =
        (pos == std::string_view::npos) ? path : path.substr(pos + 1);

    std::string message =
        spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
    spdlog::log(level, "{} [{}:{}]", message, filename, location.line());
  }

 private:
  Logger() { spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v"); }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

/**
 * Format string bundled with the caller's source location, so the variadic
 * helpers below can still default the location.
 */
template <typename... Args>
struct LocatedFormat {
  template <typename S>
  consteval LocatedFormat(
      const S& s,
      const std::source_location& loc = std::source_location::current())
      : fmt(s), location(loc) {}

  spdlog::format_string_t<Args...> fmt;
  std::source_location location;
};

template <typename... Args>
using located_format_t = LocatedFormat<std::type_identity_t<Args>...>;

template <typename... Args>
inline void log_trace(located_format_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::trace, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_debug(located_format_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::debug, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_info(located_format_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::info, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warn(located_format_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::warn, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_error(located_format_t<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::err, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

// Contextual logger that prefixes every message with a subsystem name
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(located_format_t<Args...> fmt, Args&&... args) const {
    emit(spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(located_format_t<Args...> fmt, Args&&... args) const {
    emit(spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(located_format_t<Args...> fmt, Args&&... args) const {
    emit(spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(located_format_t<Args...> fmt, Args&&... args) const {
    emit(spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  const std::string& prefix() const { return prefix_; }

 private:
  template <typename... Args>
  void emit(spdlog::level::level_enum level,
            const located_format_t<Args...>& fmt, Args&&... args) const {
    if (!spdlog::should_log(level)) {
      return;
    }
    std::string message =
        spdlog::fmt_lib::format(fmt.fmt, std::forward<Args>(args)...);
    Logger::getInstance().log(level, fmt.location, "{}: {}", prefix_,
                              message);
  }

  std::string prefix_;
};

}  // namespace mapikit

#endif  // LOGGER_HPP
