#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "logger.hpp"

namespace mapikit {

// Default configuration constants
namespace defaults {
constexpr size_t MAX_TOTAL_BYTES = 0;  // 0 = unlimited
constexpr uint8_t POISON_BYTE = 0xCD;
constexpr uint8_t FREED_POISON_BYTE = 0xDD;
constexpr LogLevel LOG_LEVEL = LogLevel::INFO;
}  // namespace defaults

// Configuration parameters for the in-process heap allocator
class HeapAllocatorConfig {
 private:
  // Upper bound on bytes outstanding across all live trees (0 = unlimited).
  // Requests beyond it fail with E_OUTOFMEMORY.
  size_t max_total_bytes = defaults::MAX_TOTAL_BYTES;

  // Fill fresh blocks with poison_byte so reads of unwritten memory stand out
  bool poison_on_allocate = false;

  // Fill blocks with FREED_POISON_BYTE before releasing them
  bool poison_on_free = false;

  uint8_t poison_byte = defaults::POISON_BYTE;

  // Log every foreign call at debug level
  bool trace_calls = false;

  friend class HeapAllocatorConfigBuilder;

 public:
  size_t get_max_total_bytes() const { return max_total_bytes; }
  bool is_poison_on_allocate() const { return poison_on_allocate; }
  bool is_poison_on_free() const { return poison_on_free; }
  uint8_t get_poison_byte() const { return poison_byte; }
  bool is_trace_calls() const { return trace_calls; }
};

// Builder class for HeapAllocatorConfig
class HeapAllocatorConfigBuilder {
 private:
  HeapAllocatorConfig config;

 public:
  HeapAllocatorConfigBuilder() = default;

  HeapAllocatorConfigBuilder &with_max_total_bytes(size_t bytes) {
    config.max_total_bytes = bytes;
    return *this;
  }

  HeapAllocatorConfigBuilder &with_poison_on_allocate(bool enabled) {
    config.poison_on_allocate = enabled;
    return *this;
  }

  HeapAllocatorConfigBuilder &with_poison_on_free(bool enabled) {
    config.poison_on_free = enabled;
    return *this;
  }

  HeapAllocatorConfigBuilder &with_poison_byte(uint8_t value) {
    config.poison_byte = value;
    return *this;
  }

  HeapAllocatorConfigBuilder &with_trace_calls(bool enabled) {
    config.trace_calls = enabled;
    return *this;
  }

  [[nodiscard]] HeapAllocatorConfig build() const { return config; }
};

// Logging setup shared by every component
class LoggingConfig {
 private:
  LogLevel level = defaults::LOG_LEVEL;

  // Empty means log to the default console sink
  std::string log_file = "";

  friend class LoggingConfigBuilder;

 public:
  LogLevel get_level() const { return level; }
  std::string get_log_file() const { return log_file; }
};

class LoggingConfigBuilder {
 private:
  LoggingConfig config;

 public:
  LoggingConfigBuilder &with_level(LogLevel level) {
    config.level = level;
    return *this;
  }

  LoggingConfigBuilder &with_log_file(const std::string &path) {
    config.log_file = path;
    return *this;
  }

  [[nodiscard]] LoggingConfig build() const { return config; }
};

inline HeapAllocatorConfigBuilder make_heap_config() { return {}; }

inline LoggingConfigBuilder make_logging_config() { return {}; }

inline void configure_logging(const LoggingConfig &config) {
  Logger &logger = Logger::getInstance();
  logger.setLevel(config.get_level());
  if (!config.get_log_file().empty()) {
    logger.setLogToFile(config.get_log_file());
  }
}

}  // namespace mapikit

#endif  // CONFIG_HPP
