#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace remit {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

std::string logLevelToString(LogLevel level);
std::optional<LogLevel> logLevelFromString(const std::string& text);

/**
 * Structured logger writing one JSON object per line.
 * Thread-safe and supports correlation IDs for request tracing.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  // Set output stream (default: std::cout)
  void setOutputStream(std::ostream& stream);

  // Logging methods
  void debug(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void info(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void warn(const std::string& message,
            const std::string& component = "",
            const std::string& correlation_id = "");

  void error(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  void fatal(const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Structured logging with key-value pairs, emitted when the builder dies.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "",
               const std::string& correlation_id = "");

    ~LogBuilder();

    LogBuilder& field(const std::string& key, nlohmann::ordered_json value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    std::string correlation_id_;
    nlohmann::ordered_json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const std::string& correlation_id,
           const nlohmann::ordered_json& fields = nlohmann::ordered_json::object());

  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) remit::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) remit::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) remit::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) remit::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) remit::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  remit::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace remit

#endif  // LOGGER_HPP_
