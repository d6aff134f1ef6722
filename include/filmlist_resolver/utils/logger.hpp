#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace filmlist_resolver::utils {

enum class LogLevel : std::uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  None = 4
};

struct LogMessage {
  LogLevel m_level;
  std::chrono::system_clock::time_point m_timestamp;
  std::string m_component;
  std::string m_message;
};

class LogSink {
 public:
  virtual ~LogSink() = default;
  virtual void write(const LogMessage& message) = 0;
  virtual void flush() = 0;
};

// Thread-safe front end; pipeline workers log through one shared instance
class Logger {
 public:
  using SinkPtr = std::unique_ptr<LogSink>;

  explicit Logger(LogLevel min_level = LogLevel::Info);
  ~Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
  Logger(Logger&&) = delete;
  Logger& operator=(Logger&&) = delete;

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel get_level() const;
  [[nodiscard]] bool is_enabled(LogLevel level) const;
  void add_sink(SinkPtr sink);

  void debug(std::string_view component, std::string_view message);
  void info(std::string_view component, std::string_view message);
  void warning(std::string_view component, std::string_view message);
  void error(std::string_view component, std::string_view message);

  void flush();

 private:
  void log(LogLevel level, std::string_view component, std::string_view message);

  std::atomic<LogLevel> m_min_level;
  std::vector<SinkPtr> m_sinks;
  std::mutex m_mutex;
};

// Every level goes to standard output (or the given stream)
class ConsoleSink : public LogSink {
 public:
  explicit ConsoleSink(bool use_colors = true);
  explicit ConsoleSink(std::ostream& out);

  void write(const LogMessage& message) override;
  void flush() override;

 private:
  std::ostream& m_out;
  bool m_use_colors;
};

// Appends dated lines; each run opens with a banner line
class FileSink : public LogSink {
 public:
  explicit FileSink(const std::filesystem::path& path, bool truncate = false);

  void write(const LogMessage& message) override;
  void flush() override;
  [[nodiscard]] bool is_open() const;

 private:
  std::ofstream m_file;
};

// Process-wide logger; replaced once at startup
class LoggerManager {
 public:
  static Logger& get_instance();
  static void set_instance(std::unique_ptr<Logger> logger);

 private:
  static std::unique_ptr<Logger> s_logger;
  static std::mutex s_init_mutex;
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::None: return "none";
        default: return "info";
    }
}

inline LogLevel log_level_from_string(const std::string& str) {
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warning" || str == "warn") return LogLevel::Warning;
    if (str == "error") return LogLevel::Error;
    if (str == "none") return LogLevel::None;
    return LogLevel::Info;
}

// The message expression is only evaluated when the level is enabled
#define FILMLIST_LOG_AT(level, method, component, message)                \
  do {                                                                    \
    auto& filmlist_logger_ =                                              \
        filmlist_resolver::utils::LoggerManager::get_instance();          \
    if (filmlist_logger_.is_enabled(level)) {                             \
      filmlist_logger_.method(component, message);                        \
    }                                                                     \
  } while (false)

#define FILMLIST_LOG_DEBUG(component, message)                              \
  FILMLIST_LOG_AT(filmlist_resolver::utils::LogLevel::Debug, debug,         \
                  component, message)

#define FILMLIST_LOG_INFO(component, message)                               \
  FILMLIST_LOG_AT(filmlist_resolver::utils::LogLevel::Info, info,           \
                  component, message)

#define FILMLIST_LOG_WARNING(component, message)                            \
  FILMLIST_LOG_AT(filmlist_resolver::utils::LogLevel::Warning, warning,     \
                  component, message)

#define FILMLIST_LOG_ERROR(component, message)                              \
  FILMLIST_LOG_AT(filmlist_resolver::utils::LogLevel::Error, error,         \
                  component, message)

}  // namespace filmlist_resolver::utils
