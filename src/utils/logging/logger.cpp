#include "filmlist_resolver/utils/logger.hpp"
#include "version.h"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace filmlist_resolver {
namespace utils {

namespace {
    constexpr std::string_view ANSI_RESET = "\033[0m";
    constexpr std::string_view ANSI_RED = "\033[31m";
    constexpr std::string_view ANSI_YELLOW = "\033[33m";
    constexpr std::string_view ANSI_GREEN = "\033[32m";
    constexpr std::string_view ANSI_CYAN = "\033[36m";

    enum class TimestampStyle {
        TimeOnly,   // 14:03:07.123
        DateTime    // 2024-05-01 14:03:07.123
    };

    std::string format_timestamp(std::chrono::system_clock::time_point tp, TimestampStyle style) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        const std::time_t time = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_buf{};
        localtime_r(&time, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, style == TimestampStyle::DateTime ? "%Y-%m-%d %H:%M:%S" : "%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::string_view level_tag(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    std::string_view level_color(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return ANSI_CYAN;
            case LogLevel::Info: return ANSI_GREEN;
            case LogLevel::Warning: return ANSI_YELLOW;
            case LogLevel::Error: return ANSI_RED;
            default: return {};
        }
    }

    // [time] [LEVEL] [Component] message
    std::string format_line(const LogMessage& message, TimestampStyle style) {
        std::string line;
        line.reserve(message.m_component.size() + message.m_message.size() + 40);
        line += '[';
        line += format_timestamp(message.m_timestamp, style);
        line += "] [";
        line += level_tag(message.m_level);
        line += "] [";
        line += message.m_component;
        line += "] ";
        line += message.m_message;
        return line;
    }
}

Logger::Logger(LogLevel min_level) : m_min_level(min_level) {}

void Logger::set_level(LogLevel level) {
    m_min_level.store(level);
}

LogLevel Logger::get_level() const {
    return m_min_level.load();
}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::None && level >= m_min_level.load();
}

void Logger::add_sink(SinkPtr sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::Debug, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::Info, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::Warning, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::Error, component, message);
}

void Logger::flush() {
    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (!is_enabled(level)) {
        return;
    }

    const LogMessage log_msg{
        .m_level = level,
        .m_timestamp = std::chrono::system_clock::now(),
        .m_component = std::string(component),
        .m_message = std::string(message)
    };

    // Worker threads log concurrently; one lock keeps each line whole
    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->write(log_msg);
    }
}

// ConsoleSink implementation
ConsoleSink::ConsoleSink(bool use_colors)
    : m_out(std::cout)
    , m_use_colors(use_colors && isatty(fileno(stdout))) {
}

ConsoleSink::ConsoleSink(std::ostream& out)
    : m_out(out)
    , m_use_colors(false) {
}

void ConsoleSink::write(const LogMessage& message) {
    const auto line = format_line(message, TimestampStyle::TimeOnly);

    if (m_use_colors) {
        m_out << level_color(message.m_level) << line << ANSI_RESET << '\n';
    } else {
        m_out << line << '\n';
    }
}

void ConsoleSink::flush() {
    m_out.flush();
}

// FileSink implementation
FileSink::FileSink(const std::filesystem::path& path, bool truncate) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    m_file.open(path, std::ios::out | (truncate ? std::ios::trunc : std::ios::app));
    if (m_file.is_open()) {
        m_file << "=== filmlist-resolver " FILMLIST_VERSION_STRING " run started "
               << format_timestamp(std::chrono::system_clock::now(), TimestampStyle::DateTime) << " ===\n";
        m_file.flush();
    }
}

void FileSink::write(const LogMessage& message) {
    if (m_file.is_open()) {
        m_file << format_line(message, TimestampStyle::DateTime) << '\n';
    }
}

void FileSink::flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

bool FileSink::is_open() const {
    return m_file.is_open();
}

// LoggerManager implementation
std::unique_ptr<Logger> LoggerManager::s_logger;
std::mutex LoggerManager::s_init_mutex;

Logger& LoggerManager::get_instance() {
    std::lock_guard<std::mutex> lock(s_init_mutex);
    if (!s_logger) {
        s_logger = std::make_unique<Logger>(LogLevel::Info);
        s_logger->add_sink(std::make_unique<ConsoleSink>(true));
    }
    return *s_logger;
}

void LoggerManager::set_instance(std::unique_ptr<Logger> logger) {
    std::lock_guard<std::mutex> lock(s_init_mutex);
    s_logger = std::move(logger);
}

} // namespace utils
} // namespace filmlist_resolver
