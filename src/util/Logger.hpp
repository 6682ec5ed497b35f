/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility with file rotation
 *
 * Provides structured logging with ISO 8601 timestamps, log levels,
 * component tags, automatic file rotation and an optional observer hook
 * for callers that mirror log lines elsewhere.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information
    INFO,     ///< General operational information
    WARNING,  ///< Warning conditions
    ERROR     ///< Error conditions
};

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive)
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;  ///< Max size before rotation (10MB default)
    int max_files = 7;                               ///< Number of rotated files to keep
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger with file output and rotation
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.initialize(log_dir, "disk-sanitizer-cli");
 * LOG_INFO("WipeOrchestrator", "Session started for " + device.id);
 * @endcode
 *
 * Logging before initialize() is allowed; lines then only reach the
 * console (when enabled) and the observer.
 */
class Logger {
public:
    using Observer = std::function<void(LogLevel, std::string_view component,
                                        std::string_view message)>;

    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Initialize the logger with output directory and application name
     * @param log_dir Directory for log files (created if it doesn't exist)
     * @param app_name Application name used in log filename
     * @param min_level Minimum level to log (default: INFO)
     * @param policy Rotation policy (default: 10MB, 7 files)
     * @return true if initialized successfully
     *
     * Log files are named {app_name}.log, rotated files {app_name}.1.log, ...
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO, LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Enable/disable console output (stderr)
     */
    void set_console_output(bool enable);

    /**
     * @brief Install an observer receiving every line at or above the minimum level
     * @param observer Callback, or an empty function to remove it
     *
     * The observer runs with the logger lock held and must not log itself.
     */
    void set_observer(Observer observer);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Shutdown the logger, flushing and closing files
     */
    void shutdown();

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto get_timestamp() -> std::string;
    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    void check_and_rotate();
    void rotate_logs();
    auto open_log_file() -> bool;
    [[nodiscard]] auto rotated_path(int index) const -> std::filesystem::path;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    Observer observer_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
};

// Convenience macros for component-based logging
#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
