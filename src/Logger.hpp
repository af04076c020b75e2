#pragma once

#ifdef DEBUG
#    define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include <filesystem>
#include <spdlog/spdlog.h>

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(rangeget::logger::get_instance(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(rangeget::logger::get_instance(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(rangeget::logger::get_instance(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(rangeget::logger::get_instance(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(rangeget::logger::get_instance(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(rangeget::logger::get_instance(), __VA_ARGS__)

namespace rangeget::logger {

enum class Level {
    trace    = SPDLOG_LEVEL_TRACE,
    debug    = SPDLOG_LEVEL_DEBUG,
    info     = SPDLOG_LEVEL_INFO,
    warn     = SPDLOG_LEVEL_WARN,
    error    = SPDLOG_LEVEL_ERROR,
    critical = SPDLOG_LEVEL_CRITICAL,
    off      = SPDLOG_LEVEL_OFF
};

/**
 * @brief Route all log records to the given file
 *
 * @param log_file Path of the log file, truncated on every run
 * @note Calling it twice throws: the download threads hold the logger by pointer
 */
void init(const std::filesystem::path& log_file = "./log.txt");

/**
 * @brief Get the logger shared by the writer and the range getters
 *
 * @return The logger; the spdlog default logger until init() succeeds
 */
spdlog::logger* get_instance();

/**
 * @brief Set the level of the logger
 *
 * @param level The level to set the logger to
 */
void set_level(Level level);

/**
 * @brief Flush buffered records, used before the process exits
 */
void flush();

};  // namespace rangeget::logger
