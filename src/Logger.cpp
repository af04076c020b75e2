#include "Logger.hpp"

#include "Error.hpp"

#include <memory>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>

namespace {

std::shared_ptr<spdlog::logger> global_logger{nullptr};
rangeget::logger::Level         global_level{rangeget::logger::Level::off};
std::mutex                      logger_mutex;

}  // namespace

namespace rangeget::logger {

void init(const std::filesystem::path& log_file) {
    std::scoped_lock lock(logger_mutex);

    if (global_logger) {
        err::throw_with_trace("Logger already initialized");
    }

    // Truncate: a resumed download starts a new log
    global_logger = spdlog::basic_logger_mt("rangeget-logger", log_file.string(), true);
    global_logger->set_level(static_cast<spdlog::level::level_enum>(global_level));
    global_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] %v");
    global_logger->flush_on(spdlog::level::warn);
}

spdlog::logger* get_instance() {
    if (!global_logger) {
        return spdlog::default_logger_raw();
    }
    return global_logger.get();
}

void set_level(Level level) {
    global_level = level;
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
    if (global_logger) {
        global_logger->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

void flush() {
    if (global_logger) {
        global_logger->flush();
    }
}

}  // namespace rangeget::logger
