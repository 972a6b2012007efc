#include "log_handle.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

LogHandle::LogHandle(const LoggingOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    if (options.file) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(*options.file, /*truncate=*/false);
        file_sink->set_pattern(LOG_FORMAT);
        sinks.push_back(std::move(file_sink));
    }
    if (options.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_color_mode(spdlog::color_mode::automatic);
        console_sink->set_pattern(LOG_FORMAT);
        sinks.push_back(std::move(console_sink));
    }
    // quiet and without a log file, still needs a logger to hand out
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    m_logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    m_logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    m_logger->flush_on(spdlog::level::warn);
}

LogHandle::~LogHandle() {
    m_logger->flush();
}
