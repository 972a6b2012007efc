#ifndef LOG_HANDLE_HPP
#define LOG_HANDLE_HPP

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

struct LoggingOptions {
    bool verbose = false;              // debug instead of info
    bool console = true;
    std::optional<std::string> file;   // appended to, created if missing
};

/// Owns the logger of one run. Built once in main and handed to the
/// components that log; flushes and closes the sinks on destruction.
class LogHandle {
public:
    static constexpr const char* LOGGER_NAME = "hostsync";
    static constexpr const char* LOG_FORMAT = "%Y-%m-%d %H:%M:%S,%e %^%l%$: %v";

    /// @throws spdlog::spdlog_ex if the log file cannot be opened
    explicit LogHandle(const LoggingOptions& options);
    ~LogHandle();
    LogHandle(const LogHandle&) = delete;
    LogHandle& operator=(const LogHandle&) = delete;

    std::shared_ptr<spdlog::logger> logger() const { return m_logger; }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

#endif //LOG_HANDLE_HPP
