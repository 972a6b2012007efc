#ifndef OPTION_PARSER_HPP
#define OPTION_PARSER_HPP

#include "sync_options.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class OptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    std::vector<std::string> targets;
    std::string configFile;
    std::string logFile;
    std::optional<std::string> reportFile;
    bool quiet = false;
    bool noLogfile = false;
    bool verbose = false;
    bool showHelp = false;
    bool showVersion = false;
    SyncOptions sync;
};

class OptionParser {
public:
    static constexpr const char* DEFAULT_CONFIG = "~/.sync.yml";
    static constexpr const char* DEFAULT_LOG = "~/.sync.log";

    OptionParser(int argc, char* argv[]);

    /// @throws OptionError on unknown options, bad values or missing targets
    CommandLine parse() const;

    static std::string usage(const std::string& program);

private:
    static size_t toJobs(const std::string& value);

    int m_argc;
    char** m_argv;
};

#endif // OPTION_PARSER_HPP
