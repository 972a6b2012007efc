// main file for host synchronization


#include <unistd.h>
#include <cerrno>
#include <climits>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "configuration.hpp"
#include "host_resolver.hpp"
#include "log_handle.hpp"
#include "option_parser.hpp"
#include "sync_error.hpp"
#include "sync_manager.hpp"
#include "sys/subprocess.hpp"

namespace {

constexpr const char* NAME = "hostsync";
constexpr const char* VERSION = "1.0.0";
const std::string DELIMITER(50, '-');

enum ExitStatus {
    EXIT_OK = 0,
    EXIT_FATAL = 1,        // usage, configuration or host resolution error
    EXIT_HOST_ERRORS = 2,  // at least one host finished with errors
};

std::string localHostName() {
    char name[HOST_NAME_MAX + 1] = {};
    if (::gethostname(name, sizeof(name)) == -1) {
        throw std::system_error(errno, std::system_category(), "Failed to get host name");
    }
    return name;
}

void printWelcome(spdlog::logger& logger, const SyncOptions& options) {
    logger.info(DELIMITER);
    logger.info("{} {}: synchronization between hosts over SSH", NAME, VERSION);
    logger.info(DELIMITER);
    logger.debug("Started synchronization");

    if (options.dryRun) {
        logger.info("Dry run, nothing will be transferred");
    }
    if (options.deleteExtraneous) {
        logger.warn("--delete option may lead to loss of data");
        // give the user a moment to abort
        std::this_thread::sleep_for(std::chrono::seconds(2));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    try {
        cmd = OptionParser(argc, argv).parse();
    } catch (const OptionError& e) {
        std::cerr << NAME << ": " << e.what() << "\n\n" << OptionParser::usage(NAME);
        return EXIT_FATAL;
    }
    if (cmd.showHelp) {
        std::cout << OptionParser::usage(NAME);
        return EXIT_OK;
    }
    if (cmd.showVersion) {
        std::cout << NAME << " " << VERSION << std::endl;
        return EXIT_OK;
    }

    LoggingOptions logging;
    logging.verbose = cmd.verbose;
    logging.console = !cmd.quiet;
    if (!cmd.noLogfile) {
        logging.file = cmd.logFile;
    }

    std::unique_ptr<LogHandle> log;
    try {
        log = std::make_unique<LogHandle>(logging);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << NAME << ": cannot set up logging: " << e.what() << std::endl;
        return EXIT_FATAL;
    }
    auto logger = log->logger();

    printWelcome(*logger, cmd.sync);

    try {
        auto config = std::make_shared<const Configuration>(Configuration::fromFile(cmd.configFile));
        logger->debug("Successfully read configuration file '{}'", cmd.configFile);

        const HostResolver resolver(config, logger);
        const auto hosts = resolver.resolve(localHostName(), cmd.targets);

        SyncManager manager(config, cmd.sync, std::make_shared<sys::ShellExecutor>(), logger);
        const bool successful = manager.run(hosts);

        if (cmd.reportFile) {
            manager.report().writeTo(*cmd.reportFile);
            logger->debug("Wrote report to '{}'", *cmd.reportFile);
        }

        logger->info(DELIMITER);
        return successful ? EXIT_OK : EXIT_HOST_ERRORS;
    } catch (const SyncError& e) {
        logger->error("{}", e.what());
    } catch (const std::exception& e) {
        logger->error("Synchronization failed: {}", e.what());
    }
    return EXIT_FATAL;
}
