// Plans a synchronization from an in-memory configuration and prints the
// rsync commands it would run, without starting any process.
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "configuration.hpp"
#include "host_resolver.hpp"
#include "log_handle.hpp"
#include "sync_manager.hpp"
#include "sys/subprocess.hpp"

// Executor that records commands instead of running them
class PrintingExecutor : public sys::CommandExecutor {
public:
    sys::ProcessOutput run(const std::string& command) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_commands.push_back(command);
        return {};
    }

    std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_commands;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_commands;
};

int main(int argc, char* argv[]) {
    const std::string localName = argc > 1 ? argv[1] : "laptop.example.org";

    try {
        auto config = std::make_shared<const Configuration>(Configuration::fromYaml(R"(
ALIASES:
  nas: storage
laptop:
  bashrc: .bashrc
  notes: Documents/notes/
storage:
  _PATH: /mnt/storage/home/
  notes: notes/
desktop:
  bashrc: .bashrc
  notes: notes/
)"));

        LoggingOptions logging;
        logging.verbose = true;
        LogHandle log(logging);

        HostResolver resolver(config, log.logger());
        const auto hosts = resolver.resolve(localName, {"all"});

        SyncOptions options;
        options.dryRun = true;
        options.preflightCommand.clear();

        auto executor = std::make_shared<PrintingExecutor>();
        SyncManager manager(config, options, executor, log.logger());
        manager.run(hosts);

        std::cout << "\nCommands of this run:\n";
        for (const auto& command : executor->commands()) {
            std::cout << "  " << command << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Example failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
