#ifndef SYNC_MANAGER_HPP
#define SYNC_MANAGER_HPP

#include "host_resolver.hpp"
#include "run_report.hpp"
#include "sync_options.hpp"
#include "sync_task.hpp"

#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}
namespace sys {
class CommandExecutor;
}

class Configuration;
class TransferScheduler;

/// class that drives a synchronization run between this host and its peers
class SyncManager
{
public:
    SyncManager(std::shared_ptr<const Configuration> config,
                SyncOptions options,
                std::shared_ptr<sys::CommandExecutor> executor,
                std::shared_ptr<spdlog::logger> logger);
    ~SyncManager();
    SyncManager(const SyncManager&) = delete;
    SyncManager& operator=(const SyncManager&) = delete;
    SyncManager(SyncManager&&) = delete;
    SyncManager& operator=(SyncManager&&) = delete;

    /// @brief Preflight once, then every requested phase for every target
    /// @return true if every host synchronized without errors
    bool run(const HostSet& hosts);

    /// @brief Both phases (as requested) with one peer
    bool syncHost(const std::string& thisHost, const std::string& targetHost);

    /// @brief Run the health check command and log what it prints
    void runPreflight();

    /// @brief Report of the last run, empty before run()
    const RunReport& report() const { return m_report; }

private:
    std::shared_ptr<const Configuration> m_config;
    SyncOptions m_options;
    std::shared_ptr<sys::CommandExecutor> m_executor;
    std::shared_ptr<spdlog::logger> m_logger;
    std::unique_ptr<TransferScheduler> m_scheduler;
    RunReport m_report;
};


#endif //SYNC_MANAGER_HPP
