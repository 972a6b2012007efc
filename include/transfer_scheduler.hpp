#ifndef TRANSFER_SCHEDULER_HPP
#define TRANSFER_SCHEDULER_HPP

#include "sync_options.hpp"
#include "sync_task.hpp"
#include "transfer_command.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}
namespace sys {
class CommandExecutor;
}

class Configuration;
class ConnectionLimiter;
class PermitPool;
class ThreadPool;

/// Outcome of one (peer, direction) phase.
struct PhaseResult {
    bool success = true;
    bool fatal = false;   // peer was unreachable
    size_t tasks = 0;     // transfers built for the phase
    size_t skipped = 0;   // transfers never started after a fatal verdict
    std::set<std::string> events;
};

/// Runs the element transfers between this host and one peer.
///
/// Transfers of a phase run on a worker pool. Each one takes a permit of the
/// (peer, direction) pair before its process starts, capping the number of
/// simultaneous connections to `concurrencyLimit`.
class TransferScheduler {
public:
    /// @param workerThreads size of the worker pool, 0 uses the concurrency limit
    TransferScheduler(std::shared_ptr<const Configuration> config,
                      const SyncOptions& options,
                      std::shared_ptr<sys::CommandExecutor> executor,
                      std::shared_ptr<spdlog::logger> logger,
                      size_t workerThreads = 0);
    ~TransferScheduler();
    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;
    TransferScheduler(TransferScheduler&&) = delete;
    TransferScheduler& operator=(TransferScheduler&&) = delete;

    /// @brief Elements configured on both hosts, in this host's order
    std::vector<std::string> sharedElements(const std::string& thisHost, const std::string& targetHost) const;

    std::vector<SyncTask> buildTasks(const std::string& thisHost, const std::string& targetHost,
                                     Direction direction) const;

    /// @brief Transfer every shared element in one direction
    /// @return false if the peer was unreachable or any transfer reported an error
    bool runDirection(const std::string& thisHost, const std::string& targetHost, Direction direction);

    PhaseResult runPhase(const std::string& thisHost, const std::string& targetHost, Direction direction);

    std::string localPath(const std::string& host, const std::string& element) const;
    std::string remotePath(const std::string& host, const std::string& element) const;

private:
    TransferResult execute(const SyncTask& task, PermitPool& permits, std::atomic<bool>& cancelled) const;

    std::shared_ptr<const Configuration> m_config;
    TransferCommand m_command;
    bool m_dryRun;
    std::shared_ptr<sys::CommandExecutor> m_executor;
    std::shared_ptr<spdlog::logger> m_logger;
    std::unique_ptr<ConnectionLimiter> m_limiter;
    std::unique_ptr<ThreadPool> m_pool;
};

#endif //TRANSFER_SCHEDULER_HPP
