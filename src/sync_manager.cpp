#include "sync_manager.hpp"
#include "configuration.hpp"
#include "transfer_scheduler.hpp"
#include "sys/subprocess.hpp"

#include <spdlog/spdlog.h>
#include <system_error>

namespace {

std::string trimNewlines(const std::string& text) {
    const auto first = text.find_first_not_of('\n');
    if (first == std::string::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of('\n') - first + 1);
}

} // namespace

SyncManager::SyncManager(std::shared_ptr<const Configuration> config,
                         SyncOptions options,
                         std::shared_ptr<sys::CommandExecutor> executor,
                         std::shared_ptr<spdlog::logger> logger)
    : m_config(std::move(config)),
      m_options(std::move(options)),
      m_executor(std::move(executor)),
      m_logger(std::move(logger)),
      m_scheduler(std::make_unique<TransferScheduler>(m_config, m_options, m_executor, m_logger)),
      m_report({}, m_options.dryRun) {}

SyncManager::~SyncManager() = default;

void SyncManager::runPreflight() {
    if (m_options.preflightCommand.empty()) {
        return;
    }

    m_logger->debug("Performing pre-command: '{}'", m_options.preflightCommand);
    try {
        const auto output = m_executor->run(m_options.preflightCommand);
        if (const auto out = trimNewlines(output.out); !out.empty()) {
            m_logger->info("{}", out);
        }
        if (const auto err = trimNewlines(output.err); !err.empty()) {
            m_logger->error("{}", err);
        }
    } catch (const std::system_error& e) {
        m_logger->error("Failed to run pre-command: {}", e.what());
    }
    m_logger->info("");
}

bool SyncManager::syncHost(const std::string& thisHost, const std::string& targetHost) {
    m_logger->debug("Started synchronization between '{}' and '{}'", thisHost, targetHost);

    bool successUp = true;
    bool successDown = true;
    if (m_options.performUp()) {
        m_logger->info("Started upload '{}' --> '{}'", thisHost, targetHost);
        const auto phase = m_scheduler->runPhase(thisHost, targetHost, Direction::UP);
        m_report.recordPhase(targetHost, Direction::UP, phase);
        successUp = phase.success;
    }
    if (m_options.performDown()) {
        m_logger->info("Started download '{}' --> '{}'", targetHost, thisHost);
        const auto phase = m_scheduler->runPhase(thisHost, targetHost, Direction::DOWN);
        m_report.recordPhase(targetHost, Direction::DOWN, phase);
        successDown = phase.success;
    }
    const bool successful = successUp && successDown;
    m_report.recordHost(targetHost, successful);

    const char* prefix = m_options.dryRun ? "Simulated" : "Completed";
    if (successful) {
        m_logger->info("{} synchronization between '{}' and '{}'", prefix, thisHost, targetHost);
    } else {
        m_logger->warn("{} synchronization between '{}' and '{}' with error(s)", prefix, thisHost, targetHost);
    }
    m_logger->info("");
    return successful;
}

bool SyncManager::run(const HostSet& hosts) {
    m_report = RunReport(hosts.thisHost, m_options.dryRun);

    runPreflight();

    bool successful = true;
    for (const auto& target : hosts.targetHosts) {
        // one unreachable peer must not stop the others
        successful = syncHost(hosts.thisHost, target) && successful;
    }

    m_logger->debug("Finished synchronization");
    return successful;
}
