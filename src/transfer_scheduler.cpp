#include "transfer_scheduler.hpp"
#include "configuration.hpp"
#include "connection_limiter.hpp"
#include "output_classifier.hpp"
#include "thread_pool.hpp"
#include "sys/home_directory.hpp"
#include "sys/subprocess.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <spdlog/spdlog.h>

namespace {

bool isAbsolute(const std::string& path) {
    return !path.empty() && (path.front() == '/' || path.front() == '~');
}

} // namespace

TransferScheduler::TransferScheduler(std::shared_ptr<const Configuration> config,
                                     const SyncOptions& options,
                                     std::shared_ptr<sys::CommandExecutor> executor,
                                     std::shared_ptr<spdlog::logger> logger,
                                     size_t workerThreads)
    : m_config(std::move(config)),
      m_command(options.transferCommand()),
      m_dryRun(options.dryRun),
      m_executor(std::move(executor)),
      m_logger(std::move(logger)),
      m_limiter(std::make_unique<ConnectionLimiter>(options.concurrencyLimit)),
      m_pool(std::make_unique<ThreadPool>()) {
    m_pool->start(workerThreads == 0 ? options.concurrencyLimit : workerThreads);
}

TransferScheduler::~TransferScheduler() {
    m_pool->stop();
}

std::vector<std::string> TransferScheduler::sharedElements(const std::string& thisHost,
                                                           const std::string& targetHost) const {
    std::vector<std::string> shared;
    for (const auto& element : m_config->elementsOf(thisHost)) {
        if (m_config->hasElement(targetHost, element)) {
            shared.push_back(element);
        }
    }
    return shared;
}

// Element paths are relative to the home directory unless absolute
std::string TransferScheduler::localPath(const std::string& host, const std::string& element) const {
    const auto& path = m_config->elementPath(host, element);
    return sys::expandUser(isAbsolute(path) ? path : "~/" + path);
}

// <peer>:./<path>, or <_PATH><path> when the peer overrides its base path
std::string TransferScheduler::remotePath(const std::string& host, const std::string& element) const {
    const auto& path = m_config->elementPath(host, element);
    if (const auto base = m_config->pathOverride(host)) {
        return sys::expandUser(*base) + path;
    }
    if (isAbsolute(path)) {
        return host + ":" + path;
    }
    return host + ":./" + path;
}

std::vector<SyncTask> TransferScheduler::buildTasks(const std::string& thisHost, const std::string& targetHost,
                                                    Direction direction) const {
    std::vector<SyncTask> tasks;
    for (const auto& element : sharedElements(thisHost, targetHost)) {
        SyncTask task{element, direction, targetHost, {}, {}, {}};
        auto local = localPath(thisHost, element);
        auto remote = remotePath(targetHost, element);
        if (direction == Direction::UP) {
            task.srcPath = std::move(local);
            task.destPath = std::move(remote);
        } else {
            task.srcPath = std::move(remote);
            task.destPath = std::move(local);
        }
        task.command = m_command.build(task.srcPath, task.destPath);
        tasks.push_back(std::move(task));
    }
    return tasks;
}

TransferResult TransferScheduler::execute(const SyncTask& task, PermitPool& permits,
                                          std::atomic<bool>& cancelled) const {
    TransferResult result;
    result.src = task.srcPath;
    result.dest = task.destPath;

    if (cancelled) {
        result.skipped = true;
        return result;
    }

    Permit permit(permits);
    // the phase may have been cancelled while we waited
    if (cancelled) {
        result.skipped = true;
        return result;
    }

    m_logger->debug("Performing command '{}'", task.command);
    try {
        auto output = m_executor->run(task.command);
        result.out = std::move(output.out);
        result.err = std::move(output.err);
        result.exitStatus = output.exitStatus;
    } catch (const std::exception& e) {
        m_logger->error("Failed to run '{}': {}", task.command, e.what());
        result.err = e.what();
        result.exitStatus = -1;
    }

    if (OutputClassifier::classifyStderr(result.err).isFatal()) {
        cancelled = true;
    }
    return result;
}

PhaseResult TransferScheduler::runPhase(const std::string& thisHost, const std::string& targetHost,
                                        Direction direction) {
    PhaseResult phase;
    const char* prefix = phaseName(direction);

    auto tasks = std::make_shared<std::vector<SyncTask>>(buildTasks(thisHost, targetHost, direction));
    if (tasks->empty()) {
        m_logger->info("    {}: the two hosts do not share common elements", prefix);
        return phase;
    }
    phase.tasks = tasks->size();

    auto permits = m_limiter->pool(targetHost, direction);
    auto cancelled = std::make_shared<std::atomic<bool>>(false);

    std::vector<std::future<TransferResult>> pending;
    pending.reserve(tasks->size());
    for (size_t i = 0; i < tasks->size(); ++i) {
        pending.push_back(m_pool->submit([this, tasks, permits, cancelled, i] {
            return execute((*tasks)[i], *permits, *cancelled);
        }));
    }

    // join every transfer before looking at any result
    std::vector<TransferResult> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }

    phase.skipped = static_cast<size_t>(
        std::count_if(results.begin(), results.end(), [](const TransferResult& r) { return r.skipped; }));

    for (const auto& result : results) {
        if (result.skipped) {
            continue;
        }

        if (!result.out.empty()) {
            m_logger->debug("{}", result.out);
        }
        for (auto& event : OutputClassifier::classifyStdout(result.out, result.src, result.dest, m_dryRun)) {
            if (phase.events.insert(event).second) {
                m_logger->info("    {}", event);
            }
        }

        const auto verdict = OutputClassifier::classifyStderr(result.err);
        if (verdict.isFatal()) {
            m_logger->error("   {}: cannot connect to host '{}'", prefix, targetHost);
            phase.success = false;
            phase.fatal = true;
            return phase;
        }
        if (!verdict.isClean()) {
            m_logger->warn(" {}", verdict.text);
            phase.success = false;
        }
    }
    return phase;
}

bool TransferScheduler::runDirection(const std::string& thisHost, const std::string& targetHost,
                                     Direction direction) {
    return runPhase(thisHost, targetHost, direction).success;
}
