#ifndef RUN_REPORT_HPP
#define RUN_REPORT_HPP

#include "sync_task.hpp"
#include "transfer_scheduler.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace Json {
class Value;
}

/// Record of a synchronization run, written as JSON with --report.
class RunReport {
public:
    struct PhaseRecord {
        Direction direction;
        PhaseResult result;
    };

    struct HostRecord {
        std::string host;
        bool success = true;
        std::vector<PhaseRecord> phases;
    };

    RunReport(std::string thisHost, bool dryRun);

    void recordPhase(const std::string& host, Direction direction, const PhaseResult& result);
    void recordHost(const std::string& host, bool success);

    const std::vector<HostRecord>& hosts() const { return m_hosts; }
    bool success() const;

    Json::Value toJson() const;

    /// @throws std::runtime_error if the file cannot be written
    void writeTo(const std::string& path) const;

private:
    HostRecord& hostRecord(const std::string& host);

    std::string m_thisHost;
    bool m_dryRun;
    std::chrono::system_clock::time_point m_started;
    std::vector<HostRecord> m_hosts;
};

#endif //RUN_REPORT_HPP
