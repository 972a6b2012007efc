#include "run_report.hpp"

#include <algorithm>
#include <fstream>
#include <json/json.h>
#include <stdexcept>

RunReport::RunReport(std::string thisHost, bool dryRun)
    : m_thisHost(std::move(thisHost)),
      m_dryRun(dryRun),
      m_started(std::chrono::system_clock::now()) {}

RunReport::HostRecord& RunReport::hostRecord(const std::string& host) {
    auto it = std::find_if(m_hosts.begin(), m_hosts.end(),
                           [&host](const HostRecord& record) { return record.host == host; });
    if (it != m_hosts.end()) {
        return *it;
    }
    m_hosts.push_back(HostRecord{host, true, {}});
    return m_hosts.back();
}

void RunReport::recordPhase(const std::string& host, Direction direction, const PhaseResult& result) {
    hostRecord(host).phases.push_back(PhaseRecord{direction, result});
}

void RunReport::recordHost(const std::string& host, bool success) {
    hostRecord(host).success = success;
}

bool RunReport::success() const {
    return std::all_of(m_hosts.begin(), m_hosts.end(), [](const HostRecord& record) { return record.success; });
}

Json::Value RunReport::toJson() const {
    Json::Value json;
    json["thisHost"] = m_thisHost;
    json["dryRun"] = m_dryRun;
    json["started"] = static_cast<Json::Int64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(m_started.time_since_epoch()).count());
    json["success"] = success();

    json["hosts"] = Json::Value(Json::arrayValue);
    for (const auto& host : m_hosts) {
        Json::Value hostJson;
        hostJson["host"] = host.host;
        hostJson["success"] = host.success;
        hostJson["phases"] = Json::Value(Json::arrayValue);

        for (const auto& phase : host.phases) {
            Json::Value phaseJson;
            phaseJson["direction"] = toString(phase.direction);
            phaseJson["success"] = phase.result.success;
            phaseJson["fatal"] = phase.result.fatal;
            phaseJson["tasks"] = static_cast<Json::UInt64>(phase.result.tasks);
            phaseJson["skipped"] = static_cast<Json::UInt64>(phase.result.skipped);
            phaseJson["events"] = Json::Value(Json::arrayValue);
            for (const auto& event : phase.result.events) {
                phaseJson["events"].append(event);
            }
            hostJson["phases"].append(phaseJson);
        }
        json["hosts"].append(hostJson);
    }
    return json;
}

void RunReport::writeTo(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open report file '" + path + "'");
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, toJson()) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write report file '" + path + "'");
    }
}
