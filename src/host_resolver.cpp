#include "host_resolver.hpp"
#include "configuration.hpp"
#include "sync_error.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

HostResolver::HostResolver(std::shared_ptr<const Configuration> config, std::shared_ptr<spdlog::logger> logger)
    : m_config(std::move(config)), m_logger(std::move(logger)) {}

std::vector<std::string> HostResolver::substituteAliases(const std::vector<std::string>& targets) const {
    std::vector<std::string> resolved;
    resolved.reserve(targets.size());
    for (const auto& target : targets) {
        if (auto host = m_config->resolveAlias(target)) {
            m_logger->info("Aliased '{}' to '{}'", target, *host);
            resolved.push_back(std::move(*host));
        } else {
            resolved.push_back(target);
        }
    }
    return resolved;
}

HostSet HostResolver::resolve(const std::string& localName, const std::vector<std::string>& targets) const {
    const auto& hosts = m_config->hosts();
    const auto contains = [](const std::string& name, const std::string& host) {
        return name.find(host) != std::string::npos;
    };

    HostSet set;
    std::vector<std::string> otherHosts;
    for (const auto& host : hosts) {
        if (contains(localName, host)) {
            if (set.thisHost.empty()) {
                set.thisHost = host;
            }
        } else {
            otherHosts.push_back(host);
        }
    }

    const auto requested = substituteAliases(targets);
    const auto addTarget = [&set](const std::string& host) {
        if (std::find(set.targetHosts.begin(), set.targetHosts.end(), host) == set.targetHosts.end()) {
            set.targetHosts.push_back(host);
        }
    };

    if (std::find(requested.begin(), requested.end(), ALL_HOSTS) != requested.end()) {
        std::for_each(otherHosts.begin(), otherHosts.end(), addTarget);
    } else {
        for (const auto& token : requested) {
            const auto match = std::find_if(hosts.begin(), hosts.end(),
                                            [&](const std::string& host) { return contains(token, host); });
            if (match == hosts.end()) {
                m_logger->warn("Could not find host '{}' in configuration file '{}'", token, m_config->source());
                continue;
            }
            addTarget(*match);
        }
    }

    if (set.thisHost.empty()) {
        throw NoLocalHostMatch("Could not find current machine '" + localName + "' in configuration file '"
                               + m_config->source() + "'");
    }
    if (set.targetHosts.empty()) {
        throw NoTargetHostMatch(fmt::format("Could not find any valid host for {} in configuration file '{}'",
                                            targets, m_config->source()));
    }
    if (std::find(set.targetHosts.begin(), set.targetHosts.end(), set.thisHost) != set.targetHosts.end()) {
        throw SelfSyncRequested(set.thisHost);
    }

    m_logger->debug("Found hosts: current machine: '{}', target host(s): {}", set.thisHost, set.targetHosts);
    return set;
}
