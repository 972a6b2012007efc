#ifndef HOST_RESOLVER_HPP
#define HOST_RESOLVER_HPP

#include <memory>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

class Configuration;

/// The machine we run on and the peers of this run.
struct HostSet {
    std::string thisHost;
    std::vector<std::string> targetHosts;
};

/// Maps the local network name and the requested targets onto configured hosts.
///
/// Matching is by substring: a configured host matches a name when the host
/// is contained in it, so "laptop" matches "laptop.example.org". When several
/// hosts match, the first one in configuration order wins.
class HostResolver {
public:
    static constexpr const char* ALL_HOSTS = "all";

    HostResolver(std::shared_ptr<const Configuration> config, std::shared_ptr<spdlog::logger> logger);

    /// @throws NoLocalHostMatch, NoTargetHostMatch, SelfSyncRequested
    HostSet resolve(const std::string& localName, const std::vector<std::string>& targets) const;

    /// @brief Replace every alias among the targets by its host
    std::vector<std::string> substituteAliases(const std::vector<std::string>& targets) const;

private:
    std::shared_ptr<const Configuration> m_config;
    std::shared_ptr<spdlog::logger> m_logger;
};

#endif //HOST_RESOLVER_HPP
