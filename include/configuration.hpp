#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace YAML {
class Node;
}

/// Host to element mapping read from the synchronization file.
///
/// Every top level key except ALIASES is a host. Hosts and elements keep
/// the order of the document, host matching depends on it.
class Configuration {
public:
    static constexpr const char* ALIASES_KEY = "ALIASES";
    static constexpr const char* PATH_KEY = "_PATH";
    static constexpr char RESERVED_PREFIX = '_';

    using ElementMap = std::vector<std::pair<std::string, std::string>>;

    Configuration() = default;

    /// @brief Load and validate a configuration file
    /// @throws ConfigNotFound if the file does not exist
    /// @throws ConfigParseError on malformed YAML or an unexpected layout
    static Configuration fromFile(const std::string& path);

    /// @brief Parse a configuration document held in memory
    static Configuration fromYaml(const std::string& text);

    std::optional<std::string> resolveAlias(const std::string& name) const;

    const std::vector<std::string>& hosts() const { return m_hosts; }
    bool hasHost(const std::string& host) const;

    /// @brief Synchronizable elements of a host, reserved names excluded
    std::vector<std::string> elementsOf(const std::string& host) const;
    bool hasElement(const std::string& host, const std::string& element) const;

    std::optional<std::string> pathOverride(const std::string& host) const;

    /// @throws MissingElement if the host or the element is unknown
    const std::string& elementPath(const std::string& host, const std::string& element) const;

    const std::string& source() const { return m_source; }

private:
    static Configuration fromNode(const YAML::Node& root, const std::string& source);
    const ElementMap* findHost(const std::string& host) const;

    std::vector<std::string> m_hosts;
    std::vector<ElementMap> m_elements; // parallel to m_hosts
    std::vector<std::pair<std::string, std::string>> m_aliases;
    std::string m_source{"<memory>"};
};

#endif //CONFIGURATION_HPP
