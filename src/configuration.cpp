#include "configuration.hpp"
#include "sync_error.hpp"

#include <algorithm>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace {

std::string describe(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null: return "an empty value";
        case YAML::NodeType::Scalar: return "a scalar";
        case YAML::NodeType::Sequence: return "a list";
        case YAML::NodeType::Map: return "a mapping";
        default: return "an undefined value";
    }
}

template <typename Pairs>
bool containsKey(const Pairs& pairs, const std::string& key) {
    return std::any_of(pairs.begin(), pairs.end(), [&key](const auto& p) { return p.first == key; });
}

} // namespace

Configuration Configuration::fromFile(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ConfigNotFound(path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigParseError("Failed to parse configuration file '" + path + "': " + e.what());
    }
    return fromNode(root, path);
}

Configuration Configuration::fromYaml(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigParseError(std::string("Failed to parse configuration: ") + e.what());
    }
    return fromNode(root, "<memory>");
}

Configuration Configuration::fromNode(const YAML::Node& root, const std::string& source) {
    const auto fail = [&source](const std::string& what) {
        return ConfigParseError("Invalid configuration '" + source + "': " + what);
    };

    if (!root.IsMap()) {
        throw fail("top level must be a mapping of hosts, got " + describe(root));
    }

    Configuration cfg;
    cfg.m_source = source;

    for (const auto& entry : root) {
        if (!entry.first.IsScalar()) {
            throw fail("host names must be scalars");
        }
        const auto key = entry.first.as<std::string>();
        const YAML::Node& value = entry.second;

        if (key == ALIASES_KEY) {
            if (value.IsNull()) continue;
            if (!value.IsMap()) {
                throw fail(std::string(ALIASES_KEY) + " must be a mapping, got " + describe(value));
            }
            for (const auto& alias : value) {
                if (!alias.first.IsScalar() || !alias.second.IsScalar()) {
                    throw fail("alias entries must map a name to a host name");
                }
                const auto name = alias.first.as<std::string>();
                if (containsKey(cfg.m_aliases, name)) {
                    throw fail("duplicate alias '" + name + "'");
                }
                cfg.m_aliases.emplace_back(name, alias.second.as<std::string>());
            }
            continue;
        }

        if (key.empty()) {
            throw fail("empty host name");
        }
        if (std::find(cfg.m_hosts.begin(), cfg.m_hosts.end(), key) != cfg.m_hosts.end()) {
            throw fail("duplicate host '" + key + "'");
        }
        if (!value.IsNull() && !value.IsMap()) {
            throw fail("host '" + key + "' must be a mapping of elements, got " + describe(value));
        }

        ElementMap elements;
        if (value.IsMap()) {
            for (const auto& element : value) {
                if (!element.first.IsScalar()) {
                    throw fail("element names of host '" + key + "' must be scalars");
                }
                const auto name = element.first.as<std::string>();
                if (name.empty()) {
                    throw fail("empty element name in host '" + key + "'");
                }
                if (!element.second.IsScalar()) {
                    throw fail("element '" + name + "' of host '" + key + "' must be a path, got "
                               + describe(element.second));
                }
                if (containsKey(elements, name)) {
                    throw fail("duplicate element '" + name + "' in host '" + key + "'");
                }
                auto path = element.second.as<std::string>();
                if (name == PATH_KEY && path.empty()) {
                    throw fail(std::string(PATH_KEY) + " of host '" + key + "' is empty");
                }
                elements.emplace_back(name, std::move(path));
            }
        }

        cfg.m_hosts.push_back(key);
        cfg.m_elements.push_back(std::move(elements));
    }

    if (cfg.m_hosts.empty()) {
        throw fail("no hosts defined");
    }
    return cfg;
}

std::optional<std::string> Configuration::resolveAlias(const std::string& name) const {
    for (const auto& [alias, host] : m_aliases) {
        if (alias == name) {
            return host;
        }
    }
    return std::nullopt;
}

bool Configuration::hasHost(const std::string& host) const {
    return findHost(host) != nullptr;
}

const Configuration::ElementMap* Configuration::findHost(const std::string& host) const {
    const auto it = std::find(m_hosts.begin(), m_hosts.end(), host);
    if (it == m_hosts.end()) {
        return nullptr;
    }
    return &m_elements[static_cast<size_t>(it - m_hosts.begin())];
}

std::vector<std::string> Configuration::elementsOf(const std::string& host) const {
    std::vector<std::string> names;
    if (const auto* elements = findHost(host)) {
        for (const auto& [name, path] : *elements) {
            if (name.front() != RESERVED_PREFIX) {
                names.push_back(name);
            }
        }
    }
    return names;
}

bool Configuration::hasElement(const std::string& host, const std::string& element) const {
    const auto* elements = findHost(host);
    return elements != nullptr && containsKey(*elements, element);
}

std::optional<std::string> Configuration::pathOverride(const std::string& host) const {
    if (const auto* elements = findHost(host)) {
        for (const auto& [name, path] : *elements) {
            if (name == PATH_KEY) {
                return path;
            }
        }
    }
    return std::nullopt;
}

const std::string& Configuration::elementPath(const std::string& host, const std::string& element) const {
    if (const auto* elements = findHost(host)) {
        for (const auto& [name, path] : *elements) {
            if (name == element) {
                return path;
            }
        }
    }
    throw MissingElement(host, element);
}
