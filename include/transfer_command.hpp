#ifndef TRANSFER_COMMAND_HPP
#define TRANSFER_COMMAND_HPP

#include <string>
#include <vector>

/// Builds rsync command lines for one run.
class TransferCommand {
public:
    static constexpr const char* PROGRAM = "rsync -auP";
    static constexpr const char* DEFAULT_EXCLUDE = "*.swp";
    static constexpr const char* PREFLIGHT = "if command -v \"checkssh\" &>/dev/null; then \ncheckssh\nfi";

    TransferCommand(const std::vector<std::string>& excludes, bool dryRun, bool deleteExtraneous)
        : m_base(PROGRAM) {
        m_base += " --exclude=\"" + std::string(DEFAULT_EXCLUDE) + "\"";
        for (const auto& exclude : excludes) {
            m_base += " --exclude=\"" + exclude + "\"";
        }
        if (dryRun) {
            m_base += " -n";
        }
        if (deleteExtraneous) {
            m_base += " --delete";
        }
    }

    const std::string& base() const { return m_base; }

    std::string build(const std::string& src, const std::string& dest) const {
        return m_base + " " + src + " " + dest;
    }

private:
    std::string m_base;
};

#endif //TRANSFER_COMMAND_HPP
