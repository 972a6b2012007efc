#include "output_classifier.hpp"

#include <array>

namespace {

constexpr std::string_view CREATED_MARKER = "created directory ";
constexpr std::string_view DELETING_MARKER = "deleting ";

constexpr std::array<std::string_view, 2> FATAL_MARKERS = {
    "Connection refused",
    "Could not resolve hostname",
};

std::string quoted(std::string_view text) {
    std::string s;
    s.reserve(text.size() + 2);
    s += '\'';
    s += text;
    s += '\'';
    return s;
}

} // namespace

bool OutputClassifier::isNoise(std::string_view line) {
    return line.empty()
        || line == "./"
        || line.find('\r') != std::string_view::npos
        || line.starts_with("sent ")
        || line.starts_with("total size is");
}

std::string OutputClassifier::joinPath(const std::string& base, std::string_view name) {
    if (!base.empty() && base.back() == '/') {
        return base + std::string(name);
    }
    return base;
}

std::set<std::string> OutputClassifier::classifyStdout(std::string_view out, const std::string& src,
                                                       const std::string& dest, bool dryRun) {
    std::set<std::string> events;

    bool header = true;
    size_t pos = 0;
    while (pos <= out.size()) {
        auto end = out.find('\n', pos);
        if (end == std::string_view::npos) {
            end = out.size();
        }
        const auto line = out.substr(pos, end - pos);
        pos = end + 1;

        if (header) {
            header = false;
            continue;
        }
        if (isNoise(line)) {
            continue;
        }

        if (const auto at = line.find(CREATED_MARKER); at != std::string_view::npos) {
            const auto name = line.substr(at + CREATED_MARKER.size());
            events.insert((dryRun ? "Would create directory " : "Created directory ") + quoted(name));
        } else if (line.starts_with(DELETING_MARKER)) {
            const auto name = line.substr(DELETING_MARKER.size());
            events.insert((dryRun ? "Would delete " : "Deleted ") + quoted(joinPath(dest, name)));
        } else {
            events.insert((dryRun ? "Would move " : "Successfully moved ") + quoted(joinPath(src, line))
                          + " to " + quoted(joinPath(dest, line)));
        }
    }
    return events;
}

StderrVerdict OutputClassifier::classifyStderr(std::string_view err) {
    StderrVerdict verdict;
    if (err.empty()) {
        return verdict;
    }

    // strip surrounding newlines, join the rest into one line
    const auto first = err.find_first_not_of('\n');
    const auto last = err.find_last_not_of('\n');
    if (first != std::string_view::npos) {
        for (const char c : err.substr(first, last - first + 1)) {
            if (c == '\n') {
                verdict.text += "; ";
            } else {
                verdict.text += c;
            }
        }
    }

    verdict.kind = StderrVerdict::Kind::ADVISORY;
    for (const auto marker : FATAL_MARKERS) {
        if (err.find(marker) != std::string_view::npos) {
            verdict.kind = StderrVerdict::Kind::FATAL;
            break;
        }
    }
    return verdict;
}
