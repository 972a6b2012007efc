#ifndef OUTPUT_CLASSIFIER_HPP
#define OUTPUT_CLASSIFIER_HPP

#include <set>
#include <string>
#include <string_view>

/// Verdict on the stderr of one transfer.
struct StderrVerdict {
    enum class Kind {
        CLEAN,
        ADVISORY, // warning, phase still continues
        FATAL     // peer unreachable, phase is aborted
    };

    Kind kind = Kind::CLEAN;
    std::string text; // stderr flattened to a single line

    bool isClean() const { return kind == Kind::CLEAN; }
    bool isFatal() const { return kind == Kind::FATAL; }
};

/// Turns raw rsync output into log events.
class OutputClassifier {
public:
    /// @brief Classify the stdout of one transfer
    /// @param out raw stdout, the first line is rsync's header and is dropped
    /// @param src source argument the transfer was started with
    /// @param dest destination argument the transfer was started with
    /// @param dryRun select "Would ..." wording
    /// @return one event per observable effect, duplicates removed
    static std::set<std::string> classifyStdout(std::string_view out, const std::string& src,
                                                const std::string& dest, bool dryRun);

    static StderrVerdict classifyStderr(std::string_view err);

private:
    static bool isNoise(std::string_view line);
    static std::string joinPath(const std::string& base, std::string_view name);
};

#endif //OUTPUT_CLASSIFIER_HPP
