#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <string>

namespace sys {

struct ProcessOutput {
    std::string out;
    std::string err;
    int exitStatus = -1; // exit code, or 128 + signal number
};

/// Runs shell commands and collects their output once they exit.
/// Implementations must allow concurrent calls from several threads.
class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    virtual ProcessOutput run(const std::string& command) = 0;
};

/// Executes commands through /bin/sh -c.
class ShellExecutor : public CommandExecutor {
public:
    /// @throws std::system_error if the pipes or the child cannot be created
    ProcessOutput run(const std::string& command) override;
};

}

#endif // SUBPROCESS_HPP
