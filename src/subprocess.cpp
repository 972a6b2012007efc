#include "sys/subprocess.hpp"
#include "sys/file_descriptor.hpp"

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <system_error>

namespace sys {

namespace {

// Drain both pipes until the child closes them. Reading one after the other
// can deadlock once the other pipe's buffer fills up.
void drain(FileDescriptor& outFd, FileDescriptor& errFd, ProcessOutput& result) {
    std::array<char, 4096> buffer{};

    while (outFd.isValid() || errFd.isValid()) {
        std::array<pollfd, 2> fds{{{outFd.fd(), POLLIN, 0}, {errFd.fd(), POLLIN, 0}}};
        if (::poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::system_category(), "Failed to poll child output");
        }

        const auto pump = [&buffer](FileDescriptor& fd, short revents, std::string& sink) {
            if (!fd.isValid() || (revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                return;
            }
            const auto n = fd.read(buffer.data(), buffer.size());
            if (n == 0) {
                fd.reset();
            } else {
                sink.append(buffer.data(), static_cast<size_t>(n));
            }
        };
        pump(outFd, fds[0].revents, result.out);
        pump(errFd, fds[1].revents, result.err);
    }
}

} // namespace

ProcessOutput ShellExecutor::run(const std::string& command) {
    auto [outRead, outWrite] = FileDescriptor::pipe();
    auto [errRead, errWrite] = FileDescriptor::pipe();

    const pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::system_category(), "Failed to fork for '" + command + "'");
    }

    if (pid == 0) {
        // dup2 clears close-on-exec on the duplicated descriptors
        ::dup2(outWrite.fd(), STDOUT_FILENO);
        ::dup2(errWrite.fd(), STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    outWrite.reset();
    errWrite.reset();

    ProcessOutput result;
    // reap the child even if draining fails
    try {
        drain(outRead, errRead, result);
    } catch (...) {
        int ignored;
        ::waitpid(pid, &ignored, 0);
        throw;
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::system_category(), "Failed to wait for '" + command + "'");
        }
    }
    if (WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitStatus = 128 + WTERMSIG(status);
    }
    return result;
}

}
