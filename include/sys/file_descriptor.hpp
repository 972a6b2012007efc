#ifndef FILE_DESCRIPTOR_HPP
#define FILE_DESCRIPTOR_HPP

#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <system_error>
#include <utility>

namespace sys {

/// Owning wrapper for a raw descriptor, closed on destruction.
class FileDescriptor {
private:
    int m_fd = -1;

public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) : m_fd(fd) {
        if (m_fd == -1) {
            throw std::system_error(errno, std::system_category(), "Invalid file descriptor");
        }
    }

    ~FileDescriptor() {
        reset();
    }

    // Prevent copying
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    // Allow moving
    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(other.m_fd) {
        other.m_fd = -1;
    }

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            m_fd = other.m_fd;
            other.m_fd = -1;
        }
        return *this;
    }

    /// @brief Create a close-on-exec pipe, returns {read end, write end}
    ///
    /// Close-on-exec keeps write ends from leaking into children forked by
    /// other threads, which would hold the pipe open past the writer's exit.
    static std::pair<FileDescriptor, FileDescriptor> pipe() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to create pipe");
        }
        return {FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    }

    int fd() const { return m_fd; }

    bool isValid() const { return m_fd != -1; }

    void reset() {
        if (m_fd != -1) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

    // Read data, retrying on EINTR. Returns 0 at end of file.
    ssize_t read(void* buffer, size_t bufferSize) {
        ssize_t result;
        do {
            result = ::read(m_fd, buffer, bufferSize);
        } while (result == -1 && errno == EINTR);
        if (result == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to read from file descriptor");
        }
        return result;
    }
};
}
#endif  // FILE_DESCRIPTOR_HPP
