#ifndef SYNC_ERROR_HPP
#define SYNC_ERROR_HPP

#include <stdexcept>
#include <string>

/// Base class for every error that stops a synchronization run.
class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigNotFound : public SyncError {
public:
    explicit ConfigNotFound(const std::string& path)
        : SyncError("Configuration file '" + path + "' does not exist"), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

class ConfigParseError : public SyncError {
public:
    using SyncError::SyncError;
};

class MissingElement : public SyncError {
public:
    MissingElement(const std::string& host, const std::string& element)
        : SyncError("Host '" + host + "' has no element '" + element + "'") {}
};

class NoLocalHostMatch : public SyncError {
public:
    using SyncError::SyncError;
};

class NoTargetHostMatch : public SyncError {
public:
    using SyncError::SyncError;
};

class SelfSyncRequested : public SyncError {
public:
    explicit SelfSyncRequested(const std::string& host)
        : SyncError("Cannot sync host '" + host + "' with itself") {}
};

#endif //SYNC_ERROR_HPP
