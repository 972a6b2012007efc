#ifndef SYNC_TASK_HPP
#define SYNC_TASK_HPP

#include <string>

enum class Direction {
    UP,   // local --> peer
    DOWN  // peer --> local
};

inline const char* toString(Direction direction) {
    return direction == Direction::UP ? "up" : "down";
}

/// Log prefix used for a phase, "Upload" or "Download".
inline const char* phaseName(Direction direction) {
    return direction == Direction::UP ? "Upload" : "Download";
}

/// One element transfer between this host and a peer.
struct SyncTask {
    std::string element;
    Direction direction;
    std::string targetHost;
    std::string srcPath;
    std::string destPath;
    std::string command;
};

/// Output of a finished (or skipped) SyncTask.
struct TransferResult {
    std::string src;
    std::string dest;
    std::string out;
    std::string err;
    int exitStatus = 0;
    bool skipped = false; // never started, phase was cancelled
};

#endif //SYNC_TASK_HPP
