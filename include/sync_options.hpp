#ifndef SYNC_OPTIONS_HPP
#define SYNC_OPTIONS_HPP

#include "transfer_command.hpp"

#include <cstddef>
#include <string>
#include <vector>

/// Flags of one synchronization run.
struct SyncOptions {
    static constexpr size_t DEFAULT_CONCURRENCY = 6;

    bool upOnly = false;
    bool downOnly = false;
    bool dryRun = false;
    bool deleteExtraneous = false;
    std::vector<std::string> excludes;
    size_t concurrencyLimit = DEFAULT_CONCURRENCY; // transfers per (peer, direction)
    std::string preflightCommand = TransferCommand::PREFLIGHT;

    // Neither or both of the "only" flags selects both directions
    bool performUp() const { return upOnly == downOnly || upOnly; }
    bool performDown() const { return upOnly == downOnly || downOnly; }

    TransferCommand transferCommand() const {
        return {excludes, dryRun, deleteExtraneous};
    }
};

#endif //SYNC_OPTIONS_HPP
