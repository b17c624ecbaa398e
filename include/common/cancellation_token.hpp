#pragma once

#include <atomic>
#include <memory>

#include "common/backup_error.hpp"

// Shared between a job, the backend working for it and any child process it
// spawns. Cancelling is one-way.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

    void throwIfCancelled(const std::string& what = "Operation cancelled") const {
        if (isCancelled()) {
            throw BackupError(BackupErrorCode::Cancelled, what);
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;
