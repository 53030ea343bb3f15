#pragma once
#include <atomic>
#include "StreamErrors.hpp"

// Caller-owned cancellation flag. cancel() may be called from any thread
// (or a signal handler); readers poll it at their wait points.
class CancellationToken {
public:
    void cancel() { cancelled.store(true); }
    bool isCancelled() const { return cancelled.load(); }

    void throwIfCancelled() const {
        if (cancelled.load()) {
            throw OperationCancelled();
        }
    }

private:
    std::atomic<bool> cancelled{false};
};

inline void throwIfCancelled(const CancellationToken* token) {
    if (token) {
        token->throwIfCancelled();
    }
}
