// Per-item cooperative cancellation flag, shared between the queue and the executor.
#pragma once
#include <atomic>

namespace opens3 {

class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace opens3
