#pragma once
#include <atomic>
#include <memory>

namespace shellhost {

// Cooperative cancellation flag shared between the loop thread (which
// cancels) and a worker (which polls it at its next checkpoint).
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace shellhost
