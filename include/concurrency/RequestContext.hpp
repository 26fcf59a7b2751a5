#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace dp::concurrency {

// Per-request cancellation: a shared interrupt flag raised at shutdown and an optional deadline.
struct RequestContext {
    std::shared_ptr<std::atomic<bool>> interruptFlag{};
    std::optional<std::chrono::steady_clock::time_point> deadline{};

    RequestContext() = default;

    RequestContext(std::shared_ptr<std::atomic<bool>> flag, const std::chrono::milliseconds timeout)
        : interruptFlag(std::move(flag)) {
        if (timeout.count() > 0) deadline = std::chrono::steady_clock::now() + timeout;
    }

    [[nodiscard]] bool interrupted() const { return interruptFlag && interruptFlag->load(); }

    [[nodiscard]] bool expired() const { return deadline && std::chrono::steady_clock::now() >= *deadline; }

    [[nodiscard]] bool cancelled() const { return interrupted() || expired(); }
};

}
