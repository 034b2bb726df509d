#pragma once

#include <chrono>
#include <stop_token>

namespace chatstore {

/// Per-call bounds for store work: an absolute deadline and an optional
/// stop token. Pool acquisition and statement execution give up when either
/// trips.
struct RequestContext {
    using SteadyClock = std::chrono::steady_clock;

    SteadyClock::time_point deadline = SteadyClock::time_point::max();
    std::stop_token stop;

    /// No deadline and no cancellation; store-level timeouts still apply.
    static auto background() -> RequestContext { return RequestContext{}; }

    static auto with_timeout(std::chrono::milliseconds timeout,
                             std::stop_token stop = {}) -> RequestContext {
        return RequestContext{SteadyClock::now() + timeout, std::move(stop)};
    }

    [[nodiscard]] auto cancelled() const -> bool { return stop.stop_requested(); }

    [[nodiscard]] auto expired() const -> bool { return SteadyClock::now() >= deadline; }

    /// The earlier of this context's deadline and `now + cap`.
    [[nodiscard]] auto bounded_by(std::chrono::milliseconds cap) const
        -> SteadyClock::time_point {
        auto now = SteadyClock::now();
        if (deadline - now < cap) return deadline;
        return now + cap;
    }
};

} // namespace chatstore
