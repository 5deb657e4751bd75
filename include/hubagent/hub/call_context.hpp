#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace hubagent::hub {

using Clock = std::chrono::steady_clock;

// The earlier of an optional caller deadline and a per-call deadline.
Clock::time_point EffectiveDeadline(std::optional<Clock::time_point> outer,
                                    Clock::time_point per_call);

// Deadline and cancellation carried by every outbound call. Contexts are
// small values; derived contexts never extend their parent's deadline.
class CallContext {
public:
    CallContext() = default;

    CallContext WithDeadline(Clock::time_point deadline) const;
    CallContext WithTimeout(Clock::duration timeout) const;
    CallContext WithCancel(const std::atomic_bool* cancelled) const;

    const std::optional<Clock::time_point>& Deadline() const { return deadline_; }

    bool Cancelled() const;
    bool Expired(Clock::time_point now = Clock::now()) const;

    // Time left before the deadline, clamped at zero; nullopt when unbounded.
    std::optional<Clock::duration> Remaining(Clock::time_point now = Clock::now()) const;

private:
    std::optional<Clock::time_point> deadline_;
    const std::atomic_bool* cancelled_ = nullptr;
};

} // namespace hubagent::hub
