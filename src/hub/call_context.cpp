#include "hubagent/hub/call_context.hpp"

#include <algorithm>

namespace hubagent::hub {

Clock::time_point EffectiveDeadline(std::optional<Clock::time_point> outer,
                                    Clock::time_point per_call) {
    if (!outer) return per_call;
    return std::min(*outer, per_call);
}

CallContext CallContext::WithDeadline(Clock::time_point deadline) const {
    CallContext child = *this;
    child.deadline_ = EffectiveDeadline(deadline_, deadline);
    return child;
}

CallContext CallContext::WithTimeout(Clock::duration timeout) const {
    return WithDeadline(Clock::now() + timeout);
}

CallContext CallContext::WithCancel(const std::atomic_bool* cancelled) const {
    CallContext child = *this;
    child.cancelled_ = cancelled;
    return child;
}

bool CallContext::Cancelled() const {
    return cancelled_ != nullptr && cancelled_->load(std::memory_order_relaxed);
}

bool CallContext::Expired(Clock::time_point now) const {
    return deadline_.has_value() && now >= *deadline_;
}

std::optional<Clock::duration> CallContext::Remaining(Clock::time_point now) const {
    if (!deadline_) return std::nullopt;
    if (now >= *deadline_) return Clock::duration::zero();
    return *deadline_ - now;
}

} // namespace hubagent::hub
