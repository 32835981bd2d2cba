#include "RunSessionCore/capabilities.hpp"
#include <utility>
#include "RunSessionCore/geo.hpp"

SubscriptionHandle::SubscriptionHandle(std::function<void()> unsubscribe)
    : unsubscribe_(std::move(unsubscribe))
{
}

SubscriptionHandle::~SubscriptionHandle()
{
    unsubscribe();
}

SubscriptionHandle::SubscriptionHandle(SubscriptionHandle&& other) noexcept
    : unsubscribe_(std::move(other.unsubscribe_))
{
    other.unsubscribe_ = nullptr;
}

SubscriptionHandle& SubscriptionHandle::operator=(SubscriptionHandle&& other) noexcept
{
    if (this != &other) {
        unsubscribe();
        unsubscribe_ = std::move(other.unsubscribe_);
        other.unsubscribe_ = nullptr;
    }
    return *this;
}

void SubscriptionHandle::unsubscribe()
{
    if (!unsubscribe_) return;

    auto release = std::move(unsubscribe_);
    unsubscribe_ = nullptr;
    release();
}

bool should_deliver_position(const PositionSubscriptionOptions& options,
                             const std::optional<PositionSample>& last_delivered,
                             const PositionSample& next)
{
    if (!last_delivered) return true;

    if (next.timestamp_ms - last_delivered->timestamp_ms < options.min_interval_ms) {
        return false;
    }

    double moved = haversine_distance(last_delivered->latitude, last_delivered->longitude,
                                      next.latitude, next.longitude);
    return moved >= options.min_distance_m;
}
