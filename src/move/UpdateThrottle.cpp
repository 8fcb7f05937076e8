#include "blockshift/move/UpdateThrottle.h"

namespace blockshift {

UpdateThrottle::UpdateThrottle(std::chrono::milliseconds interval)
    : interval_(interval) {
}

bool UpdateThrottle::offer(const Point& position, TimePoint now) {
    if (!lastApplied_ || now - *lastApplied_ >= interval_) {
        lastApplied_ = now;
        pending_.reset();
        return true;
    }
    pending_ = position;
    return false;
}

std::optional<Point> UpdateThrottle::takeDue(TimePoint now) {
    if (!pending_ || (lastApplied_ && now - *lastApplied_ < interval_)) {
        return std::nullopt;
    }
    lastApplied_ = now;
    return flush();
}

std::optional<Point> UpdateThrottle::flush() {
    std::optional<Point> result = pending_;
    pending_.reset();
    return result;
}

void UpdateThrottle::reset() {
    lastApplied_.reset();
    pending_.reset();
}

}  // namespace blockshift
