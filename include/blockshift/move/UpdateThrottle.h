#pragma once

#include "blockshift/core/Clock.h"
#include "blockshift/core/Types.h"

#include <chrono>
#include <optional>

namespace blockshift {

/// Fixed-interval throttle for follow updates with a guaranteed trailing update.
///
/// offer() applies at most one position per interval; anything arriving
/// inside the window is kept as the pending trailing position, replaced by
/// newer ones. takeDue() hands the pending position out once the window has
/// elapsed and flush() hands it out unconditionally, so the last position
/// before a session ends is never lost.
class UpdateThrottle {
public:
    explicit UpdateThrottle(std::chrono::milliseconds interval = std::chrono::milliseconds(16));

    /// @return true if `position` should be applied now
    bool offer(const Point& position, TimePoint now);

    /// Pending position whose window has elapsed, if any
    std::optional<Point> takeDue(TimePoint now);

    /// Pending position regardless of timing, if any
    std::optional<Point> flush();

    bool hasPending() const { return pending_.has_value(); }
    void reset();

private:
    std::chrono::milliseconds interval_;
    std::optional<TimePoint> lastApplied_;
    std::optional<Point> pending_;
};

}  // namespace blockshift
