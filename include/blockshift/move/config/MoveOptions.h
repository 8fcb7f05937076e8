#pragma once

#include "../../core/Types.h"

#include <chrono>

namespace blockshift {

/// Tunable constants of the move engine.
/// Distances are canvas units unless the name says device.
struct MoveOptions {
    /// Maximum anchor distance for a pointer candidate to snap
    float snapRadius = 28.0f;

    /// Minimum spacing between applied pointer updates (one frame at 60 Hz)
    std::chrono::milliseconds throttleInterval{16};

    /// Unconstrained keyboard step size
    float stepDistance = 20.0f;

    /// Upper bound on simultaneously highlighted connections
    int maxHighlighted = 50;

    /// Upper bound on the keyboard cycling list
    int maxCandidates = 200;

    /// Last-resort session lifetime before a forced cancel
    std::chrono::milliseconds watchdogTimeout{60000};

    /// Two taps within this interval form a double-tap
    std::chrono::milliseconds doubleTapInterval{300};

    /// Maximum device distance between the two taps of a double-tap
    float doubleTapSlopDevice = 10.0f;

    /// Maximum device travel between press and release for a tap/click
    float tapSlopDevice = 6.0f;

    /// Extra canvas padding around markers for hit testing
    float markerHitPadding = 8.0f;

    /// Marker size for statement (Previous/Next) connections
    Size notchSize{24.0f, 8.0f};

    /// Marker size for value (Input/Output) connections
    Size outlineSize{16.0f, 24.0f};

    /// Whether candidates are shown through the highlight surface
    bool highlightEnabled = true;

    Size markerSize(bool statement) const { return statement ? notchSize : outlineSize; }
};

}  // namespace blockshift
