#pragma once

#include "blockshift/move/ConnectionCandidateFinder.h"
#include "blockshift/move/config/MoveEnums.h"
#include "blockshift/move/config/MoveOptions.h"

#include <optional>
#include <vector>

namespace blockshift {

/// Keyboard movement for ActiveStep sessions.
///
/// Plain arrows cycle through the ordered candidate list (Down/Right forward,
/// Up/Left backward, with wraparound). Modifier+arrow steps the node by a
/// fixed distance and drops the current candidate. The ordered list is built
/// from the node's unconstrained position and is only rebuilt after a step,
/// not on every cycle.
class KeyboardDragStrategy {
public:
    explicit KeyboardDragStrategy(ConnectionCandidateFinder finder = {}, MoveOptions options = {});

    /// Start a keyboard session at `position`, optionally on an initial candidate
    void begin(const Point& position, const std::optional<ConnectionCandidate>& initial);

    /// Move to the next (+1) or previous (-1) candidate.
    /// With no current candidate the nearest one is selected.
    /// @return The new current candidate, or nullopt if there is none
    std::optional<ConnectionCandidate> cycle(
        int step,
        const std::vector<LocalConnection>& locals,
        const std::vector<NeighbourConnection>& neighbours);

    /// Unconstrained step from `from`; clears the candidate and marks the list stale
    /// @return New node position
    Point step(Direction direction, const Point& from);

    /// Force a rebuild of the ordered list on the next cycle
    void invalidate() { stale_ = true; }

    void reset();

    const std::optional<ConnectionCandidate>& current() const { return current_; }
    const std::vector<ConnectionCandidate>& orderedList() const { return ordered_; }
    bool isStale() const { return stale_; }

    /// Position the node would have without candidate snapping
    const Point& unconstrainedPosition() const { return position_; }

    /// Cycle direction for a plain arrow key
    static int cycleStep(Direction direction);

    /// Unit vector for a step move
    static Point directionVector(Direction direction);

private:
    ConnectionCandidateFinder finder_;
    MoveOptions options_;
    Point position_;
    std::vector<ConnectionCandidate> ordered_;
    std::optional<ConnectionCandidate> current_;
    bool stale_ = true;
};

}  // namespace blockshift
