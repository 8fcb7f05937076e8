#pragma once

#include "blockshift/core/CoordinateTransformer.h"
#include "blockshift/host/HighlightSurface.h"
#include "blockshift/move/ConnectionCandidateFinder.h"
#include "blockshift/move/config/MoveOptions.h"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace blockshift {

/// Result of one overlay update, keyed by (local, neighbour) pair
struct OverlayDiff {
    std::vector<ConnectionLink> added;
    std::vector<ConnectionLink> removed;
    std::vector<ConnectionLink> updated;    ///< Same pair, new emphasis or geometry
    std::vector<ConnectionLink> unchanged;

    /// Number of surface operations the update issued
    size_t operationCount() const { return added.size() + removed.size() + updated.size(); }
    bool hasChanges() const { return operationCount() > 0; }
};

/// Keeps the host's connection highlights in sync with the candidate set.
///
/// Each update is diffed against what is currently rendered and only the
/// minimal add/update/remove operations are sent to the HighlightSurface;
/// the overlay is never torn down and rebuilt wholesale. Marker geometry is
/// kept in canvas space and projected through CoordinateTransformer when a
/// marker is emitted.
class ConnectionHighlightOverlay {
public:
    explicit ConnectionHighlightOverlay(HighlightSurface surface, MoveOptions options = {});
    ~ConnectionHighlightOverlay();

    ConnectionHighlightOverlay(const ConnectionHighlightOverlay&) = delete;
    ConnectionHighlightOverlay& operator=(const ConnectionHighlightOverlay&) = delete;

    /// Render exactly `candidates`, emphasizing `emphasized` if present
    OverlayDiff setCandidates(const std::vector<ConnectionCandidate>& candidates,
                              const std::optional<ConnectionCandidate>& emphasized,
                              const Viewport& viewport);

    /// Re-project every marker after a pan/zoom change
    OverlayDiff refreshViewport(const Viewport& viewport);

    /// Pair whose marker lies under a device point (hit area padded), if any
    std::optional<ConnectionLink> hitTest(const Point& screenPoint, const Viewport& viewport);

    /// Remove every marker. Idempotent.
    void clear();

    /// clear() and detach from the update loop for good
    void dispose();

    bool empty() const { return markers_.empty(); }
    size_t size() const { return markers_.size(); }
    bool contains(const ConnectionLink& key) const;
    std::optional<bool> isEmphasized(const ConnectionLink& key) const;

    /// Rendered pairs in candidate order
    std::vector<ConnectionLink> renderedKeys() const;

    /// True while markers are shown and viewport refreshes are wanted
    bool isRegistered() const { return registered_; }
    bool isDisposed() const { return disposed_; }

    // Totals of surface operations issued, for diagnostics
    int totalAdds() const { return totalAdds_; }
    int totalUpdates() const { return totalUpdates_; }
    int totalRemoves() const { return totalRemoves_; }

private:
    struct RenderedMarker {
        ConnectionLink key;
        NodeId neighbourNode = INVALID_NODE;
        MarkerShape shape = MarkerShape::StatementNotch;
        Rect canvasBounds;
        bool emphasized = false;
    };

    static uint64_t keyOf(const ConnectionLink& link) {
        return (static_cast<uint64_t>(link.local) << 32) | link.peer;
    }

    RenderedMarker makeMarker(const ConnectionCandidate& candidate, bool emphasized) const;
    HighlightMarker project(const RenderedMarker& marker, const Viewport& viewport);

    void emitAdd(const RenderedMarker& marker, const Viewport& viewport);
    void emitUpdate(const RenderedMarker& marker, const Viewport& viewport);
    void emitRemove(const ConnectionLink& key);

    HighlightSurface surface_;
    MoveOptions options_;
    CoordinateTransformer transformer_;
    std::vector<RenderedMarker> markers_;
    bool registered_ = false;
    bool disposed_ = false;

    int totalAdds_ = 0;
    int totalUpdates_ = 0;
    int totalRemoves_ = 0;
};

}  // namespace blockshift
