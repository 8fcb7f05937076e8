#pragma once

#include "../core/BlockModel.h"

#include <functional>

namespace blockshift {

/// Visual form of a connection highlight
enum class MarkerShape {
    StatementNotch,  ///< Previous/Next connections
    ValueOutline     ///< Input/Output connections
};

/// One highlighted connection as handed to the host renderer.
/// `key` identifies the marker across add/update/remove calls.
struct HighlightMarker {
    ConnectionLink key;          ///< (local, neighbour) connection pair
    NodeId neighbourNode = INVALID_NODE;
    MarkerShape shape = MarkerShape::StatementNotch;
    Rect canvasBounds;           ///< Marker geometry in canvas space
    Rect screenBounds;           ///< Same geometry projected for drawing
    bool emphasized = false;     ///< Current best candidate

    bool operator==(const HighlightMarker& o) const {
        return key == o.key && neighbourNode == o.neighbourNode && shape == o.shape &&
               canvasBounds == o.canvasBounds && screenBounds == o.screenBounds &&
               emphasized == o.emphasized;
    }
    bool operator!=(const HighlightMarker& o) const { return !(*this == o); }
};

/// Host-side drawing primitives for connection highlights.
/// All members are optional; an empty surface renders nothing.
struct HighlightSurface {
    std::function<void(const HighlightMarker&)> addMarker;
    std::function<void(const HighlightMarker&)> updateMarker;
    std::function<void(const ConnectionLink&)> removeMarker;
};

}  // namespace blockshift
