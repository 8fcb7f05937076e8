#pragma once

#include "../core/BlockModel.h"
#include "HighlightSurface.h"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blockshift {

/// Thrown at construction when the host omits a required primitive
class MissingHostCapabilityError : public std::invalid_argument {
public:
    explicit MissingHostCapabilityError(std::vector<std::string> missing);

    const std::vector<std::string>& missing() const { return missing_; }

private:
    std::vector<std::string> missing_;
};

/// Capability contract the host hands to the engine.
///
/// The engine only ever reaches the host graph through these callbacks.
/// Members marked required must be set; validate() reports the ones that are not.
struct HostCapabilities {
    // ---- Required ----
    std::function<std::optional<NodeData>(NodeId)> getNode;
    std::function<std::vector<NodeId>()> listNodes;
    std::function<bool(ConnectionType, ConnectionType)> connectionsCompatible;
    std::function<void(NodeId, Point)> moveNodeTo;
    std::function<bool(ConnectionId, ConnectionId)> connect;
    std::function<void(ConnectionId)> disconnect;
    std::function<void(NodeId)> disconnectAll;
    std::function<Viewport()> getViewport;

    // ---- Optional ----
    /// Remove a node from the workspace (deletion targets, cancelled inserts)
    std::function<bool(NodeId)> deleteNode;
    /// Whether a device point lies over a deletion target such as a trash can
    std::function<bool(Point)> isDeletionTarget;
    /// While true, the host must leave keyboard input to the engine
    std::function<void(bool)> setInputDeferred;
    /// Drawing primitives for connection highlights
    HighlightSurface highlightSurface;

    /// Names of required capabilities that are missing (empty = complete)
    std::vector<std::string> missingCapabilities() const;

    /// Throws MissingHostCapabilityError if anything required is missing
    void validate() const;
};

}  // namespace blockshift
