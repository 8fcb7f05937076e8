#pragma once

#include "blockshift/core/BlockModel.h"
#include "blockshift/move/ConnectionCandidateFinder.h"

#include <functional>
#include <optional>

namespace blockshift {

/// Session lifecycle notifications sent back to the host. All members are optional.
struct MoveEvents {
    std::function<void(NodeId)> onSessionStarted;

    /// Best candidate changed (nullopt = none)
    std::function<void(NodeId, const std::optional<ConnectionCandidate>&)> onCandidateChanged;

    /// Session committed; the link is the connection made, nullopt for a free drop
    std::function<void(NodeId, const std::optional<ConnectionLink>&)> onSessionCommitted;

    std::function<void(NodeId)> onSessionCancelled;
    std::function<void(NodeId)> onSessionDeleted;
};

}  // namespace blockshift
