#pragma once

#include "blockshift/core/BlockModel.h"
#include "blockshift/core/Clock.h"
#include "blockshift/move/ConnectionCandidateFinder.h"
#include "blockshift/move/config/MoveEnums.h"

#include <optional>
#include <vector>

namespace blockshift {

/// State of the one move in progress. Owned and mutated by MoveModeController only.
/// All geometry is canvas space.
struct MoveSession {
    SessionState state = SessionState::Inactive;
    NodeId node = INVALID_NODE;
    Modality modality = Modality::Pointer;
    MoveType moveType = MoveType::Move;

    Point originPosition;
    std::vector<ConnectionLink> originConnections;  ///< Immutable after start; drives cancel

    /// Parent/child link made when the node was lifted out of a stack
    std::optional<ConnectionLink> healedLink;

    std::vector<LocalConnection> locals;  ///< Open connections with offsets from the node origin
    Point grabOffset;                     ///< Grab point - node origin
    Point currentPosition;                ///< Last position sent to the host

    std::optional<ConnectionCandidate> currentCandidate;
    std::vector<ConnectionCandidate> highlighted;  ///< Highlight set of the latest update

    TimePoint startTime{};

    bool isActive() const { return isActiveState(state); }

    void reset() { *this = MoveSession{}; }
};

}  // namespace blockshift
