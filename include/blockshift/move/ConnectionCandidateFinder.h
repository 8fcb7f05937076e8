#pragma once

#include "blockshift/core/BlockModel.h"

#include <functional>
#include <optional>
#include <vector>

namespace blockshift {

/// Open connection on the moving node, positioned relative to the node origin
struct LocalConnection {
    ConnectionId id = INVALID_CONNECTION;
    ConnectionType type = ConnectionType::Next;
    Point offset;    ///< anchor - node position
    int index = 0;   ///< Position in the node's connection list
};

/// Connection on another node of the workspace
struct NeighbourConnection {
    ConnectionId id = INVALID_CONNECTION;
    ConnectionType type = ConnectionType::Previous;
    NodeId nodeId = INVALID_NODE;
    Point anchor;
    int index = 0;
    bool occupied = false;
    bool replaceable = false;
};

/// A compatible (local, neighbour) pair evaluated at one node position
struct ConnectionCandidate {
    ConnectionId local = INVALID_CONNECTION;
    ConnectionId neighbour = INVALID_CONNECTION;
    ConnectionType localType = ConnectionType::Next;
    ConnectionType neighbourType = ConnectionType::Previous;
    NodeId neighbourNode = INVALID_NODE;
    int localIndex = 0;
    int neighbourIndex = 0;
    Point localOffset;       ///< Local anchor relative to the node origin
    Point localAnchor;       ///< Local anchor at the evaluated position
    Point neighbourAnchor;
    float distance = 0.0f;   ///< Canvas units
    float angle = 0.0f;      ///< Radians in [0, 2pi), local anchor -> neighbour anchor
    bool neighbourOccupied = false;

    ConnectionLink link() const { return {local, neighbour}; }

    /// Same connection pair, regardless of evaluated geometry
    bool samePair(const ConnectionCandidate& o) const {
        return local == o.local && neighbour == o.neighbour;
    }

    /// Node position at which the local anchor lands exactly on the neighbour anchor
    Point snappedNodePosition() const { return neighbourAnchor - localOffset; }
};

/// Finds and ranks compatible connections for a moving node.
///
/// Stateless apart from the compatibility predicate; all inputs are passed
/// per call and nothing is retained between calls. Ordering is fully
/// deterministic: distance, then statement connections before value
/// connections, then neighbour node id, then neighbour index, then local index.
class ConnectionCandidateFinder {
public:
    using CompatibilityFn = std::function<bool(ConnectionType, ConnectionType)>;

    ConnectionCandidateFinder();
    explicit ConnectionCandidateFinder(CompatibilityFn compatible);

    /// Open, visible connections of the moving node with offsets from its position
    static std::vector<LocalConnection> localConnectionsOf(const NodeData& node);

    /// Visible connections of every node except `movingNode`
    static std::vector<NeighbourConnection> neighbourConnectionsOf(
        const std::vector<NodeData>& nodes,
        NodeId movingNode);

    /// Whether a pair may be linked: compatible types, neighbour free or replaceable
    bool isValidPair(const LocalConnection& local, const NeighbourConnection& neighbour) const;

    /// Best pair within `threshold` of the node placed at `nodePosition`
    std::optional<ConnectionCandidate> findBest(
        const std::vector<LocalConnection>& locals,
        const std::vector<NeighbourConnection>& neighbours,
        const Point& nodePosition,
        float threshold) const;

    /// All valid pairs ordered by rank, capped at `maxCount` (<= 0 = unlimited)
    std::vector<ConnectionCandidate> highlightSet(
        const std::vector<LocalConnection>& locals,
        const std::vector<NeighbourConnection>& neighbours,
        const Point& nodePosition,
        int maxCount) const;

    /// All valid pairs stable-sorted by angle then distance for keyboard cycling
    std::vector<ConnectionCandidate> orderedCandidates(
        const std::vector<LocalConnection>& locals,
        const std::vector<NeighbourConnection>& neighbours,
        const Point& nodePosition,
        int maxCount) const;

    /// Strict rank comparison used for best selection and ties
    static bool ranksBefore(const ConnectionCandidate& a, const ConnectionCandidate& b);

    /// Index of `candidate`'s pair in `list`, or -1
    static int indexOf(const std::vector<ConnectionCandidate>& list,
                       const ConnectionCandidate& candidate);

    /// Wraparound step through a list of `size` entries
    static int cycleIndex(int current, int step, int size);

private:
    std::vector<ConnectionCandidate> enumerate(
        const std::vector<LocalConnection>& locals,
        const std::vector<NeighbourConnection>& neighbours,
        const Point& nodePosition) const;

    CompatibilityFn compatible_;
};

}  // namespace blockshift
