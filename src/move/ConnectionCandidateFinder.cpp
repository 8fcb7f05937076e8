#include "blockshift/move/ConnectionCandidateFinder.h"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace blockshift {

ConnectionCandidateFinder::ConnectionCandidateFinder()
    : compatible_(defaultConnectionsCompatible) {
}

ConnectionCandidateFinder::ConnectionCandidateFinder(CompatibilityFn compatible)
    : compatible_(compatible ? std::move(compatible) : CompatibilityFn(defaultConnectionsCompatible)) {
}

std::vector<LocalConnection> ConnectionCandidateFinder::localConnectionsOf(const NodeData& node) {
    std::vector<LocalConnection> locals;
    for (size_t i = 0; i < node.connections.size(); ++i) {
        const auto& connection = node.connections[i];
        if (connection.isOccupied() || !node.isConnectionVisible(connection)) {
            continue;
        }
        locals.push_back({connection.id, connection.type,
                          connection.anchor - node.position, static_cast<int>(i)});
    }
    return locals;
}

std::vector<NeighbourConnection> ConnectionCandidateFinder::neighbourConnectionsOf(
    const std::vector<NodeData>& nodes,
    NodeId movingNode) {

    std::vector<NeighbourConnection> neighbours;
    for (const auto& node : nodes) {
        if (node.id == movingNode) {
            continue;
        }
        for (size_t i = 0; i < node.connections.size(); ++i) {
            const auto& connection = node.connections[i];
            if (!node.isConnectionVisible(connection)) {
                continue;
            }
            neighbours.push_back({connection.id, connection.type, node.id, connection.anchor,
                                  static_cast<int>(i), connection.isOccupied(),
                                  connection.replaceable});
        }
    }
    return neighbours;
}

bool ConnectionCandidateFinder::isValidPair(const LocalConnection& local,
                                            const NeighbourConnection& neighbour) const {
    if (neighbour.occupied && !neighbour.replaceable) {
        return false;
    }
    return compatible_(local.type, neighbour.type);
}

std::vector<ConnectionCandidate> ConnectionCandidateFinder::enumerate(
    const std::vector<LocalConnection>& locals,
    const std::vector<NeighbourConnection>& neighbours,
    const Point& nodePosition) const {

    std::vector<ConnectionCandidate> candidates;
    for (const auto& local : locals) {
        Point localAnchor = nodePosition + local.offset;
        for (const auto& neighbour : neighbours) {
            if (!isValidPair(local, neighbour)) {
                continue;
            }

            ConnectionCandidate candidate;
            candidate.local = local.id;
            candidate.neighbour = neighbour.id;
            candidate.localType = local.type;
            candidate.neighbourType = neighbour.type;
            candidate.neighbourNode = neighbour.nodeId;
            candidate.localIndex = local.index;
            candidate.neighbourIndex = neighbour.index;
            candidate.localOffset = local.offset;
            candidate.localAnchor = localAnchor;
            candidate.neighbourAnchor = neighbour.anchor;
            candidate.distance = localAnchor.distanceTo(neighbour.anchor);
            candidate.neighbourOccupied = neighbour.occupied;

            Point delta = neighbour.anchor - localAnchor;
            float angle = std::atan2(delta.y, delta.x);
            if (angle < 0.0f) {
                angle += 2.0f * std::numbers::pi_v<float>;
            }
            candidate.angle = angle;

            candidates.push_back(candidate);
        }
    }
    return candidates;
}

bool ConnectionCandidateFinder::ranksBefore(const ConnectionCandidate& a,
                                            const ConnectionCandidate& b) {
    if (a.distance != b.distance) {
        return a.distance < b.distance;
    }
    bool aStatement = isStatementConnection(a.neighbourType);
    bool bStatement = isStatementConnection(b.neighbourType);
    if (aStatement != bStatement) {
        return aStatement;
    }
    if (a.neighbourNode != b.neighbourNode) {
        return a.neighbourNode < b.neighbourNode;
    }
    if (a.neighbourIndex != b.neighbourIndex) {
        return a.neighbourIndex < b.neighbourIndex;
    }
    return a.localIndex < b.localIndex;
}

std::optional<ConnectionCandidate> ConnectionCandidateFinder::findBest(
    const std::vector<LocalConnection>& locals,
    const std::vector<NeighbourConnection>& neighbours,
    const Point& nodePosition,
    float threshold) const {

    std::optional<ConnectionCandidate> best;
    for (const auto& candidate : enumerate(locals, neighbours, nodePosition)) {
        if (candidate.distance > threshold) {
            continue;
        }
        if (!best || ranksBefore(candidate, *best)) {
            best = candidate;
        }
    }
    return best;
}

std::vector<ConnectionCandidate> ConnectionCandidateFinder::highlightSet(
    const std::vector<LocalConnection>& locals,
    const std::vector<NeighbourConnection>& neighbours,
    const Point& nodePosition,
    int maxCount) const {

    auto candidates = enumerate(locals, neighbours, nodePosition);
    std::sort(candidates.begin(), candidates.end(), ranksBefore);
    if (maxCount > 0 && candidates.size() > static_cast<size_t>(maxCount)) {
        candidates.resize(static_cast<size_t>(maxCount));
    }
    return candidates;
}

std::vector<ConnectionCandidate> ConnectionCandidateFinder::orderedCandidates(
    const std::vector<LocalConnection>& locals,
    const std::vector<NeighbourConnection>& neighbours,
    const Point& nodePosition,
    int maxCount) const {

    // Rank first so the cap keeps the nearest pairs and equal keys stay deterministic
    auto candidates = highlightSet(locals, neighbours, nodePosition, maxCount);
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const ConnectionCandidate& a, const ConnectionCandidate& b) {
            if (a.angle != b.angle) {
                return a.angle < b.angle;
            }
            return a.distance < b.distance;
        });
    return candidates;
}

int ConnectionCandidateFinder::indexOf(const std::vector<ConnectionCandidate>& list,
                                       const ConnectionCandidate& candidate) {
    for (size_t i = 0; i < list.size(); ++i) {
        if (list[i].samePair(candidate)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int ConnectionCandidateFinder::cycleIndex(int current, int step, int size) {
    if (size <= 0) {
        return -1;
    }
    return ((current + step) % size + size) % size;
}

}  // namespace blockshift
