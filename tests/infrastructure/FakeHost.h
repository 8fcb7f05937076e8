#pragma once

#include <blockshift/core/Clock.h>
#include <blockshift/host/HostCapabilities.h>

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace blockshift::test {

/// Manually advanced time source
class FakeClock {
public:
    TimePoint now() const { return now_; }
    void advance(std::chrono::milliseconds delta) { now_ += delta; }
    ClockFn fn() { return [this] { return now_; }; }

private:
    TimePoint now_{};
};

/// In-memory host graph implementing the capability contract.
/// Every mutating call is recorded so tests can assert on exact host traffic.
class FakeHost {
public:
    struct MoveCall {
        NodeId node;
        Point position;
    };

    FakeHost() = default;
    FakeHost(const FakeHost&) = delete;
    FakeHost& operator=(const FakeHost&) = delete;

    // =========================================================================
    // Graph setup
    // =========================================================================

    NodeId addNode(Point position, Size size = {100.0f, 40.0f});

    /// Add a connection whose anchor sits at `offset` from the node origin
    ConnectionId addConnection(NodeId node, ConnectionType type, Point offset,
                               bool replaceable = false);

    /// Link two connections directly, bypassing call recording
    void link(ConnectionId a, ConnectionId b);

    void setCollapsed(NodeId node, bool collapsed);
    void setMovable(NodeId node, bool movable);

    // =========================================================================
    // Capability contract
    // =========================================================================

    /// Capabilities bound to this host; the host must outlive their users
    HostCapabilities capabilities();

    std::optional<NodeData> getNode(NodeId id) const;
    std::vector<NodeId> listNodes() const;
    void moveNodeTo(NodeId id, Point position);
    bool connect(ConnectionId a, ConnectionId b);
    void disconnect(ConnectionId id);
    void disconnectAll(NodeId id);
    bool deleteNode(NodeId id);

    // =========================================================================
    // Inspection
    // =========================================================================

    bool hasNode(NodeId id) const { return nodes_.count(id) > 0; }
    Point position(NodeId id) const;
    std::vector<ConnectionLink> links(NodeId id) const;
    std::optional<ConnectionId> peerOf(ConnectionId id) const;
    bool isLinked(ConnectionId a, ConnectionId b) const;

    /// Markers currently drawn through the highlight surface
    const std::map<std::pair<ConnectionId, ConnectionId>, HighlightMarker>& markers() const {
        return markers_;
    }
    const HighlightMarker* marker(ConnectionId local, ConnectionId neighbour) const;

    // Host state
    Viewport viewport{{0.0f, 0.0f}, 1.0f};
    std::optional<Rect> deletionZone;   ///< Device-space trash area
    bool inputDeferred = false;
    bool failConnect = false;           ///< connect() returns false
    bool throwOnMove = false;           ///< moveNodeTo() throws
    bool provideDelete = true;

    // Call records
    std::vector<MoveCall> moveCalls;
    std::vector<ConnectionLink> connectCalls;
    std::vector<ConnectionId> disconnectCalls;
    std::vector<NodeId> disconnectAllCalls;
    std::vector<NodeId> deleteCalls;
    std::vector<bool> deferCalls;
    int addMarkerCalls = 0;
    int updateMarkerCalls = 0;
    int removeMarkerCalls = 0;
    int duplicateAdds = 0;     ///< addMarker for a key already drawn
    int strayOperations = 0;   ///< update/remove for a key not drawn

private:
    struct ConnectionRecord {
        ConnectionId id;
        ConnectionType type;
        Point offset;
        std::optional<ConnectionId> connectedTo;
        bool replaceable;
    };

    struct NodeRecord {
        NodeData data;
        std::vector<ConnectionRecord> connections;
    };

    ConnectionRecord* findConnection(ConnectionId id);
    const ConnectionRecord* findConnection(ConnectionId id) const;
    void unlink(ConnectionId id);

    std::map<NodeId, NodeRecord> nodes_;
    std::map<ConnectionId, NodeId> owners_;
    std::map<std::pair<ConnectionId, ConnectionId>, HighlightMarker> markers_;
    NodeId nextNode_ = 1;
    ConnectionId nextConnection_ = 100;
};

}  // namespace blockshift::test
