#pragma once

#include "Types.h"

#include <optional>
#include <string>
#include <vector>

namespace blockshift {

/// Kind of socket a connection represents
enum class ConnectionType {
    Previous,  ///< Statement connection on top of a node
    Next,      ///< Statement connection below a node
    Input,     ///< Value input socket
    Output     ///< Value output plug
};

/// Statement connections (Previous/Next) are preferred over value connections on ties
inline bool isStatementConnection(ConnectionType type) {
    return type == ConnectionType::Previous || type == ConnectionType::Next;
}

/// Built-in compatibility: Previous<->Next and Input<->Output
inline bool defaultConnectionsCompatible(ConnectionType a, ConnectionType b) {
    switch (a) {
        case ConnectionType::Previous: return b == ConnectionType::Next;
        case ConnectionType::Next: return b == ConnectionType::Previous;
        case ConnectionType::Input: return b == ConnectionType::Output;
        case ConnectionType::Output: return b == ConnectionType::Input;
    }
    return false;
}

const char* connectionTypeName(ConnectionType type);

/// A typed socket on a node. Owned by the host; the engine reads copies.
struct ConnectionData {
    ConnectionId id = INVALID_CONNECTION;
    ConnectionType type = ConnectionType::Next;
    NodeId nodeId = INVALID_NODE;
    Point anchor;                             ///< Canvas-space anchor point
    std::optional<ConnectionId> connectedTo;  ///< Peer connection, if linked
    bool replaceable = false;                 ///< Occupied but may be displaced

    bool isOccupied() const { return connectedTo.has_value(); }
};

/// A movable graphical element. Owned by the host.
struct NodeData {
    NodeId id = INVALID_NODE;
    Point position;             ///< Canvas-space top-left
    Size size{100.0f, 40.0f};
    bool collapsed = false;
    bool movable = true;
    std::string label;
    std::vector<ConnectionData> connections;  ///< Ordered; index is significant

    Rect bounds() const { return {position, size}; }

    /// Find a connection by id
    const ConnectionData* findConnection(ConnectionId connectionId) const;

    /// Index of a connection in the ordered list, or -1
    int connectionIndex(ConnectionId connectionId) const;

    /// Connections visible for linking. Input sockets of collapsed nodes are hidden.
    bool isConnectionVisible(const ConnectionData& connection) const {
        return !(collapsed && connection.type == ConnectionType::Input);
    }
};

/// A linked (local, peer) pair captured from the host graph
struct ConnectionLink {
    ConnectionId local = INVALID_CONNECTION;
    ConnectionId peer = INVALID_CONNECTION;

    bool operator==(const ConnectionLink& o) const {
        return local == o.local && peer == o.peer;
    }
    bool operator!=(const ConnectionLink& o) const { return !(*this == o); }
};

/// Collect the links a node currently has, in connection order
std::vector<ConnectionLink> collectLinks(const NodeData& node);

}  // namespace blockshift
