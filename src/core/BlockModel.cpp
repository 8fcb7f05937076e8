#include "blockshift/core/BlockModel.h"

namespace blockshift {

const char* connectionTypeName(ConnectionType type) {
    switch (type) {
        case ConnectionType::Previous: return "previous";
        case ConnectionType::Next: return "next";
        case ConnectionType::Input: return "input";
        case ConnectionType::Output: return "output";
    }
    return "unknown";
}

const ConnectionData* NodeData::findConnection(ConnectionId connectionId) const {
    for (const auto& connection : connections) {
        if (connection.id == connectionId) {
            return &connection;
        }
    }
    return nullptr;
}

int NodeData::connectionIndex(ConnectionId connectionId) const {
    for (size_t i = 0; i < connections.size(); ++i) {
        if (connections[i].id == connectionId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::vector<ConnectionLink> collectLinks(const NodeData& node) {
    std::vector<ConnectionLink> links;
    for (const auto& connection : node.connections) {
        if (connection.connectedTo) {
            links.push_back({connection.id, *connection.connectedTo});
        }
    }
    return links;
}

}  // namespace blockshift
