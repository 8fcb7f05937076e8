#include <blockshift/blockshift.h>
#include <blockshift/common/Logger.h>

#include <iomanip>
#include <iostream>
#include <map>

using namespace blockshift;

// Minimal in-memory workspace: stacks of statement blocks
class DemoWorkspace {
public:
    NodeId addBlock(const std::string& label, Point position) {
        NodeData node;
        node.id = nextNode_++;
        node.position = position;
        node.label = label;
        node.connections.push_back(makeConnection(node.id, ConnectionType::Previous));
        node.connections.push_back(makeConnection(node.id, ConnectionType::Next));
        nodes_[node.id] = node;
        placeAnchors(nodes_[node.id]);
        return node.id;
    }

    ConnectionId previousOf(NodeId id) const { return nodes_.at(id).connections[0].id; }
    ConnectionId nextOf(NodeId id) const { return nodes_.at(id).connections[1].id; }

    HostCapabilities capabilities() {
        HostCapabilities caps;
        caps.getNode = [this](NodeId id) -> std::optional<NodeData> {
            auto it = nodes_.find(id);
            if (it == nodes_.end()) return std::nullopt;
            return it->second;
        };
        caps.listNodes = [this] {
            std::vector<NodeId> ids;
            for (const auto& [id, node] : nodes_) ids.push_back(id);
            return ids;
        };
        caps.connectionsCompatible = defaultConnectionsCompatible;
        caps.moveNodeTo = [this](NodeId id, Point p) {
            nodes_.at(id).position = p;
            placeAnchors(nodes_.at(id));
        };
        caps.connect = [this](ConnectionId a, ConnectionId b) {
            auto* ca = find(a);
            auto* cb = find(b);
            if (!ca || !cb || ca->isOccupied() || cb->isOccupied()) return false;
            ca->connectedTo = b;
            cb->connectedTo = a;
            return true;
        };
        caps.disconnect = [this](ConnectionId id) { unlink(id); };
        caps.disconnectAll = [this](NodeId id) {
            for (auto& c : nodes_.at(id).connections) unlink(c.id);
        };
        caps.getViewport = [this] { return viewport; };
        caps.highlightSurface.addMarker = [](const HighlightMarker& m) {
            std::cout << "    + marker " << m.key.local << "->" << m.key.peer
                      << (m.emphasized ? " *" : "") << "\n";
        };
        caps.highlightSurface.updateMarker = [](const HighlightMarker& m) {
            std::cout << "    ~ marker " << m.key.local << "->" << m.key.peer
                      << (m.emphasized ? " *" : "") << "\n";
        };
        caps.highlightSurface.removeMarker = [](const ConnectionLink& key) {
            std::cout << "    - marker " << key.local << "->" << key.peer << "\n";
        };
        return caps;
    }

    void print() const {
        for (const auto& [id, node] : nodes_) {
            std::cout << "  " << node.label << " at (" << std::fixed << std::setprecision(1)
                      << node.position.x << "," << node.position.y << ")";
            for (const auto& c : node.connections) {
                if (c.connectedTo) {
                    std::cout << "  " << connectionTypeName(c.type) << "->" << *c.connectedTo;
                }
            }
            std::cout << "\n";
        }
    }

    Viewport viewport{{0.0f, 0.0f}, 1.0f};

private:
    ConnectionData makeConnection(NodeId node, ConnectionType type) {
        ConnectionData c;
        c.id = nextConnection_++;
        c.type = type;
        c.nodeId = node;
        return c;
    }

    static void placeAnchors(NodeData& node) {
        for (auto& c : node.connections) {
            float dy = c.type == ConnectionType::Previous ? 0.0f : node.size.height;
            c.anchor = {node.position.x, node.position.y + dy};
        }
    }

    ConnectionData* find(ConnectionId id) {
        for (auto& [nodeId, node] : nodes_) {
            for (auto& c : node.connections) {
                if (c.id == id) return &c;
            }
        }
        return nullptr;
    }

    void unlink(ConnectionId id) {
        auto* c = find(id);
        if (!c || !c->connectedTo) return;
        if (auto* peer = find(*c->connectedTo)) peer->connectedTo.reset();
        c->connectedTo.reset();
    }

    std::map<NodeId, NodeData> nodes_;
    NodeId nextNode_ = 1;
    ConnectionId nextConnection_ = 1;
};

int main() {
    Logger::initialize();
    Logger::setLevel(LogLevel::Info);

    std::cout << "=== blockshift " << versionString() << " move demo ===\n\n";

    DemoWorkspace workspace;
    NodeId start = workspace.addBlock("start", {0.0f, 0.0f});
    NodeId loop = workspace.addBlock("loop", {0.0f, 40.0f});
    NodeId print = workspace.addBlock("print", {200.0f, 200.0f});
    workspace.capabilities().connect(workspace.nextOf(start), workspace.previousOf(loop));

    std::cout << "Initial workspace:\n";
    workspace.print();

    MoveModeController controller(workspace.capabilities());
    MoveEvents events;
    events.onSessionCommitted = [](NodeId id, const std::optional<ConnectionLink>& link) {
        std::cout << "  committed node " << id
                  << (link ? " (connected)" : " (dropped free)") << "\n";
    };
    events.onSessionCancelled = [](NodeId id) {
        std::cout << "  cancelled node " << id << "\n";
    };
    controller.setEvents(std::move(events));

    // 1. Pointer: pick up "print" and drop it under "loop"
    std::cout << "\n1. Pointer move of 'print' below 'loop':\n";
    controller.startSession(print, {210.0f, 210.0f}, Modality::Pointer);
    controller.updateSession({12.0f, 92.0f});
    controller.releaseAt({12.0f, 92.0f});
    workspace.print();

    // 2. Keyboard: cycle candidates for "loop", then cancel
    std::cout << "\n2. Keyboard move of 'loop', cycle twice then Escape:\n";
    controller.startSession(loop, {}, Modality::Keyboard);
    controller.handleKey(MoveKey::Down);
    controller.handleKey(MoveKey::Down);
    controller.handleKey(MoveKey::Escape);
    workspace.print();

    // 3. Keyboard: step free and drop
    std::cout << "\n3. Keyboard move of 'start', three steps right then Enter:\n";
    KeyModifiers shift;
    shift.shift = true;
    controller.startSession(start, {}, Modality::Keyboard);
    for (int i = 0; i < 3; ++i) {
        controller.handleKey(MoveKey::Right, shift);
    }
    controller.handleKey(MoveKey::Enter);
    workspace.print();

    controller.dispose();
    Logger::flush();
    return 0;
}
