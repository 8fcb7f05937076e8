#include "blockshift/move/MoveModeController.h"
#include "blockshift/common/Logger.h"

#include <algorithm>
#include <format>

namespace blockshift {

namespace {

HostCapabilities validated(HostCapabilities host) {
    host.validate();
    return host;
}

/// Parent-side links (Previous/Output) are preferred as the keyboard start candidate
bool isParentLink(ConnectionType localType) {
    return localType == ConnectionType::Previous || localType == ConnectionType::Output;
}

}  // namespace

MoveModeController::MoveModeController(HostCapabilities host, MoveOptions options, ClockFn clock)
    : host_(validated(std::move(host)))
    , options_(options)
    , clock_(clock ? std::move(clock) : steadyClock())
    , finder_(host_.connectionsCompatible)
    , overlay_(host_.highlightSurface, options_)
    , keyboard_(finder_, options_)
    , throttle_(options_.throttleInterval) {
    LOG_DEBUG("[MoveModeController] created: snapRadius={} throttle={}ms watchdog={}ms",
              options_.snapRadius, options_.throttleInterval.count(),
              options_.watchdogTimeout.count());
}

MoveModeController::~MoveModeController() {
    dispose();
}

// =============================================================================
// Public entry points
// =============================================================================

bool MoveModeController::startSession(NodeId node, Point originScreen, Modality modality,
                                      MoveType moveType) {
    checkWatchdog();
    if (session_.isActive()) {
        setError(MoveError::InvalidSessionStart,
                 std::format("session already active on node {}", session_.node));
        return false;
    }
    try {
        startSessionImpl(node, originScreen, modality, moveType);
    } catch (const std::exception& e) {
        recover("startSession", e);
        return false;
    }
    return session_.isActive();
}

void MoveModeController::updateSession(Point screen) {
    checkWatchdog();
    try {
        updateSessionImpl(screen);
    } catch (const std::exception& e) {
        recover("updateSession", e);
    }
}

bool MoveModeController::commitSession() {
    checkWatchdog();
    if (!session_.isActive()) {
        return false;
    }
    try {
        commitSessionImpl();
    } catch (const std::exception& e) {
        recover("commitSession", e);
        return false;
    }
    return true;
}

bool MoveModeController::cancelSession() {
    checkWatchdog();
    if (!session_.isActive()) {
        return false;
    }
    try {
        cancelSessionImpl();
    } catch (const std::exception& e) {
        recover("cancelSession", e);
    }
    return true;
}

bool MoveModeController::releaseAt(Point screen) {
    checkWatchdog();
    try {
        return releaseAtImpl(screen);
    } catch (const std::exception& e) {
        recover("releaseAt", e);
        return true;
    }
}

bool MoveModeController::handleKey(MoveKey key, KeyModifiers modifiers) {
    checkWatchdog();
    try {
        return handleKeyImpl(key, modifiers);
    } catch (const std::exception& e) {
        recover("handleKey", e);
        return true;
    }
}

bool MoveModeController::handleInput(const MoveInput& input) {
    switch (input.type) {
        case MoveInputType::StartRequest:
            if (session_.isActive()) {
                // Double-click/double-tap while moving is swallowed
                return true;
            }
            if (input.target == INVALID_NODE) {
                return false;
            }
            return startSession(input.target, input.screen, input.modality);

        case MoveInputType::Move:
            if (session_.state != SessionState::ActiveFollow) {
                return false;
            }
            updateSession(input.screen);
            return true;

        case MoveInputType::Release:
            return releaseAt(input.screen);

        case MoveInputType::Key:
            return handleKey(input.key, input.modifiers);

        case MoveInputType::Blur: {
            bool wasActive = session_.isActive();
            handleBlur();
            return wasActive;
        }
    }
    return false;
}

void MoveModeController::handleBlur() {
    if (session_.isActive()) {
        LOG_INFO("[MoveModeController] focus lost, cancelling move of node {}", session_.node);
    }
    cancelSession();
}

void MoveModeController::tick() {
    checkWatchdog();
    if (session_.state != SessionState::ActiveFollow) {
        return;
    }
    try {
        if (auto due = throttle_.takeDue(clock_())) {
            applyFollow(*due);
        }
    } catch (const std::exception& e) {
        recover("tick", e);
    }
}

void MoveModeController::refreshViewport() {
    if (!overlay_.isRegistered()) {
        return;
    }
    try {
        overlay_.refreshViewport(host_.getViewport());
    } catch (const std::exception& e) {
        recover("refreshViewport", e);
    }
}

void MoveModeController::dispose() {
    if (disposed_) {
        return;
    }
    if (session_.isActive()) {
        try {
            cancelSessionImpl();
        } catch (const std::exception& e) {
            recover("dispose", e);
        }
    }
    overlay_.dispose();
    disposed_ = true;
    LOG_DEBUG("[MoveModeController] disposed");
}

// =============================================================================
// Transitions
// =============================================================================

void MoveModeController::startSessionImpl(NodeId nodeId, Point originScreen, Modality modality,
                                          MoveType moveType) {
    if (disposed_) {
        setError(MoveError::InvalidSessionStart, "controller disposed");
        return;
    }
    auto node = host_.getNode(nodeId);
    if (!node) {
        setError(MoveError::InvalidSessionStart, std::format("node {} not found", nodeId));
        return;
    }
    if (!node->movable) {
        setError(MoveError::InvalidSessionStart, std::format("node {} is not movable", nodeId));
        return;
    }

    lastError_ = {};
    transformer_.reset();

    Point grabOffset{0.0f, 0.0f};
    if (modality != Modality::Keyboard) {
        Point canvas = transformer_.screenToCanvas(originScreen, host_.getViewport());
        if (transformer_.lastConversionFailed()) {
            setError(MoveError::CoordinateTransformFailure,
                     "degenerate viewport at session start, grabbing node origin");
        } else {
            grabOffset = canvas - node->position;
        }
    }
    // Degraded conversions fall back to the grab point, never to a previous session's point
    transformer_.seedCanvasPoint(node->position + grabOffset);

    session_.reset();
    session_.node = nodeId;
    session_.modality = modality;
    session_.moveType = moveType;
    session_.originPosition = node->position;
    session_.originConnections = collectLinks(*node);
    session_.grabOffset = grabOffset;
    session_.currentPosition = node->position;
    session_.startTime = clock_();
    session_.state = modality == Modality::Keyboard
        ? SessionState::ActiveStep
        : SessionState::ActiveFollow;

    // Detach for preview; originConnections restores the links on cancel
    host_.disconnectAll(nodeId);
    healStack(*node);
    if (host_.setInputDeferred) {
        host_.setInputDeferred(true);
    }

    auto detached = host_.getNode(nodeId);
    if (!detached) {
        detached = *node;
        for (auto& connection : detached->connections) {
            connection.connectedTo.reset();
        }
    }
    session_.locals = ConnectionCandidateFinder::localConnectionsOf(*detached);

    LOG_INFO("[MoveModeController] session started: node={} modality={} links={} open={}",
             nodeId, modalityName(modality), session_.originConnections.size(),
             session_.locals.size());
    if (events_.onSessionStarted) {
        events_.onSessionStarted(nodeId);
    }

    if (modality == Modality::Keyboard) {
        auto neighbours = gatherNeighbours();
        session_.highlighted = finder_.highlightSet(session_.locals, neighbours,
                                                    session_.currentPosition,
                                                    options_.maxHighlighted);
        auto initial = originCandidate(neighbours);
        keyboard_.begin(session_.currentPosition, initial);
        setCandidate(initial);
        updateHighlights();
    } else {
        evaluateAt(session_.currentPosition);
    }
}

void MoveModeController::updateSessionImpl(Point screen) {
    if (session_.state != SessionState::ActiveFollow) {
        return;
    }
    Point canvas = transformer_.screenToCanvas(screen, host_.getViewport());
    if (transformer_.lastConversionFailed()) {
        setError(MoveError::CoordinateTransformFailure,
                 "degenerate viewport, holding last known-good position");
        return;
    }
    if (throttle_.offer(canvas, clock_())) {
        applyFollow(canvas);
    }
}

void MoveModeController::commitSessionImpl() {
    if (!session_.isActive()) {
        return;
    }
    if (session_.state == SessionState::ActiveFollow) {
        if (auto pending = throttle_.flush()) {
            applyFollow(*pending);
        }
    }
    commitWith(session_.currentCandidate);
}

void MoveModeController::cancelSessionImpl() {
    if (!session_.isActive()) {
        return;
    }
    NodeId nodeId = session_.node;
    session_.state = SessionState::Cancelling;

    if (session_.moveType == MoveType::Insert && host_.deleteNode) {
        if (!host_.deleteNode(nodeId)) {
            LOG_WARN("[MoveModeController] could not delete inserted node {}, restoring", nodeId);
            restoreOrigin();
        }
    } else {
        restoreOrigin();
    }

    finishSession();
    LOG_INFO("[MoveModeController] session cancelled: node={}", nodeId);
    if (events_.onSessionCancelled) {
        events_.onSessionCancelled(nodeId);
    }
}

bool MoveModeController::releaseAtImpl(Point screen) {
    if (!session_.isActive()) {
        return false;
    }
    Viewport viewport = host_.getViewport();

    if (host_.deleteNode && host_.isDeletionTarget && host_.isDeletionTarget(screen)) {
        deleteActiveNode();
        return true;
    }

    std::optional<Point> pending = throttle_.flush();
    throttle_.reset();

    if (auto hit = overlay_.hitTest(screen, viewport)) {
        if (auto candidate = candidateForLink(*hit)) {
            LOG_DEBUG("[MoveModeController] marker clicked: {} -> {}", hit->local, hit->peer);
            commitWith(candidate);
            return true;
        }
    }

    // The release point itself is evaluated, not the last throttled one
    Point canvas = transformer_.screenToCanvas(screen, viewport);
    if (transformer_.lastConversionFailed()) {
        setError(MoveError::CoordinateTransformFailure,
                 "degenerate viewport on release, dropping at last known-good position");
        if (pending) {
            applyFollow(*pending);
        }
        commitWith(session_.currentCandidate);
        return true;
    }
    applyFollow(canvas);
    commitWith(session_.currentCandidate);
    return true;
}

bool MoveModeController::handleKeyImpl(MoveKey key, KeyModifiers modifiers) {
    if (!session_.isActive()) {
        return false;
    }
    switch (key) {
        case MoveKey::Escape:
            cancelSessionImpl();
            return true;
        case MoveKey::Enter:
            commitSessionImpl();
            return true;
        case MoveKey::Up:
        case MoveKey::Down:
        case MoveKey::Left:
        case MoveKey::Right:
            if (session_.state != SessionState::ActiveStep) {
                return false;
            }
            arrowKey(key == MoveKey::Up ? Direction::Up
                     : key == MoveKey::Down ? Direction::Down
                     : key == MoveKey::Left ? Direction::Left
                     : Direction::Right,
                     modifiers.any());
            return true;
        case MoveKey::Other:
            return false;
    }
    return false;
}

// =============================================================================
// Session internals
// =============================================================================

void MoveModeController::applyFollow(const Point& canvasGrab) {
    Point position = canvasGrab - session_.grabOffset;
    host_.moveNodeTo(session_.node, position);
    session_.currentPosition = position;
    evaluateAt(position);
}

void MoveModeController::evaluateAt(const Point& position) {
    auto neighbours = gatherNeighbours();
    auto best = finder_.findBest(session_.locals, neighbours, position, options_.snapRadius);
    session_.highlighted = finder_.highlightSet(session_.locals, neighbours, position,
                                                options_.maxHighlighted);
    setCandidate(best);
    updateHighlights();
}

void MoveModeController::arrowKey(Direction direction, bool modified) {
    if (modified) {
        Point position = keyboard_.step(direction, session_.currentPosition);
        host_.moveNodeTo(session_.node, position);
        session_.currentPosition = position;
        session_.highlighted = finder_.highlightSet(session_.locals, gatherNeighbours(), position,
                                                    options_.maxHighlighted);
        setCandidate(std::nullopt);
        updateHighlights();
        return;
    }

    auto candidate = keyboard_.cycle(KeyboardDragStrategy::cycleStep(direction),
                                     session_.locals, gatherNeighbours());
    if (!candidate) {
        LOG_DEBUG("[MoveModeController] no candidates to cycle for node {}", session_.node);
        return;
    }
    Point position = candidate->snappedNodePosition();
    host_.moveNodeTo(session_.node, position);
    session_.currentPosition = position;
    setCandidate(candidate);
    updateHighlights();
}

void MoveModeController::commitWith(const std::optional<ConnectionCandidate>& candidate) {
    NodeId nodeId = session_.node;
    session_.state = SessionState::Committing;

    std::optional<ConnectionLink> finalLink;
    if (candidate) {
        finalLink = connectCandidate(*candidate);
    }

    finishSession();
    if (finalLink) {
        LOG_INFO("[MoveModeController] session committed: node={} connected {} -> {}",
                 nodeId, finalLink->local, finalLink->peer);
    } else {
        LOG_INFO("[MoveModeController] session committed: node={} dropped disconnected", nodeId);
    }
    if (events_.onSessionCommitted) {
        events_.onSessionCommitted(nodeId, finalLink);
    }
}

std::optional<ConnectionLink> MoveModeController::connectCandidate(
    const ConnectionCandidate& candidate) {

    auto conflict = [this](std::string reason) -> std::optional<ConnectionLink> {
        setError(MoveError::CommitConflict, std::move(reason) + ", dropped disconnected");
        return std::nullopt;
    };

    auto moving = host_.getNode(session_.node);
    auto owner = host_.getNode(candidate.neighbourNode);
    const ConnectionData* local = moving ? moving->findConnection(candidate.local) : nullptr;
    const ConnectionData* neighbour = owner ? owner->findConnection(candidate.neighbour) : nullptr;

    if (!local || !neighbour) {
        return conflict("candidate connection no longer exists");
    }
    if (local->isOccupied()) {
        return conflict(std::format("local connection {} is occupied", local->id));
    }
    if (!owner->isConnectionVisible(*neighbour)) {
        return conflict(std::format("neighbour connection {} is hidden", neighbour->id));
    }
    if (!host_.connectionsCompatible(local->type, neighbour->type)) {
        return conflict(std::format("connections {} and {} are no longer compatible",
                                    local->id, neighbour->id));
    }
    if (neighbour->isOccupied() && !isReplaceable(*neighbour)) {
        return conflict(std::format("neighbour connection {} became occupied", neighbour->id));
    }

    std::optional<ConnectionId> displaced = neighbour->connectedTo;
    Point snapped = neighbour->anchor - (local->anchor - moving->position);

    if (displaced) {
        host_.disconnect(neighbour->id);
    }
    host_.moveNodeTo(session_.node, snapped);

    if (!host_.connect(local->id, neighbour->id)) {
        host_.moveNodeTo(session_.node, session_.currentPosition);
        if (displaced && !host_.connect(*displaced, neighbour->id)) {
            LOG_WARN("[MoveModeController] could not reattach displaced connection {}", *displaced);
        }
        return conflict(std::format("host rejected {} -> {}", local->id, neighbour->id));
    }

    session_.currentPosition = snapped;
    if (displaced) {
        spliceDisplaced(*displaced);
    }
    return ConnectionLink{local->id, neighbour->id};
}

void MoveModeController::spliceDisplaced(ConnectionId displacedPeer) {
    auto peerOwner = findConnectionOwner(displacedPeer);
    auto moving = host_.getNode(session_.node);
    const ConnectionData* peer = peerOwner ? peerOwner->findConnection(displacedPeer) : nullptr;
    if (!peer || !moving) {
        return;
    }

    for (const auto& connection : moving->connections) {
        if (connection.isOccupied() || !moving->isConnectionVisible(connection)) {
            continue;
        }
        if (!host_.connectionsCompatible(connection.type, peer->type)) {
            continue;
        }
        if (host_.connect(connection.id, displacedPeer)) {
            LOG_DEBUG("[MoveModeController] spliced displaced node {} onto connection {}",
                      peerOwner->id, connection.id);
            return;
        }
    }
    LOG_DEBUG("[MoveModeController] displaced node {} left disconnected", peerOwner->id);
}

void MoveModeController::healStack(const NodeData& node) {
    std::optional<ConnectionId> parent;
    std::optional<ConnectionId> child;
    for (const auto& connection : node.connections) {
        if (!connection.connectedTo) {
            continue;
        }
        if (connection.type == ConnectionType::Previous) {
            parent = connection.connectedTo;
        } else if (connection.type == ConnectionType::Next) {
            child = connection.connectedTo;
        }
    }
    if (!parent || !child) {
        return;
    }
    if (!host_.connect(*parent, *child)) {
        LOG_WARN("[MoveModeController] could not heal stack around node {}: {} -> {}",
                 node.id, *parent, *child);
        return;
    }
    session_.healedLink = ConnectionLink{*parent, *child};
    LOG_DEBUG("[MoveModeController] healed stack around node {}: {} -> {}",
              node.id, *parent, *child);
}

bool MoveModeController::isReplaceable(const ConnectionData& connection) const {
    if (connection.replaceable) {
        return true;
    }
    // The healed link stands in for the lifted node and gives way to it again
    const auto& healed = session_.healedLink;
    return healed && (connection.id == healed->local || connection.id == healed->peer);
}

void MoveModeController::restoreOrigin() {
    NodeId nodeId = session_.node;
    if (const auto& healed = session_.healedLink) {
        host_.disconnect(healed->local);
        host_.disconnect(healed->peer);
    }
    host_.disconnectAll(nodeId);
    host_.moveNodeTo(nodeId, session_.originPosition);
    for (const auto& link : session_.originConnections) {
        if (!host_.connect(link.local, link.peer)) {
            LOG_WARN("[MoveModeController] could not restore link {} -> {} on node {}",
                     link.local, link.peer, nodeId);
        }
    }
}

void MoveModeController::deleteActiveNode() {
    NodeId nodeId = session_.node;
    if (!host_.deleteNode(nodeId)) {
        LOG_WARN("[MoveModeController] host refused to delete node {}, cancelling", nodeId);
        cancelSessionImpl();
        return;
    }
    finishSession();
    LOG_INFO("[MoveModeController] session ended by deletion: node={}", nodeId);
    if (events_.onSessionDeleted) {
        events_.onSessionDeleted(nodeId);
    }
}

void MoveModeController::finishSession() {
    bool wasStarted = session_.state != SessionState::Inactive;

    overlay_.clear();
    if (wasStarted && host_.setInputDeferred) {
        try {
            host_.setInputDeferred(false);
        } catch (const std::exception& e) {
            LOG_ERROR("[MoveModeController] setInputDeferred(false) failed: {}", e.what());
        }
    }
    throttle_.reset();
    keyboard_.reset();
    session_.reset();
}

void MoveModeController::checkWatchdog() {
    if (!session_.isActive()) {
        return;
    }
    if (clock_() - session_.startTime < options_.watchdogTimeout) {
        return;
    }
    ++watchdogFires_;
    LOG_ERROR("[MoveModeController] watchdog: session on node {} exceeded {}ms, forcing cancel",
              session_.node, options_.watchdogTimeout.count());
    try {
        cancelSessionImpl();
    } catch (const std::exception& e) {
        recover("watchdog", e);
    }
}

void MoveModeController::recover(const char* where, const std::exception& e) {
    LOG_ERROR("[MoveModeController] {} failed: {}", where, e.what());
    if (session_.state == SessionState::Inactive) {
        return;
    }

    NodeId nodeId = session_.node;
    try {
        restoreOrigin();
    } catch (const std::exception& inner) {
        LOG_ERROR("[MoveModeController] restore of node {} failed: {}", nodeId, inner.what());
    }
    finishSession();

    if (events_.onSessionCancelled) {
        try {
            events_.onSessionCancelled(nodeId);
        } catch (const std::exception& inner) {
            LOG_ERROR("[MoveModeController] sessionCancelled handler failed: {}", inner.what());
        }
    }
}

// =============================================================================
// Helpers
// =============================================================================

void MoveModeController::setCandidate(const std::optional<ConnectionCandidate>& candidate) {
    const auto& current = session_.currentCandidate;
    bool changed = candidate.has_value() != current.has_value() ||
                   (candidate && !candidate->samePair(*current));
    session_.currentCandidate = candidate;
    if (!changed) {
        return;
    }
    if (candidate) {
        LOG_DEBUG("[MoveModeController] candidate {} -> {} (distance {:.1f})",
                  candidate->local, candidate->neighbour, candidate->distance);
    } else {
        LOG_DEBUG("[MoveModeController] candidate cleared");
    }
    if (events_.onCandidateChanged) {
        events_.onCandidateChanged(session_.node, candidate);
    }
}

void MoveModeController::updateHighlights() {
    if (!options_.highlightEnabled) {
        return;
    }
    // A cycled candidate can rank past maxHighlighted; it still gets its marker
    const auto& current = session_.currentCandidate;
    if (current && !inHighlightSet(*current)) {
        auto shown = session_.highlighted;
        shown.push_back(*current);
        overlay_.setCandidates(shown, current, host_.getViewport());
        return;
    }
    overlay_.setCandidates(session_.highlighted, session_.currentCandidate, host_.getViewport());
}

std::vector<NeighbourConnection> MoveModeController::gatherNeighbours() const {
    std::vector<NodeData> nodes;
    for (NodeId id : host_.listNodes()) {
        if (id == session_.node) {
            continue;
        }
        if (auto node = host_.getNode(id)) {
            nodes.push_back(std::move(*node));
        }
    }
    auto neighbours = ConnectionCandidateFinder::neighbourConnectionsOf(nodes, session_.node);
    if (const auto& healed = session_.healedLink) {
        for (auto& neighbour : neighbours) {
            if (neighbour.id == healed->local || neighbour.id == healed->peer) {
                neighbour.replaceable = true;
            }
        }
    }
    return neighbours;
}

std::optional<ConnectionCandidate> MoveModeController::originCandidate(
    const std::vector<NeighbourConnection>& neighbours) const {

    if (session_.originConnections.empty()) {
        return std::nullopt;
    }

    auto links = session_.originConnections;
    auto localType = [this](ConnectionId id) -> std::optional<ConnectionType> {
        for (const auto& local : session_.locals) {
            if (local.id == id) {
                return local.type;
            }
        }
        return std::nullopt;
    };
    std::stable_partition(links.begin(), links.end(), [&](const ConnectionLink& link) {
        auto type = localType(link.local);
        return type && isParentLink(*type);
    });

    auto all = finder_.highlightSet(session_.locals, neighbours, session_.currentPosition, 0);
    for (const auto& link : links) {
        for (const auto& candidate : all) {
            if (candidate.local == link.local && candidate.neighbour == link.peer) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

bool MoveModeController::inHighlightSet(const ConnectionCandidate& candidate) const {
    return std::any_of(session_.highlighted.begin(), session_.highlighted.end(),
        [&](const ConnectionCandidate& c) { return c.samePair(candidate); });
}

std::optional<ConnectionCandidate> MoveModeController::candidateForLink(
    const ConnectionLink& link) const {
    const auto& current = session_.currentCandidate;
    if (current && current->link() == link) {
        return current;
    }
    for (const auto& candidate : session_.highlighted) {
        if (candidate.local == link.local && candidate.neighbour == link.peer) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<NodeData> MoveModeController::findConnectionOwner(ConnectionId connection) const {
    for (NodeId id : host_.listNodes()) {
        auto node = host_.getNode(id);
        if (node && node->findConnection(connection)) {
            return node;
        }
    }
    return std::nullopt;
}

void MoveModeController::setError(MoveError error, std::string reason) {
    LOG_WARN("[MoveModeController] {}: {}", moveErrorName(error), reason);
    lastError_ = {error, std::move(reason)};
}

}  // namespace blockshift
