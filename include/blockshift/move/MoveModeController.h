#pragma once

#include "blockshift/core/Clock.h"
#include "blockshift/core/CoordinateTransformer.h"
#include "blockshift/host/HostCapabilities.h"
#include "blockshift/input/InputEvent.h"
#include "blockshift/move/ConnectionCandidateFinder.h"
#include "blockshift/move/ConnectionHighlightOverlay.h"
#include "blockshift/move/KeyboardDragStrategy.h"
#include "blockshift/move/MoveEvents.h"
#include "blockshift/move/MoveSession.h"
#include "blockshift/move/UpdateThrottle.h"
#include "blockshift/move/config/MoveEnums.h"
#include "blockshift/move/config/MoveOptions.h"

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blockshift {

/// Outcome of the last failed or degraded operation
struct SessionError {
    MoveError error = MoveError::None;
    std::string reason;
};

/**
 * @brief Move-mode state machine for one workspace
 *
 * Owns the MoveSession and drives the candidate finder, highlight overlay
 * and keyboard strategy. The host graph is only reached through
 * HostCapabilities.
 *
 * States: Inactive -> ActiveFollow | ActiveStep -> Committing | Cancelling -> Inactive.
 * Every exit runs the same cleanup routine, so after any public call returns
 * an ended session has left no highlights, no deferred input and no session
 * state behind. Public entry points never throw; failures are logged and
 * reported through lastError().
 *
 * Usage:
 * @code
 * MoveModeController controller(host);
 * controller.startSession(nodeId, pointerPos, Modality::Pointer);
 * controller.updateSession(pointerPos);   // per pointer move
 * controller.tick();                      // per frame
 * controller.releaseAt(clickPos);         // commit
 * @endcode
 */
class MoveModeController {
public:
    /// @throws MissingHostCapabilityError if a required capability is absent
    explicit MoveModeController(HostCapabilities host,
                                MoveOptions options = {},
                                ClockFn clock = {});
    ~MoveModeController();

    MoveModeController(const MoveModeController&) = delete;
    MoveModeController& operator=(const MoveModeController&) = delete;

    void setEvents(MoveEvents events) { events_ = std::move(events); }

    /// Enter move mode for `node`.
    /// @param originScreen Device point of the initiating event (grab point)
    /// @return false with lastError() == InvalidSessionStart if rejected
    bool startSession(NodeId node, Point originScreen, Modality modality,
                      MoveType moveType = MoveType::Move);

    /// Pointer/touch follow update (throttled)
    void updateSession(Point screen);

    /// Commit at the current candidate. No-op while inactive.
    /// @return true if a session was committed
    bool commitSession();

    /// Restore the original placement. No-op while inactive.
    /// @return true if a session was cancelled
    bool cancelSession();

    /// Click or tap while active: delete on deletion targets, commit to a
    /// clicked marker, otherwise evaluate the point exactly and commit
    /// @return true if the release was consumed
    bool releaseAt(Point screen);

    /// @return true if the key was consumed
    bool handleKey(MoveKey key, KeyModifiers modifiers = {});

    /// Single dispatch point for normalized input
    /// @return true if the input was consumed
    bool handleInput(const MoveInput& input);

    /// Focus loss cancels the session
    void handleBlur();

    /// Per-frame hook: delivers trailing throttled updates and checks the watchdog
    void tick();

    /// Re-project highlights after the host viewport changed
    void refreshViewport();

    /// End any session and release the overlay. The controller is inert afterwards.
    void dispose();

    // ===== Queries =====

    SessionState state() const { return session_.state; }
    bool isActive() const { return session_.isActive(); }
    bool isDisposed() const { return disposed_; }
    NodeId activeNode() const { return session_.node; }
    const MoveSession& session() const { return session_; }
    const std::optional<ConnectionCandidate>& currentCandidate() const {
        return session_.currentCandidate;
    }

    const SessionError& lastError() const { return lastError_; }
    int watchdogFireCount() const { return watchdogFires_; }

    const ConnectionHighlightOverlay& overlay() const { return overlay_; }
    const KeyboardDragStrategy& keyboard() const { return keyboard_; }
    const MoveOptions& options() const { return options_; }

private:
    void startSessionImpl(NodeId node, Point originScreen, Modality modality, MoveType moveType);
    void updateSessionImpl(Point screen);
    void commitSessionImpl();
    void cancelSessionImpl();
    bool releaseAtImpl(Point screen);
    bool handleKeyImpl(MoveKey key, KeyModifiers modifiers);

    /// Move the node to follow a canvas grab point and re-evaluate candidates
    void applyFollow(const Point& canvasGrab);

    /// Best candidate and highlight set at `position`
    void evaluateAt(const Point& position);

    void arrowKey(Direction direction, bool modified);

    /// Connect to `candidate` (or drop free) and end the session
    void commitWith(const std::optional<ConnectionCandidate>& candidate);

    /// Host-side connect including displacement of a replaceable occupant
    std::optional<ConnectionLink> connectCandidate(const ConnectionCandidate& candidate);

    /// Reattach a displaced connection to an open connection of the moved node
    void spliceDisplaced(ConnectionId displacedPeer);

    /// Reconnect parent and child of the lifted node (Previous peer to Next peer)
    void healStack(const NodeData& node);

    /// Whether a neighbour connection may be displaced on commit
    bool isReplaceable(const ConnectionData& connection) const;

    /// Restore origin position and links
    void restoreOrigin();

    void deleteActiveNode();

    /// The one cleanup routine shared by every exit path
    void finishSession();

    /// Force-cancel if the session outlived the watchdog timeout
    void checkWatchdog();

    /// Log, undo what can be undone, and clean up after an exception
    void recover(const char* where, const std::exception& e);

    void setCandidate(const std::optional<ConnectionCandidate>& candidate);
    void updateHighlights();

    std::vector<NeighbourConnection> gatherNeighbours() const;
    /// Candidate matching the node's original parent link, if still valid
    std::optional<ConnectionCandidate> originCandidate(
        const std::vector<NeighbourConnection>& neighbours) const;
    std::optional<ConnectionCandidate> candidateForLink(const ConnectionLink& link) const;
    bool inHighlightSet(const ConnectionCandidate& candidate) const;

    /// Node owning a connection, searched through listNodes()
    std::optional<NodeData> findConnectionOwner(ConnectionId connection) const;

    void setError(MoveError error, std::string reason);

    HostCapabilities host_;
    MoveOptions options_;
    ClockFn clock_;
    MoveEvents events_;

    CoordinateTransformer transformer_;
    ConnectionCandidateFinder finder_;
    ConnectionHighlightOverlay overlay_;
    KeyboardDragStrategy keyboard_;
    UpdateThrottle throttle_;

    MoveSession session_;
    SessionError lastError_;
    int watchdogFires_ = 0;
    bool disposed_ = false;
};

}  // namespace blockshift
