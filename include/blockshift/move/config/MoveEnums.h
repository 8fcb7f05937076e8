#pragma once

namespace blockshift {

/// Input method driving a session
enum class Modality {
    Pointer,   ///< Mouse or pen: double-click to stick, click to drop
    Touch,     ///< Double-tap to stick, tap to drop
    Keyboard   ///< Arrow keys cycle candidates or step the node
};

/// Move session state. Committing and Cancelling are transient.
enum class SessionState {
    Inactive,
    ActiveFollow,  ///< Node follows pointer/touch position
    ActiveStep,    ///< Node moves by keyboard steps and candidate cycling
    Committing,
    Cancelling
};

/// Whether the moved node existed before the session
enum class MoveType {
    Move,    ///< Regular move; cancelling restores the original placement
    Insert   ///< Node freshly inserted; cancelling deletes it
};

/// Failure taxonomy reported by the engine
enum class MoveError {
    None,
    InvalidSessionStart,
    MissingHostCapability,
    CoordinateTransformFailure,
    CommitConflict
};

/// Keys the engine reacts to
enum class MoveKey {
    Up,
    Down,
    Left,
    Right,
    Enter,
    Escape,
    Other
};

/// Direction of a keyboard movement
enum class Direction {
    Up,
    Down,
    Left,
    Right
};

inline bool isActiveState(SessionState state) {
    return state == SessionState::ActiveFollow || state == SessionState::ActiveStep;
}

const char* modalityName(Modality modality);
const char* sessionStateName(SessionState state);
const char* moveErrorName(MoveError error);

}  // namespace blockshift
