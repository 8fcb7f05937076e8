#include "blockshift/move/config/MoveEnums.h"

namespace blockshift {

const char* modalityName(Modality modality) {
    switch (modality) {
        case Modality::Pointer: return "pointer";
        case Modality::Touch: return "touch";
        case Modality::Keyboard: return "keyboard";
    }
    return "unknown";
}

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Inactive: return "inactive";
        case SessionState::ActiveFollow: return "active-follow";
        case SessionState::ActiveStep: return "active-step";
        case SessionState::Committing: return "committing";
        case SessionState::Cancelling: return "cancelling";
    }
    return "unknown";
}

const char* moveErrorName(MoveError error) {
    switch (error) {
        case MoveError::None: return "none";
        case MoveError::InvalidSessionStart: return "invalid-session-start";
        case MoveError::MissingHostCapability: return "missing-host-capability";
        case MoveError::CoordinateTransformFailure: return "coordinate-transform-failure";
        case MoveError::CommitConflict: return "commit-conflict";
    }
    return "unknown";
}

}  // namespace blockshift
