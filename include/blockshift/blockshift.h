#pragma once

/// @file blockshift.h
/// @brief Main header for the blockshift move engine
///
/// blockshift repositions connectable nodes with pointer, touch or keyboard
/// input: it finds compatible nearby connections, keeps host highlights in
/// sync and commits or cancels the move through a host capability contract.
///
/// Example usage:
/// @code
/// #include <blockshift/blockshift.h>
///
/// blockshift::HostCapabilities host = makeHostAdapter();
/// blockshift::MoveModeController controller(host);
///
/// controller.startSession(nodeId, pointer, blockshift::Modality::Pointer);
/// controller.updateSession(pointer);
/// controller.releaseAt(pointer);
/// @endcode

// Core module - Geometry, node model, coordinate spaces
#include "core/Types.h"
#include "core/Clock.h"
#include "core/BlockModel.h"
#include "core/CoordinateTransformer.h"

// Host contract
#include "host/HighlightSurface.h"
#include "host/HostCapabilities.h"

// Input normalization
#include "input/InputEvent.h"
#include "input/InputNormalizer.h"

// Move module - Session state machine and its collaborators
#include "move/config/MoveEnums.h"
#include "move/config/MoveOptions.h"
#include "move/ConnectionCandidateFinder.h"
#include "move/ConnectionHighlightOverlay.h"
#include "move/KeyboardDragStrategy.h"
#include "move/UpdateThrottle.h"
#include "move/MoveEvents.h"
#include "move/MoveSession.h"
#include "move/MoveModeController.h"

// Utilities
#include "util/OptionsSerializer.h"

#include <string>

namespace blockshift {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace blockshift
