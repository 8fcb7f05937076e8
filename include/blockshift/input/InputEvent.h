#pragma once

#include "blockshift/core/Clock.h"
#include "blockshift/core/Types.h"
#include "blockshift/move/config/MoveEnums.h"

namespace blockshift {

/// Device that produced a pointer event
enum class PointerKind {
    Mouse,
    Touch,
    Pen
};

enum class RawEventType {
    PointerDown,
    PointerUp,
    PointerMove,
    DoubleClick,
    KeyDown,
    Blur
};

struct KeyModifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool meta = false;

    bool any() const { return shift || ctrl || alt || meta; }
};

/// Event as forwarded by the host adapter
struct RawInputEvent {
    RawEventType type = RawEventType::PointerMove;
    PointerKind pointer = PointerKind::Mouse;
    Point screen;                  ///< Device coordinates
    MoveKey key = MoveKey::Other;
    KeyModifiers modifiers;
    NodeId target = INVALID_NODE;  ///< Node under the pointer, as resolved by the host
    TimePoint timestamp{};
};

/// Normalized engine input
enum class MoveInputType {
    StartRequest,  ///< Double-click or double-tap on a node
    Move,
    Release,       ///< Click or tap
    Key,
    Blur
};

struct MoveInput {
    MoveInputType type = MoveInputType::Move;
    Modality modality = Modality::Pointer;
    Point screen;
    MoveKey key = MoveKey::Other;
    KeyModifiers modifiers;
    NodeId target = INVALID_NODE;
};

}  // namespace blockshift
