#pragma once

#include "blockshift/core/CoordinateTransformer.h"
#include "blockshift/input/InputEvent.h"
#include "blockshift/move/config/MoveOptions.h"

#include <functional>
#include <optional>

namespace blockshift {

/// Turns raw mouse, touch, pen and key events into MoveInput.
///
/// Mouse and pen map to Modality::Pointer, touch to Modality::Touch. A press
/// followed by a release within the tap slop is a Release (click/tap); two
/// touch taps on the same node within the double-tap interval and slop are a
/// StartRequest, as is a mouse double-click. Slop distances are compared in
/// canvas units so a pan between taps does not create false double-taps.
class InputNormalizer {
public:
    using ViewportFn = std::function<Viewport()>;

    explicit InputNormalizer(ViewportFn viewport, MoveOptions options = {});

    /// @return Normalized input, or nullopt if the event carries nothing for the engine
    std::optional<MoveInput> normalize(const RawInputEvent& event);

    void reset();

    static Modality modalityOf(PointerKind kind) {
        return kind == PointerKind::Touch ? Modality::Touch : Modality::Pointer;
    }

private:
    struct Press {
        Point screen;
        PointerKind pointer = PointerKind::Mouse;
    };

    struct Tap {
        Point canvas;
        NodeId target = INVALID_NODE;
        TimePoint time{};
    };

    std::optional<MoveInput> handleRelease(const RawInputEvent& event);
    bool isDoubleTap(const Tap& tap);

    ViewportFn viewport_;
    MoveOptions options_;
    CoordinateTransformer transformer_;
    std::optional<Press> press_;
    std::optional<Tap> lastTap_;
};

}  // namespace blockshift
