#include "blockshift/input/InputNormalizer.h"
#include "blockshift/common/Logger.h"

#include <utility>

namespace blockshift {

InputNormalizer::InputNormalizer(ViewportFn viewport, MoveOptions options)
    : viewport_(std::move(viewport))
    , options_(options) {
}

std::optional<MoveInput> InputNormalizer::normalize(const RawInputEvent& event) {
    MoveInput input;
    input.modality = modalityOf(event.pointer);
    input.screen = event.screen;
    input.target = event.target;
    input.modifiers = event.modifiers;

    switch (event.type) {
        case RawEventType::PointerDown:
            press_ = Press{event.screen, event.pointer};
            return std::nullopt;

        case RawEventType::PointerUp:
            return handleRelease(event);

        case RawEventType::PointerMove:
            input.type = MoveInputType::Move;
            return input;

        case RawEventType::DoubleClick:
            // Touch double-taps are recognized from taps; ignore synthesized dblclicks
            if (event.pointer == PointerKind::Touch || event.target == INVALID_NODE) {
                return std::nullopt;
            }
            input.type = MoveInputType::StartRequest;
            return input;

        case RawEventType::KeyDown:
            input.type = MoveInputType::Key;
            input.modality = Modality::Keyboard;
            input.key = event.key;
            return input;

        case RawEventType::Blur:
            press_.reset();
            lastTap_.reset();
            input.type = MoveInputType::Blur;
            return input;
    }
    return std::nullopt;
}

std::optional<MoveInput> InputNormalizer::handleRelease(const RawInputEvent& event) {
    if (!press_) {
        return std::nullopt;
    }
    Press press = *press_;
    press_.reset();

    if (press.pointer != event.pointer ||
        press.screen.distanceTo(event.screen) > options_.tapSlopDevice) {
        // A drag or pan rather than a click
        lastTap_.reset();
        return std::nullopt;
    }

    MoveInput input;
    input.type = MoveInputType::Release;
    input.modality = modalityOf(event.pointer);
    input.screen = event.screen;
    input.target = event.target;
    input.modifiers = event.modifiers;

    if (event.pointer != PointerKind::Touch) {
        return input;
    }

    Viewport viewport = viewport_ ? viewport_() : Viewport{};
    Tap tap{transformer_.screenToCanvas(event.screen, viewport), event.target, event.timestamp};
    if (lastTap_ && isDoubleTap(tap)) {
        lastTap_.reset();
        if (tap.target != INVALID_NODE) {
            LOG_DEBUG("[InputNormalizer] double-tap on node {}", tap.target);
            input.type = MoveInputType::StartRequest;
        }
        return input;
    }
    lastTap_ = tap;
    return input;
}

bool InputNormalizer::isDoubleTap(const Tap& tap) {
    if (tap.target != lastTap_->target) {
        return false;
    }
    auto elapsed = tap.time - lastTap_->time;
    if (elapsed < TimePoint::duration::zero() || elapsed > options_.doubleTapInterval) {
        return false;
    }
    Viewport viewport = viewport_ ? viewport_() : Viewport{};
    float slopCanvas = transformer_.scaleToCanvas(options_.doubleTapSlopDevice, viewport);
    return tap.canvas.distanceTo(lastTap_->canvas) <= slopCanvas;
}

void InputNormalizer::reset() {
    press_.reset();
    lastTap_.reset();
    transformer_.reset();
}

}  // namespace blockshift
