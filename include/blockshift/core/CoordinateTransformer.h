#pragma once

#include "Types.h"

#include <optional>

namespace blockshift {

/**
 * @brief Single conversion point between device (screen) and canvas space.
 *
 * Every device-to-canvas or canvas-to-device mapping in the engine goes
 * through this class; session geometry is stored in canvas space only.
 *
 * Degenerate viewports (zero, negative or non-finite scale, non-finite pan)
 * do not produce NaN/Infinity:
 * - screenToCanvas() returns the last known-good canvas point
 * - canvasToScreen() maps through the last known-good viewport
 *
 * Both cases set lastConversionFailed() and log a warning.
 */
class CoordinateTransformer {
public:
    CoordinateTransformer() = default;

    /// Map a device point to canvas space
    Point screenToCanvas(const Point& screen, const Viewport& viewport);

    /// Map a canvas point to device space (exact inverse of screenToCanvas)
    Point canvasToScreen(const Point& canvas, const Viewport& viewport);

    /// Convert a device-space length to canvas units
    float scaleToCanvas(float screenLength, const Viewport& viewport);

    /// Convert a canvas-space length to device units
    float scaleToScreen(float canvasLength, const Viewport& viewport);

    /// Map a canvas rect to device space
    Rect canvasToScreen(const Rect& canvas, const Viewport& viewport);

    /// True if the most recent conversion fell back due to a degenerate viewport
    bool lastConversionFailed() const { return lastFailed_; }

    /// Number of degraded conversions since construction or reset()
    int failureCount() const { return failureCount_; }

    const std::optional<Point>& lastGoodCanvasPoint() const { return lastGoodCanvas_; }

    /// Forget cached fallbacks
    void reset();

    /// Set the point screenToCanvas() falls back to until a valid conversion replaces it
    void seedCanvasPoint(const Point& canvas) { lastGoodCanvas_ = canvas; }

private:
    /// Returns the viewport to use, or nullopt if none is usable
    std::optional<Viewport> resolve(const Viewport& viewport);

    std::optional<Viewport> lastGoodViewport_;
    std::optional<Point> lastGoodCanvas_;
    bool lastFailed_ = false;
    int failureCount_ = 0;
};

}  // namespace blockshift
