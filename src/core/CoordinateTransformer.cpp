#include "blockshift/core/CoordinateTransformer.h"
#include "blockshift/common/Logger.h"

namespace blockshift {

std::optional<Viewport> CoordinateTransformer::resolve(const Viewport& viewport) {
    if (viewport.isValid()) {
        lastGoodViewport_ = viewport;
        lastFailed_ = false;
        return viewport;
    }

    lastFailed_ = true;
    ++failureCount_;
    LOG_WARN("[CoordinateTransformer] degenerate viewport scale={} pan=({},{}), using fallback",
             viewport.scale, viewport.pan.x, viewport.pan.y);
    return lastGoodViewport_;
}

Point CoordinateTransformer::screenToCanvas(const Point& screen, const Viewport& viewport) {
    auto usable = resolve(viewport);
    if (lastFailed_ || !usable) {
        // Keep the last point that was mapped through a valid viewport
        return lastGoodCanvas_.value_or(Point{0.0f, 0.0f});
    }

    Point canvas{
        (screen.x - usable->pan.x) / usable->scale,
        (screen.y - usable->pan.y) / usable->scale
    };
    if (!canvas.isFinite()) {
        lastFailed_ = true;
        ++failureCount_;
        LOG_WARN("[CoordinateTransformer] non-finite device point ({},{})", screen.x, screen.y);
        return lastGoodCanvas_.value_or(Point{0.0f, 0.0f});
    }
    lastGoodCanvas_ = canvas;
    return canvas;
}

Point CoordinateTransformer::canvasToScreen(const Point& canvas, const Viewport& viewport) {
    auto usable = resolve(viewport);
    if (!usable) {
        return canvas;
    }
    return {
        canvas.x * usable->scale + usable->pan.x,
        canvas.y * usable->scale + usable->pan.y
    };
}

float CoordinateTransformer::scaleToCanvas(float screenLength, const Viewport& viewport) {
    auto usable = resolve(viewport);
    return usable ? screenLength / usable->scale : screenLength;
}

float CoordinateTransformer::scaleToScreen(float canvasLength, const Viewport& viewport) {
    auto usable = resolve(viewport);
    return usable ? canvasLength * usable->scale : canvasLength;
}

Rect CoordinateTransformer::canvasToScreen(const Rect& canvas, const Viewport& viewport) {
    Point topLeft = canvasToScreen(canvas.position(), viewport);
    float width = scaleToScreen(canvas.width, viewport);
    float height = scaleToScreen(canvas.height, viewport);
    return {topLeft.x, topLeft.y, width, height};
}

void CoordinateTransformer::reset() {
    lastGoodViewport_.reset();
    lastGoodCanvas_.reset();
    lastFailed_ = false;
    failureCount_ = 0;
}

}  // namespace blockshift
