#include "blockshift/move/ConnectionHighlightOverlay.h"
#include "blockshift/common/Logger.h"

#include <exception>
#include <utility>

namespace blockshift {

ConnectionHighlightOverlay::ConnectionHighlightOverlay(HighlightSurface surface, MoveOptions options)
    : surface_(std::move(surface))
    , options_(options) {
}

ConnectionHighlightOverlay::~ConnectionHighlightOverlay() {
    dispose();
}

ConnectionHighlightOverlay::RenderedMarker ConnectionHighlightOverlay::makeMarker(
    const ConnectionCandidate& candidate, bool emphasized) const {

    bool statement = isStatementConnection(candidate.neighbourType);

    RenderedMarker marker;
    marker.key = candidate.link();
    marker.neighbourNode = candidate.neighbourNode;
    marker.shape = statement ? MarkerShape::StatementNotch : MarkerShape::ValueOutline;
    marker.canvasBounds = Rect::centeredOn(candidate.neighbourAnchor, options_.markerSize(statement));
    marker.emphasized = emphasized;
    return marker;
}

HighlightMarker ConnectionHighlightOverlay::project(const RenderedMarker& marker,
                                                    const Viewport& viewport) {
    HighlightMarker out;
    out.key = marker.key;
    out.neighbourNode = marker.neighbourNode;
    out.shape = marker.shape;
    out.canvasBounds = marker.canvasBounds;
    out.screenBounds = transformer_.canvasToScreen(marker.canvasBounds, viewport);
    out.emphasized = marker.emphasized;
    return out;
}

void ConnectionHighlightOverlay::emitAdd(const RenderedMarker& marker, const Viewport& viewport) {
    ++totalAdds_;
    if (surface_.addMarker) {
        surface_.addMarker(project(marker, viewport));
    }
}

void ConnectionHighlightOverlay::emitUpdate(const RenderedMarker& marker, const Viewport& viewport) {
    ++totalUpdates_;
    if (surface_.updateMarker) {
        surface_.updateMarker(project(marker, viewport));
    }
}

void ConnectionHighlightOverlay::emitRemove(const ConnectionLink& key) {
    ++totalRemoves_;
    if (surface_.removeMarker) {
        surface_.removeMarker(key);
    }
}

OverlayDiff ConnectionHighlightOverlay::setCandidates(
    const std::vector<ConnectionCandidate>& candidates,
    const std::optional<ConnectionCandidate>& emphasized,
    const Viewport& viewport) {

    OverlayDiff diff;
    if (disposed_) {
        LOG_WARN("[ConnectionHighlightOverlay] setCandidates after dispose ignored");
        return diff;
    }

    // Build the target set, dropping duplicate pairs
    std::vector<RenderedMarker> next;
    std::unordered_map<uint64_t, size_t> nextIndex;
    next.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        uint64_t key = keyOf(candidate.link());
        if (nextIndex.count(key)) {
            continue;
        }
        bool isEmphasized = emphasized && emphasized->samePair(candidate);
        nextIndex.emplace(key, next.size());
        next.push_back(makeMarker(candidate, isEmphasized));
    }

    std::unordered_map<uint64_t, size_t> currentIndex;
    for (size_t i = 0; i < markers_.size(); ++i) {
        currentIndex.emplace(keyOf(markers_[i].key), i);
    }

    for (const auto& marker : markers_) {
        if (!nextIndex.count(keyOf(marker.key))) {
            diff.removed.push_back(marker.key);
        }
    }

    std::vector<size_t> toUpdate;
    std::vector<size_t> toAdd;
    for (size_t i = 0; i < next.size(); ++i) {
        const auto& marker = next[i];
        auto it = currentIndex.find(keyOf(marker.key));
        if (it == currentIndex.end()) {
            diff.added.push_back(marker.key);
            toAdd.push_back(i);
            continue;
        }
        const auto& previous = markers_[it->second];
        if (previous.emphasized != marker.emphasized ||
            previous.canvasBounds != marker.canvasBounds ||
            previous.shape != marker.shape) {
            diff.updated.push_back(marker.key);
            toUpdate.push_back(i);
        } else {
            diff.unchanged.push_back(marker.key);
        }
    }

    // State is committed before the surface is touched
    markers_ = std::move(next);
    registered_ = !markers_.empty();

    for (const auto& key : diff.removed) {
        emitRemove(key);
    }
    for (size_t index : toUpdate) {
        emitUpdate(markers_[index], viewport);
    }
    for (size_t index : toAdd) {
        emitAdd(markers_[index], viewport);
    }

    if (diff.hasChanges()) {
        LOG_DEBUG("[ConnectionHighlightOverlay] +{} ~{} -{} ={}",
                  diff.added.size(), diff.updated.size(), diff.removed.size(),
                  diff.unchanged.size());
    }
    return diff;
}

OverlayDiff ConnectionHighlightOverlay::refreshViewport(const Viewport& viewport) {
    OverlayDiff diff;
    if (disposed_ || !registered_) {
        return diff;
    }
    for (const auto& marker : markers_) {
        diff.updated.push_back(marker.key);
        emitUpdate(marker, viewport);
    }
    return diff;
}

std::optional<ConnectionLink> ConnectionHighlightOverlay::hitTest(const Point& screenPoint,
                                                                  const Viewport& viewport) {
    if (markers_.empty()) {
        return std::nullopt;
    }

    Point canvas = transformer_.screenToCanvas(screenPoint, viewport);
    if (transformer_.lastConversionFailed()) {
        return std::nullopt;
    }

    std::optional<ConnectionLink> hit;
    float bestDistance = 0.0f;
    for (const auto& marker : markers_) {
        if (!marker.canvasBounds.expanded(options_.markerHitPadding).contains(canvas)) {
            continue;
        }
        if (marker.emphasized) {
            return marker.key;
        }
        float distance = marker.canvasBounds.center().distanceTo(canvas);
        if (!hit || distance < bestDistance) {
            hit = marker.key;
            bestDistance = distance;
        }
    }
    return hit;
}

void ConnectionHighlightOverlay::clear() {
    std::vector<RenderedMarker> removed;
    removed.swap(markers_);
    registered_ = false;

    for (const auto& marker : removed) {
        try {
            emitRemove(marker.key);
        } catch (const std::exception& e) {
            LOG_ERROR("[ConnectionHighlightOverlay] removeMarker failed: {}", e.what());
        }
    }
}

void ConnectionHighlightOverlay::dispose() {
    clear();
    if (!disposed_) {
        disposed_ = true;
        LOG_DEBUG("[ConnectionHighlightOverlay] disposed");
    }
}

bool ConnectionHighlightOverlay::contains(const ConnectionLink& key) const {
    for (const auto& marker : markers_) {
        if (marker.key == key) {
            return true;
        }
    }
    return false;
}

std::optional<bool> ConnectionHighlightOverlay::isEmphasized(const ConnectionLink& key) const {
    for (const auto& marker : markers_) {
        if (marker.key == key) {
            return marker.emphasized;
        }
    }
    return std::nullopt;
}

std::vector<ConnectionLink> ConnectionHighlightOverlay::renderedKeys() const {
    std::vector<ConnectionLink> keys;
    keys.reserve(markers_.size());
    for (const auto& marker : markers_) {
        keys.push_back(marker.key);
    }
    return keys;
}

}  // namespace blockshift
