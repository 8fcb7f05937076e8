#include "blockshift/move/KeyboardDragStrategy.h"
#include "blockshift/common/Logger.h"

#include <utility>

namespace blockshift {

KeyboardDragStrategy::KeyboardDragStrategy(ConnectionCandidateFinder finder, MoveOptions options)
    : finder_(std::move(finder))
    , options_(options) {
}

void KeyboardDragStrategy::begin(const Point& position,
                                 const std::optional<ConnectionCandidate>& initial) {
    position_ = position;
    ordered_.clear();
    current_ = initial;
    stale_ = true;
}

std::optional<ConnectionCandidate> KeyboardDragStrategy::cycle(
    int step,
    const std::vector<LocalConnection>& locals,
    const std::vector<NeighbourConnection>& neighbours) {

    if (stale_) {
        ordered_ = finder_.orderedCandidates(locals, neighbours, position_, options_.maxCandidates);
        stale_ = false;
        LOG_DEBUG("[KeyboardDragStrategy] rebuilt ordered list: {} candidates", ordered_.size());
    }

    if (ordered_.empty()) {
        current_.reset();
        return std::nullopt;
    }

    int index = current_ ? ConnectionCandidateFinder::indexOf(ordered_, *current_) : -1;
    if (index < 0) {
        // Nearest first; ties resolved by the finder's rank order
        size_t nearest = 0;
        for (size_t i = 1; i < ordered_.size(); ++i) {
            if (ConnectionCandidateFinder::ranksBefore(ordered_[i], ordered_[nearest])) {
                nearest = i;
            }
        }
        current_ = ordered_[nearest];
        return current_;
    }

    int next = ConnectionCandidateFinder::cycleIndex(index, step, static_cast<int>(ordered_.size()));
    current_ = ordered_[static_cast<size_t>(next)];
    return current_;
}

Point KeyboardDragStrategy::step(Direction direction, const Point& from) {
    position_ = from + directionVector(direction) * options_.stepDistance;
    current_.reset();
    stale_ = true;
    return position_;
}

void KeyboardDragStrategy::reset() {
    position_ = {};
    ordered_.clear();
    current_.reset();
    stale_ = true;
}

int KeyboardDragStrategy::cycleStep(Direction direction) {
    switch (direction) {
        case Direction::Down:
        case Direction::Right:
            return 1;
        case Direction::Up:
        case Direction::Left:
            return -1;
    }
    return 1;
}

Point KeyboardDragStrategy::directionVector(Direction direction) {
    switch (direction) {
        case Direction::Up: return {0.0f, -1.0f};
        case Direction::Down: return {0.0f, 1.0f};
        case Direction::Left: return {-1.0f, 0.0f};
        case Direction::Right: return {1.0f, 0.0f};
    }
    return {0.0f, 0.0f};
}

}  // namespace blockshift
