#include <gtest/gtest.h>
#include <blockshift/blockshift.h>

#include "infrastructure/FakeHost.h"

#include <algorithm>
#include <memory>
#include <tuple>
#include <vector>

using namespace blockshift;
using std::chrono::milliseconds;

/// End-to-end move flows through a FakeHost workspace
class MoveScenarioTest : public ::testing::Test {
protected:
    void TearDown() override {
        controller_.reset();
    }

    MoveModeController& controller() {
        if (!controller_) {
            controller_ = std::make_unique<MoveModeController>(host_.capabilities(), MoveOptions{},
                                                               clock_.fn());
        }
        return *controller_;
    }

    static std::vector<std::pair<ConnectionId, ConnectionId>> pairsOf(
        const std::vector<ConnectionCandidate>& candidates) {
        std::vector<std::pair<ConnectionId, ConnectionId>> pairs;
        for (const auto& c : candidates) {
            pairs.emplace_back(c.local, c.neighbour);
        }
        std::sort(pairs.begin(), pairs.end());
        return pairs;
    }

    static std::vector<std::pair<ConnectionId, ConnectionId>> pairsOf(
        const std::vector<ConnectionLink>& links) {
        std::vector<std::pair<ConnectionId, ConnectionId>> pairs;
        for (const auto& link : links) {
            pairs.emplace_back(link.local, link.peer);
        }
        std::sort(pairs.begin(), pairs.end());
        return pairs;
    }

    test::FakeHost host_;
    test::FakeClock clock_;
    std::unique_ptr<MoveModeController> controller_;
};

TEST_F(MoveScenarioTest, PointerMoveSnapsAndEnterConnects) {
    NodeId a = host_.addNode({100.0f, 100.0f});
    ConnectionId aNext = host_.addConnection(a, ConnectionType::Next, {0.0f, 0.0f});
    NodeId b = host_.addNode({100.0f, 200.0f});
    ConnectionId bPrev = host_.addConnection(b, ConnectionType::Previous, {0.0f, -10.0f});

    ASSERT_TRUE(controller().startSession(a, {100.0f, 100.0f}, Modality::Pointer));
    controller().updateSession({100.0f, 195.0f});

    const auto& candidate = controller().currentCandidate();
    ASSERT_TRUE(candidate.has_value());
    EXPECT_EQ(candidate->local, aNext);
    EXPECT_EQ(candidate->neighbour, bPrev);
    EXPECT_LE(candidate->distance, 10.0f);

    EXPECT_TRUE(controller().handleKey(MoveKey::Enter));

    EXPECT_TRUE(host_.isLinked(aNext, bPrev));
    EXPECT_EQ(host_.position(a), (Point{100.0f, 190.0f}));
    EXPECT_TRUE(host_.markers().empty());
    EXPECT_EQ(controller().state(), SessionState::Inactive);
}

TEST_F(MoveScenarioTest, EscapeRestoresSnapshotExactly) {
    NodeId a = host_.addNode({100.0f, 100.0f});
    ConnectionId aNext = host_.addConnection(a, ConnectionType::Next, {0.0f, 40.0f});
    NodeId b = host_.addNode({100.0f, 140.0f});
    ConnectionId bPrev = host_.addConnection(b, ConnectionType::Previous, {0.0f, 0.0f});
    ConnectionId bNext = host_.addConnection(b, ConnectionType::Next, {0.0f, 40.0f});
    NodeId c = host_.addNode({100.0f, 180.0f});
    ConnectionId cPrev = host_.addConnection(c, ConnectionType::Previous, {0.0f, 0.0f});
    host_.link(aNext, bPrev);
    host_.link(bNext, cPrev);

    for (Modality modality : {Modality::Pointer, Modality::Touch, Modality::Keyboard}) {
        SCOPED_TRACE(modalityName(modality));
        Point before = host_.position(b);
        auto linksBefore = host_.links(b);

        ASSERT_TRUE(controller().startSession(b, {120.0f, 150.0f}, modality));
        controller().handleKey(MoveKey::Escape);

        EXPECT_EQ(host_.position(b), before);
        EXPECT_EQ(host_.links(b), linksBefore);
        EXPECT_TRUE(host_.isLinked(aNext, bPrev));
        EXPECT_TRUE(host_.isLinked(bNext, cPrev));
        EXPECT_TRUE(host_.markers().empty());
        EXPECT_FALSE(host_.inputDeferred);
    }
}

TEST_F(MoveScenarioTest, ReleaseAwayFromConnectionsDropsFree) {
    NodeId a = host_.addNode({100.0f, 100.0f});
    host_.addConnection(a, ConnectionType::Next, {0.0f, 40.0f});
    NodeId b = host_.addNode({400.0f, 400.0f});
    host_.addConnection(b, ConnectionType::Previous, {0.0f, 0.0f});

    ASSERT_TRUE(controller().startSession(b, {400.0f, 400.0f}, Modality::Pointer));
    controller().updateSession({600.0f, 500.0f});
    clock_.advance(milliseconds(30));
    controller().updateSession({650.0f, 520.0f});
    controller().releaseAt({650.0f, 520.0f});

    EXPECT_EQ(host_.position(b), (Point{650.0f, 520.0f}));
    EXPECT_TRUE(host_.links(b).empty());
    EXPECT_TRUE(host_.markers().empty());
    EXPECT_NE(controller().lastError().error, MoveError::CommitConflict);
}

TEST_F(MoveScenarioTest, CancelThenCommit_SecondCallHasNoEffect) {
    NodeId a = host_.addNode({100.0f, 100.0f});
    ConnectionId aNext = host_.addConnection(a, ConnectionType::Next, {0.0f, 40.0f});
    NodeId b = host_.addNode({100.0f, 140.0f});
    ConnectionId bPrev = host_.addConnection(b, ConnectionType::Previous, {0.0f, 0.0f});
    host_.link(aNext, bPrev);

    controller().startSession(b, {100.0f, 140.0f}, Modality::Pointer);
    controller().updateSession({300.0f, 300.0f});
    EXPECT_TRUE(controller().cancelSession());
    size_t moves = host_.moveCalls.size();
    size_t connects = host_.connectCalls.size();

    EXPECT_FALSE(controller().commitSession());
    EXPECT_FALSE(controller().cancelSession());

    EXPECT_EQ(host_.moveCalls.size(), moves);
    EXPECT_EQ(host_.connectCalls.size(), connects);
    EXPECT_TRUE(host_.isLinked(aNext, bPrev));
}

TEST_F(MoveScenarioTest, HighlightsSettleToFinderOutput) {
    // Column of stacks the moved node passes over
    for (int i = 0; i < 4; ++i) {
        NodeId top = host_.addNode({static_cast<float>(i) * 150.0f, 0.0f});
        ConnectionId topNext = host_.addConnection(top, ConnectionType::Next, {0.0f, 40.0f});
        NodeId bottom = host_.addNode({static_cast<float>(i) * 150.0f, 40.0f});
        ConnectionId bottomPrev = host_.addConnection(bottom, ConnectionType::Previous, {0.0f, 0.0f});
        host_.addConnection(bottom, ConnectionType::Next, {0.0f, 40.0f});
        host_.link(topNext, bottomPrev);
    }
    NodeId moving = host_.addNode({0.0f, 400.0f});
    host_.addConnection(moving, ConnectionType::Previous, {0.0f, 0.0f});
    host_.addConnection(moving, ConnectionType::Next, {0.0f, 40.0f});

    ASSERT_TRUE(controller().startSession(moving, {0.0f, 400.0f}, Modality::Pointer));
    for (int step = 0; step < 40; ++step) {
        clock_.advance(milliseconds(3));
        controller().updateSession({static_cast<float>(step) * 12.0f, 400.0f - step * 8.0f});
        controller().tick();
    }
    clock_.advance(milliseconds(20));
    controller().tick();

    Point finalPosition{39.0f * 12.0f, 400.0f - 39.0f * 8.0f};
    EXPECT_EQ(host_.position(moving), finalPosition);

    std::vector<NodeData> others;
    for (NodeId id : host_.listNodes()) {
        if (id != moving) {
            others.push_back(*host_.getNode(id));
        }
    }
    ConnectionCandidateFinder finder;
    auto locals = ConnectionCandidateFinder::localConnectionsOf(*host_.getNode(moving));
    auto neighbours = ConnectionCandidateFinder::neighbourConnectionsOf(others, moving);
    auto expected = finder.highlightSet(locals, neighbours, finalPosition, 50);
    auto best = finder.findBest(locals, neighbours, finalPosition, 28.0f);

    EXPECT_EQ(pairsOf(controller().session().highlighted), pairsOf(expected));
    EXPECT_EQ(pairsOf(controller().overlay().renderedKeys()), pairsOf(expected));
    ASSERT_EQ(controller().currentCandidate().has_value(), best.has_value());
    if (best) {
        EXPECT_TRUE(controller().currentCandidate()->samePair(*best));
    }
    EXPECT_EQ(host_.duplicateAdds, 0);
    EXPECT_EQ(host_.strayOperations, 0);
    EXPECT_EQ(controller().watchdogFireCount(), 0);
}

TEST_F(MoveScenarioTest, ThreeCandidatesCycleBackToStart) {
    NodeId moving = host_.addNode({0.0f, 0.0f});
    host_.addConnection(moving, ConnectionType::Next, {0.0f, 40.0f});
    for (Point anchor : {Point{60.0f, 40.0f}, Point{0.0f, 70.0f}, Point{-90.0f, 40.0f}}) {
        NodeId n = host_.addNode(anchor);
        host_.addConnection(n, ConnectionType::Previous, {0.0f, 0.0f});
    }

    ASSERT_TRUE(controller().startSession(moving, {}, Modality::Keyboard));
    controller().handleKey(MoveKey::Down);
    ASSERT_TRUE(controller().currentCandidate().has_value());
    ConnectionCandidate first = *controller().currentCandidate();
    Point firstPosition = host_.position(moving);

    std::vector<ConnectionId> visited;
    for (int i = 0; i < 3; ++i) {
        controller().handleKey(MoveKey::Down);
        visited.push_back(controller().currentCandidate()->neighbour);
    }

    EXPECT_TRUE(controller().currentCandidate()->samePair(first));
    EXPECT_EQ(host_.position(moving), firstPosition);
    std::sort(visited.begin(), visited.end());
    EXPECT_EQ(std::unique(visited.begin(), visited.end()), visited.end());
    EXPECT_EQ(controller().keyboard().orderedList().size(), 3u);
}

TEST_F(MoveScenarioTest, ZoomedViewport_GrabOffsetPreserved) {
    host_.viewport = Viewport{{50.0f, -20.0f}, 2.0f};
    NodeId a = host_.addNode({100.0f, 100.0f});
    ConnectionId aNext = host_.addConnection(a, ConnectionType::Next, {0.0f, 40.0f});
    NodeId b = host_.addNode({300.0f, 300.0f});
    ConnectionId bPrev = host_.addConnection(b, ConnectionType::Previous, {0.0f, 0.0f});

    // Grab B 10 canvas units right of its origin
    Point grab{(300.0f + 10.0f) * 2.0f + 50.0f, 300.0f * 2.0f - 20.0f};
    ASSERT_TRUE(controller().startSession(b, grab, Modality::Touch));

    Point target{(103.0f + 10.0f) * 2.0f + 50.0f, 141.0f * 2.0f - 20.0f};
    controller().updateSession(target);
    EXPECT_EQ(host_.position(b), (Point{103.0f, 141.0f}));

    // Release exactly where the last update landed
    controller().releaseAt(target);
    EXPECT_TRUE(host_.isLinked(bPrev, aNext));
    EXPECT_EQ(host_.position(b), (Point{100.0f, 140.0f}));
}
