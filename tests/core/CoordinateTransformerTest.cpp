#include <gtest/gtest.h>
#include <blockshift/core/CoordinateTransformer.h>

#include <cmath>
#include <limits>

using namespace blockshift;

class CoordinateTransformerTest : public ::testing::Test {
protected:
    CoordinateTransformer transformer_;
    Viewport viewport_{{40.0f, -25.0f}, 2.0f};
};

TEST_F(CoordinateTransformerTest, ScreenToCanvas_AppliesPanAndScale) {
    Point canvas = transformer_.screenToCanvas({240.0f, 175.0f}, viewport_);

    EXPECT_FLOAT_EQ(canvas.x, 100.0f);
    EXPECT_FLOAT_EQ(canvas.y, 100.0f);
    EXPECT_FALSE(transformer_.lastConversionFailed());
}

TEST_F(CoordinateTransformerTest, CanvasToScreen_IsInverse) {
    Point screen = transformer_.canvasToScreen(Point{100.0f, 100.0f}, viewport_);

    EXPECT_FLOAT_EQ(screen.x, 240.0f);
    EXPECT_FLOAT_EQ(screen.y, 175.0f);
}

TEST_F(CoordinateTransformerTest, RoundTrip_IdentityWithinTolerance) {
    const Viewport viewports[] = {
        {{0.0f, 0.0f}, 1.0f},
        {{-312.5f, 87.25f}, 0.35f},
        {{1024.0f, -768.0f}, 3.75f},
    };
    const Point points[] = {{0.0f, 0.0f}, {13.5f, -7.25f}, {-4200.0f, 9100.0f}};

    for (const auto& v : viewports) {
        for (const auto& p : points) {
            Point back = transformer_.screenToCanvas(transformer_.canvasToScreen(p, v), v);
            EXPECT_NEAR(back.x, p.x, 1e-2f);
            EXPECT_NEAR(back.y, p.y, 1e-2f);
        }
    }
    EXPECT_EQ(transformer_.failureCount(), 0);
}

TEST_F(CoordinateTransformerTest, ScaleConversions) {
    EXPECT_FLOAT_EQ(transformer_.scaleToCanvas(10.0f, viewport_), 5.0f);
    EXPECT_FLOAT_EQ(transformer_.scaleToScreen(10.0f, viewport_), 20.0f);
}

TEST_F(CoordinateTransformerTest, RectToScreen_ScalesSize) {
    Rect screen = transformer_.canvasToScreen(Rect{10.0f, 20.0f, 30.0f, 40.0f}, viewport_);

    EXPECT_FLOAT_EQ(screen.x, 60.0f);
    EXPECT_FLOAT_EQ(screen.y, 15.0f);
    EXPECT_FLOAT_EQ(screen.width, 60.0f);
    EXPECT_FLOAT_EQ(screen.height, 80.0f);
}

TEST_F(CoordinateTransformerTest, ZeroScale_ReturnsLastKnownGoodPoint) {
    Point good = transformer_.screenToCanvas({240.0f, 175.0f}, viewport_);

    Point degraded = transformer_.screenToCanvas({500.0f, 500.0f}, Viewport{{0.0f, 0.0f}, 0.0f});

    EXPECT_TRUE(transformer_.lastConversionFailed());
    EXPECT_EQ(transformer_.failureCount(), 1);
    EXPECT_EQ(degraded, good);
    EXPECT_TRUE(degraded.isFinite());
}

TEST_F(CoordinateTransformerTest, DegenerateViewportWithoutHistory_ReturnsOrigin) {
    float nan = std::numeric_limits<float>::quiet_NaN();

    Point degraded = transformer_.screenToCanvas({10.0f, 10.0f}, Viewport{{nan, 0.0f}, 1.0f});

    EXPECT_TRUE(transformer_.lastConversionFailed());
    EXPECT_EQ(degraded, (Point{0.0f, 0.0f}));
}

TEST_F(CoordinateTransformerTest, NegativeAndInfiniteScale_AreRejected) {
    transformer_.screenToCanvas({240.0f, 175.0f}, viewport_);

    transformer_.screenToCanvas({1.0f, 1.0f}, Viewport{{0.0f, 0.0f}, -1.0f});
    EXPECT_TRUE(transformer_.lastConversionFailed());

    float inf = std::numeric_limits<float>::infinity();
    Point p = transformer_.screenToCanvas({1.0f, 1.0f}, Viewport{{0.0f, 0.0f}, inf});
    EXPECT_TRUE(transformer_.lastConversionFailed());
    EXPECT_TRUE(p.isFinite());
    EXPECT_EQ(transformer_.failureCount(), 2);
}

TEST_F(CoordinateTransformerTest, CanvasToScreen_DegenerateUsesLastGoodViewport) {
    transformer_.canvasToScreen(Point{0.0f, 0.0f}, viewport_);

    Point screen = transformer_.canvasToScreen(Point{100.0f, 100.0f}, Viewport{{0.0f, 0.0f}, 0.0f});

    EXPECT_TRUE(transformer_.lastConversionFailed());
    EXPECT_FLOAT_EQ(screen.x, 240.0f);
    EXPECT_FLOAT_EQ(screen.y, 175.0f);
}

TEST_F(CoordinateTransformerTest, CanvasToScreen_DegenerateWithoutHistoryIsIdentity) {
    Point screen = transformer_.canvasToScreen(Point{12.0f, 34.0f}, Viewport{{0.0f, 0.0f}, 0.0f});

    EXPECT_EQ(screen, (Point{12.0f, 34.0f}));
}

TEST_F(CoordinateTransformerTest, RecoversAfterValidViewport) {
    transformer_.screenToCanvas({0.0f, 0.0f}, Viewport{{0.0f, 0.0f}, 0.0f});
    ASSERT_TRUE(transformer_.lastConversionFailed());

    transformer_.screenToCanvas({240.0f, 175.0f}, viewport_);
    EXPECT_FALSE(transformer_.lastConversionFailed());
}

TEST_F(CoordinateTransformerTest, Reset_ForgetsFallbacks) {
    transformer_.screenToCanvas({240.0f, 175.0f}, viewport_);
    transformer_.screenToCanvas({0.0f, 0.0f}, Viewport{{0.0f, 0.0f}, 0.0f});

    transformer_.reset();

    EXPECT_EQ(transformer_.failureCount(), 0);
    EXPECT_FALSE(transformer_.lastGoodCanvasPoint().has_value());
    EXPECT_FALSE(transformer_.lastConversionFailed());
}
