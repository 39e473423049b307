#include <gtest/gtest.h>

#include "util/gestureGeometry.h"

#include <cmath>

using namespace PageView;

TEST(TapRegion, BoundariesForThousandPixelViewport) {
    EXPECT_EQ(classifyTapRegion(199.f, 1000.f), TapRegion::LEFT);
    EXPECT_EQ(classifyTapRegion(200.f, 1000.f), TapRegion::CENTER);
    EXPECT_EQ(classifyTapRegion(500.f, 1000.f), TapRegion::CENTER);
    EXPECT_EQ(classifyTapRegion(800.f, 1000.f), TapRegion::CENTER);
    EXPECT_EQ(classifyTapRegion(801.f, 1000.f), TapRegion::RIGHT);
}

TEST(TapRegion, PointsOutsideViewport) {
    EXPECT_EQ(classifyTapRegion(-5.f, 1000.f), TapRegion::LEFT);
    EXPECT_EQ(classifyTapRegion(1200.f, 1000.f), TapRegion::RIGHT);
}

TEST(TapRegion, NavigationDeltaFollowsReadingDirection) {
    EXPECT_EQ(navigationDelta(TapRegion::LEFT, ReadingDirection::LEFT_TO_RIGHT), -1);
    EXPECT_EQ(navigationDelta(TapRegion::RIGHT, ReadingDirection::LEFT_TO_RIGHT), 1);
    EXPECT_EQ(navigationDelta(TapRegion::LEFT, ReadingDirection::RIGHT_TO_LEFT), 1);
    EXPECT_EQ(navigationDelta(TapRegion::RIGHT, ReadingDirection::RIGHT_TO_LEFT), -1);
    EXPECT_EQ(navigationDelta(TapRegion::CENTER, ReadingDirection::LEFT_TO_RIGHT), 0);
    EXPECT_EQ(navigationDelta(TapRegion::CENTER, ReadingDirection::RIGHT_TO_LEFT), 0);
}

TEST(ScaleAnchor, VerticalReadingAlwaysCentered) {
    const ScreenPos points[] = { {0.f, 0.f}, {390.f, 10.f}, {-50.f, 2000.f}, {100.f, 700.f} };
    for (const auto& point : points) {
        glm::vec2 anchor = resolveScaleAnchor(point, ReadingDirection::VERTICAL, 400.f, 800.f);
        EXPECT_FLOAT_EQ(anchor.x, 0.5f);
        EXPECT_FLOAT_EQ(anchor.y, 0.5f);
    }
}

TEST(ScaleAnchor, NormalizedTouchPoint) {
    glm::vec2 anchor = resolveScaleAnchor({100.f, 600.f}, ReadingDirection::LEFT_TO_RIGHT, 400.f, 800.f);
    EXPECT_FLOAT_EQ(anchor.x, 0.25f);
    EXPECT_FLOAT_EQ(anchor.y, 0.75f);

    anchor = resolveScaleAnchor({300.f, 200.f}, ReadingDirection::RIGHT_TO_LEFT, 400.f, 800.f);
    EXPECT_FLOAT_EQ(anchor.x, 0.75f);
    EXPECT_FLOAT_EQ(anchor.y, 0.25f);
}

TEST(ScaleAnchor, ClampsPointsOutsideViewport) {
    glm::vec2 anchor = resolveScaleAnchor({-20.f, 900.f}, ReadingDirection::LEFT_TO_RIGHT, 400.f, 800.f);
    EXPECT_FLOAT_EQ(anchor.x, 0.f);
    EXPECT_FLOAT_EQ(anchor.y, 1.f);
}

TEST(ScaleAnchor, EmptyViewportFallsBackToCenter) {
    glm::vec2 anchor = resolveScaleAnchor({20.f, 30.f}, ReadingDirection::LEFT_TO_RIGHT, 0.f, 0.f);
    EXPECT_FLOAT_EQ(anchor.x, 0.5f);
    EXPECT_FLOAT_EQ(anchor.y, 0.5f);
}

TEST(ClampScale, LimitsToOneAndMaximum) {
    EXPECT_FLOAT_EQ(clampScale(0.4f, 3.f), 1.f);
    EXPECT_FLOAT_EQ(clampScale(2.5f, 3.f), 2.5f);
    EXPECT_FLOAT_EQ(clampScale(7.f, 3.f), 3.f);
}

TEST(ClampScale, NanFallsBackToOne) {
    EXPECT_FLOAT_EQ(clampScale(std::nanf(""), 3.f), 1.f);
    EXPECT_FLOAT_EQ(clampScale(INFINITY, 3.f), 3.f);
}

TEST(ConstrainOffset, WithinBoundsForScaleRange) {
    const float width = 400.f;
    const float height = 800.f;
    const glm::vec2 candidates[] = {
        {0.f, 0.f}, {1000.f, -1000.f}, {-37.f, 12.f}, {150.f, 390.f}, {-5000.f, 5000.f},
    };

    for (float scale = 1.f; scale <= 4.f; scale += 0.25f) {
        float maxX = width * (scale - 1.f) / 2.f;
        float maxY = height * (scale - 1.f) / 2.f;
        for (const auto& candidate : candidates) {
            glm::vec2 result = constrainOffset(candidate, scale, width, height);
            EXPECT_LE(std::abs(result.x), maxX);
            EXPECT_LE(std::abs(result.y), maxY);
        }
    }
}

TEST(ConstrainOffset, KeepsOffsetsAlreadyInBounds) {
    glm::vec2 result = constrainOffset({-37.f, 12.f}, 2.f, 400.f, 800.f);
    EXPECT_FLOAT_EQ(result.x, -37.f);
    EXPECT_FLOAT_EQ(result.y, 12.f);
}

TEST(ConstrainOffset, ClampsToEdges) {
    glm::vec2 result = constrainOffset({1000.f, -1000.f}, 2.f, 400.f, 800.f);
    EXPECT_FLOAT_EQ(result.x, 200.f);
    EXPECT_FLOAT_EQ(result.y, -400.f);
}

TEST(ConstrainOffset, Idempotent) {
    const glm::vec2 candidates[] = { {1000.f, -1000.f}, {-37.f, 12.f}, {-250.f, 0.f} };
    for (const auto& candidate : candidates) {
        glm::vec2 once = constrainOffset(candidate, 1.75f, 400.f, 800.f);
        glm::vec2 twice = constrainOffset(once, 1.75f, 400.f, 800.f);
        EXPECT_FLOAT_EQ(once.x, twice.x);
        EXPECT_FLOAT_EQ(once.y, twice.y);
    }
}

TEST(ConstrainOffset, ZeroAtScaleOne) {
    const glm::vec2 candidates[] = { {1000.f, -1000.f}, {-37.f, 12.f}, {0.f, 0.f} };
    for (const auto& candidate : candidates) {
        glm::vec2 result = constrainOffset(candidate, 1.f, 400.f, 800.f);
        EXPECT_EQ(result.x, 0.f);
        EXPECT_EQ(result.y, 0.f);
    }
}

TEST(ConstrainOffset, NanComponentsBecomeZero) {
    glm::vec2 result = constrainOffset({std::nanf(""), 1000.f}, 2.f, 400.f, 800.f);
    EXPECT_EQ(result.x, 0.f);
    EXPECT_FLOAT_EQ(result.y, 400.f);

    result = constrainOffset({-50.f, std::nanf("")}, 2.f, 400.f, 800.f);
    EXPECT_FLOAT_EQ(result.x, -50.f);
    EXPECT_EQ(result.y, 0.f);
}

TEST(ConstrainOffset, NanScaleActsAsUnscaled) {
    glm::vec2 result = constrainOffset({120.f, -80.f}, std::nanf(""), 400.f, 800.f);
    EXPECT_EQ(result.x, 0.f);
    EXPECT_EQ(result.y, 0.f);
}

TEST(GestureGeometry, ReadingDirectionNames) {
    EXPECT_STREQ(toString(ReadingDirection::LEFT_TO_RIGHT), "leftToRight");
    EXPECT_STREQ(toString(ReadingDirection::RIGHT_TO_LEFT), "rightToLeft");
    EXPECT_STREQ(toString(ReadingDirection::VERTICAL), "vertical");
    EXPECT_STREQ(toString(TapRegion::CENTER), "center");
}
