#pragma once

#include "glm/vec2.hpp"

namespace PageView {

// Screen position for touch coordinates
struct ScreenPos {
    float x;
    float y;

    ScreenPos() : x(0.f), y(0.f) {}
    ScreenPos(float _x, float _y) : x(_x), y(_y) {}
};

enum class ReadingDirection {
    LEFT_TO_RIGHT = 0,
    RIGHT_TO_LEFT = 1,
    VERTICAL = 2,
};

// Reader settings supplied by the host application
struct ReaderSettings {
    ReadingDirection readingDirection = ReadingDirection::LEFT_TO_RIGHT;
    float doubleTapScaleFactor = 2.f;
    float maximumScaleFactor = 3.f;
};

// Transform applied by the rendering layer to the page image.
// scaleAnchor is normalized to [0,1] x [0,1].
struct TransformState {
    float scale = 1.f;
    glm::vec2 offset = glm::vec2(0.f, 0.f);
    glm::vec2 scaleAnchor = glm::vec2(0.5f, 0.5f);
};

enum class Easing {
    NONE = 0,
    EASE_IN_OUT = 1,
    EASE_OUT = 2,
};

// How the rendering layer should move to a newly published transform
struct Transition {
    float duration; // seconds
    Easing easing;

    static Transition immediate() { return { 0.f, Easing::NONE }; }
    bool isAnimated() const { return duration > 0.f; }
};

// Viewport size provider, queried on every gesture
class ViewportMetrics {
public:
    virtual ~ViewportMetrics() = default;

    virtual float getWidth() const = 0;
    virtual float getHeight() const = 0;
};

// Navigation and panel actions triggered by gestures
class ReaderActionListener {
public:
    virtual ~ReaderActionListener() = default;

    // Move by delta pages (+1 next, -1 previous)
    virtual void navigate(int delta) = 0;

    virtual void togglePanel() = 0;

    virtual void dismissPanel() = 0;
};

// Called after every gesture that changed the published transform
class TransformListener {
public:
    virtual ~TransformListener() = default;

    virtual void onTransformChanged(const TransformState& state, const Transition& transition) = 0;
};

}
