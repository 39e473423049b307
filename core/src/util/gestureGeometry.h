#pragma once

#include "util/gestureListener.h"
#include "glm/vec2.hpp"

namespace PageView {

// Horizontal tap zones of the page surface
enum class TapRegion {
    LEFT = 0,
    CENTER = 1,
    RIGHT = 2,
};

const char* toString(TapRegion region);
const char* toString(ReadingDirection direction);

// Fraction of the viewport width covered by each of the left and right zones
static constexpr float DEFAULT_TAP_REGION_THRESHOLD = 0.2f;

// Classify a tap by its x coordinate. Points exactly on a zone edge belong to CENTER.
TapRegion classifyTapRegion(float pointX, float viewportWidth,
                            float threshold = DEFAULT_TAP_REGION_THRESHOLD);

// Page delta for a tap region: LEFT goes back and RIGHT goes forward, mirrored for
// right-to-left reading. CENTER yields 0.
int navigationDelta(TapRegion region, ReadingDirection direction);

// Normalized point to scale around. Vertical reading always scales around the center
// so the pan bounds stay centered on the page content.
glm::vec2 resolveScaleAnchor(const ScreenPos& point, ReadingDirection direction,
                             float viewportWidth, float viewportHeight);

// Clamp a scale value into [1, maximumScale]. NaN maps to 1.
float clampScale(float scale, float maximumScale);

// Nearest offset that keeps the scaled page covering the viewport.
// The pan range is viewport * (scale - 1) / 2 on each axis, so scale 1 forces (0, 0).
// A NaN component maps to 0 and a NaN scale is treated as 1.
glm::vec2 constrainOffset(const glm::vec2& candidate, float scale,
                          float viewportWidth, float viewportHeight);

}
