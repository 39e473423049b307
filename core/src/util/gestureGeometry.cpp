#include "util/gestureGeometry.h"
#include "glm/common.hpp"

#include <algorithm>
#include <cmath>

namespace PageView {

const char* toString(ReadingDirection direction) {
    switch (direction) {
    case ReadingDirection::LEFT_TO_RIGHT: return "leftToRight";
    case ReadingDirection::RIGHT_TO_LEFT: return "rightToLeft";
    case ReadingDirection::VERTICAL: return "vertical";
    }
    return "unknown";
}

const char* toString(TapRegion region) {
    switch (region) {
    case TapRegion::LEFT: return "left";
    case TapRegion::CENTER: return "center";
    case TapRegion::RIGHT: return "right";
    }
    return "unknown";
}

TapRegion classifyTapRegion(float pointX, float viewportWidth, float threshold) {
    float leftThreshold = viewportWidth * threshold;
    float rightThreshold = viewportWidth * (1.f - threshold);

    if (pointX < leftThreshold) {
        return TapRegion::LEFT;
    } else if (pointX > rightThreshold) {
        return TapRegion::RIGHT;
    }
    return TapRegion::CENTER;
}

int navigationDelta(TapRegion region, ReadingDirection direction) {
    bool isRightToLeft = direction == ReadingDirection::RIGHT_TO_LEFT;

    switch (region) {
    case TapRegion::LEFT:
        return isRightToLeft ? 1 : -1;
    case TapRegion::RIGHT:
        return isRightToLeft ? -1 : 1;
    case TapRegion::CENTER:
        break;
    }
    return 0;
}

glm::vec2 resolveScaleAnchor(const ScreenPos& point, ReadingDirection direction,
                             float viewportWidth, float viewportHeight) {
    glm::vec2 anchor(0.5f, 0.5f);

    if (direction == ReadingDirection::VERTICAL) {
        return anchor;
    }

    // Touch points can be reported slightly outside the viewport
    if (viewportWidth > 0.f) {
        anchor.x = glm::clamp(point.x / viewportWidth, 0.f, 1.f);
    }
    if (viewportHeight > 0.f) {
        anchor.y = glm::clamp(point.y / viewportHeight, 0.f, 1.f);
    }
    return anchor;
}

float clampScale(float scale, float maximumScale) {
    if (std::isnan(scale)) {
        return 1.f;
    }
    return std::min(std::max(scale, 1.f), std::max(maximumScale, 1.f));
}

glm::vec2 constrainOffset(const glm::vec2& candidate, float scale,
                          float viewportWidth, float viewportHeight) {
    if (std::isnan(scale)) {
        scale = 1.f;
    }

    // Same bounds for every reading direction, the anchor already accounts for it
    glm::vec2 maxOffset(viewportWidth * (scale - 1.f) / 2.f,
                        viewportHeight * (scale - 1.f) / 2.f);
    maxOffset = glm::max(maxOffset, glm::vec2(0.f, 0.f));

    glm::vec2 offset(std::isnan(candidate.x) ? 0.f : candidate.x,
                     std::isnan(candidate.y) ? 0.f : candidate.y);
    return glm::clamp(offset, -maxOffset, maxOffset);
}

}
