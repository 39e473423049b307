#include "util/gestureCoordinator.h"
#include "util/gestureGeometry.h"
#include "log.h"

#include <cmath>
#include <utility>

namespace PageView {

GestureConfiguration::GestureConfiguration(const ReaderSettings& _settings)
    : doubleTapScaleFactor(_settings.doubleTapScaleFactor),
      maximumScaleFactor(_settings.maximumScaleFactor) {

    if (!(maximumScaleFactor >= 1.f)) {
        LOGW("Maximum scale factor {} is below 1, using 1", maximumScaleFactor);
        maximumScaleFactor = 1.f;
    }
    if (!(doubleTapScaleFactor >= 1.f && doubleTapScaleFactor <= maximumScaleFactor)) {
        float clamped = std::isnan(doubleTapScaleFactor)
            ? maximumScaleFactor
            : clampScale(doubleTapScaleFactor, maximumScaleFactor);
        LOGW("Double tap scale factor {} is outside [1, {}], using {}",
             doubleTapScaleFactor, maximumScaleFactor, clamped);
        doubleTapScaleFactor = clamped;
    }
}

GestureCoordinator::GestureCoordinator(ViewportMetrics& _viewport)
    : m_viewport(&_viewport),
      m_config(m_settings),
      m_baseScale(1.f),
      m_baseOffset(0.f, 0.f),
      m_currentPanOffset(0.f, 0.f) {
}

void GestureCoordinator::setActionListener(std::shared_ptr<ReaderActionListener> listener) {
    m_actionListener = std::move(listener);
}

void GestureCoordinator::setTransformListener(std::shared_ptr<TransformListener> listener) {
    m_transformListener = std::move(listener);
}

void GestureCoordinator::setup(const ReaderSettings& _settings) {
    LOGI("Setup: readingDirection={} doubleTapScale={} maximumScale={}",
         toString(_settings.readingDirection), _settings.doubleTapScaleFactor,
         _settings.maximumScaleFactor);

    m_settings = _settings;
    m_config = GestureConfiguration(_settings);

    resetToDefaults();
    publish(Transition::immediate());
}

void GestureCoordinator::cleanup() {
    resetToDefaults();
    publish(Transition::immediate());
}

void GestureCoordinator::resetToDefaults() {
    m_transform = TransformState();
    m_baseScale = 1.f;
    m_baseOffset = glm::vec2(0.f, 0.f);
    m_currentPanOffset = glm::vec2(0.f, 0.f);
}

bool GestureCoordinator::onGestureEvent(GestureAction action, const GestureEvent& event) {
    switch (action) {
    case GestureAction::SINGLE_TAP:
        handleSingleTap(event.touchPoint);
        return true;
    case GestureAction::DOUBLE_TAP:
        handleDoubleTap(event.touchPoint);
        return true;
    case GestureAction::MAGNIFICATION_CHANGED:
        handleMagnificationChanged(event.magnification, event.touchPoint);
        return true;
    case GestureAction::MAGNIFICATION_ENDED:
        handleMagnificationEnded(event.magnification);
        return true;
    case GestureAction::DRAG_STARTED:
        return handleDragStarted();
    case GestureAction::DRAG_CHANGED:
        return handleDragChanged(event.translation);
    case GestureAction::DRAG_ENDED:
        return handleDragEnded();
    case GestureAction::PANEL_DISMISS:
        handlePanelDismiss(event.predictedEndTranslation);
        return true;
    }
    return false;
}

void GestureCoordinator::handleSingleTap(const ScreenPos* touchPoint) {
    ReadingDirection direction = m_settings.readingDirection;
    LOGI("Handle single tap: readingDirection={}", toString(direction));

    // Vertical reading has no navigation zones
    if (direction == ReadingDirection::VERTICAL || !touchPoint) {
        if (m_actionListener) {
            m_actionListener->togglePanel();
        }
        return;
    }

    TapRegion region = classifyTapRegion(touchPoint->x, m_viewport->getWidth(),
                                         m_config.tapRegionThreshold);
    int delta = navigationDelta(region, direction);
    LOGD("Tap at ({}, {}) in {} region", touchPoint->x, touchPoint->y, toString(region));

    if (!m_actionListener) {
        return;
    }
    if (delta != 0) {
        m_actionListener->navigate(delta);
    } else {
        m_actionListener->togglePanel();
    }
}

void GestureCoordinator::handleDoubleTap(const ScreenPos* touchPoint) {
    LOGI("Handle double tap: currentScale={} doubleTapScale={}",
         m_transform.scale, m_config.doubleTapScaleFactor);

    float targetScale = m_transform.scale == 1.f ? m_config.doubleTapScaleFactor : 1.f;

    if (touchPoint) {
        updateScaleAnchor(*touchPoint);
    }

    m_transform.scale = clampScale(targetScale, m_config.maximumScaleFactor);
    if (m_transform.scale == 1.f) {
        m_transform.offset = glm::vec2(0.f, 0.f);
        m_transform.scaleAnchor = glm::vec2(0.5f, 0.5f);
    }
    m_transform.offset = constrain(m_transform.offset);

    commitBase();
    publish(m_config.doubleTapTransition);
}

void GestureCoordinator::handleMagnificationChanged(float value, const ScreenPos* touchPoint) {
    LOGD("Handle magnification changed: value={}", value);

    // A new pinch sequence starts at a magnification of exactly 1
    if (value == 1.f) {
        m_baseScale = m_transform.scale;
    }

    if (touchPoint) {
        updateScaleAnchor(*touchPoint);
    }

    m_transform.scale = clampScale(value * m_baseScale, m_config.maximumScaleFactor);
    m_transform.offset = constrain(m_transform.offset);

    publish(Transition::immediate());
}

void GestureCoordinator::handleMagnificationEnded(float value) {
    LOGI("Handle magnification ended: value={}", value);

    float finalScale = clampScale(value * m_baseScale, m_config.maximumScaleFactor);
    Transition transition = Transition::immediate();

    if (std::abs(finalScale - 1.f) < m_config.snapToOneThreshold) {
        m_transform = TransformState();
        transition = m_config.snapTransition;
    } else {
        m_transform.scale = finalScale;
        m_transform.offset = constrain(m_transform.offset);
    }

    commitBase();
    publish(transition);
}

bool GestureCoordinator::handleDragStarted() {
    if (!isDragEnabled()) {
        return false;
    }
    LOGD("Handle drag started");

    m_currentPanOffset = glm::vec2(0.f, 0.f);
    return true;
}

bool GestureCoordinator::handleDragChanged(const glm::vec2& translation) {
    if (!isDragEnabled()) {
        return false;
    }

    m_currentPanOffset = translation * m_config.panSensitivity;
    glm::vec2 totalOffset = m_baseOffset + m_currentPanOffset;
    m_transform.offset = constrain(totalOffset);

    LOGD("Handle drag changed: translation=({}, {}) total=({}, {}) constrained=({}, {})",
         translation.x, translation.y, totalOffset.x, totalOffset.y,
         m_transform.offset.x, m_transform.offset.y);

    publish(Transition::immediate());
    return true;
}

bool GestureCoordinator::handleDragEnded() {
    if (!isDragEnabled()) {
        return false;
    }
    LOGD("Handle drag ended");

    glm::vec2 finalOffset = constrain(m_transform.offset);
    m_transform.offset = finalOffset;
    m_baseOffset = finalOffset;
    m_currentPanOffset = glm::vec2(0.f, 0.f);

    publish(Transition::immediate());
    return true;
}

void GestureCoordinator::handlePanelDismiss(const glm::vec2& predictedEndTranslation) {
    LOGI("Handle panel dismiss: predictedEndTranslation=({}, {})",
         predictedEndTranslation.x, predictedEndTranslation.y);

    if (predictedEndTranslation.y > m_config.panelDismissThreshold && m_actionListener) {
        m_actionListener->dismissPanel();
    }
}

void GestureCoordinator::updateScaleAnchor(const ScreenPos& touchPoint) {
    m_transform.scaleAnchor = resolveScaleAnchor(touchPoint, m_settings.readingDirection,
                                                 m_viewport->getWidth(), m_viewport->getHeight());
}

glm::vec2 GestureCoordinator::constrain(const glm::vec2& candidate) const {
    return constrainOffset(candidate, m_transform.scale,
                           m_viewport->getWidth(), m_viewport->getHeight());
}

void GestureCoordinator::commitBase() {
    m_baseScale = m_transform.scale;
    m_baseOffset = m_transform.offset;
}

void GestureCoordinator::publish(const Transition& transition) {
    if (m_transformListener) {
        m_transformListener->onTransformChanged(m_transform, transition);
    }
}

}
