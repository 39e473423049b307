#pragma once

#include "util/gestureListener.h"
#include "util/gestureGeometry.h"
#include "glm/vec2.hpp"

#include <memory>

namespace PageView {

// Resolved gesture events delivered by the platform gesture layer
enum class GestureAction {
    SINGLE_TAP = 0,
    DOUBLE_TAP,
    MAGNIFICATION_CHANGED,
    MAGNIFICATION_ENDED,
    DRAG_STARTED,
    DRAG_CHANGED,
    DRAG_ENDED,
    PANEL_DISMISS,
};

// Payload for onGestureEvent. Only the fields relevant to the action are read:
// touchPoint for taps and magnification changes (null when unknown),
// magnification for MAGNIFICATION_*, translation for DRAG_CHANGED and
// predictedEndTranslation for PANEL_DISMISS.
struct GestureEvent {
    const ScreenPos* touchPoint = nullptr;
    float magnification = 1.f;
    glm::vec2 translation = glm::vec2(0.f, 0.f);
    glm::vec2 predictedEndTranslation = glm::vec2(0.f, 0.f);
};

// Per-session gesture parameters, derived from ReaderSettings
struct GestureConfiguration {
    float tapRegionThreshold = DEFAULT_TAP_REGION_THRESHOLD;
    // Relative distance from 1x under which a finished pinch snaps back to 1x
    float snapToOneThreshold = 0.05f;
    // Multiplier applied to drag translations
    float panSensitivity = 2.f;
    // Minimum predicted downward swipe that dismisses the panel
    float panelDismissThreshold = 30.f;
    float doubleTapScaleFactor = 2.f;
    float maximumScaleFactor = 3.f;
    Transition doubleTapTransition = { 0.25f, Easing::EASE_IN_OUT };
    Transition snapTransition = { 0.2f, Easing::EASE_OUT };

    GestureConfiguration() = default;
    explicit GestureConfiguration(const ReaderSettings& _settings);
};

class GestureCoordinator {
public:
    explicit GestureCoordinator(ViewportMetrics& _viewport);

    // Start a fresh reading session with the given settings
    void setup(const ReaderSettings& _settings);

    // Reset the transform to 1x, centered. Safe to call repeatedly.
    void cleanup();

    // Routes a gesture event to its handler.
    // Returns false if the event does not apply in the current state
    bool onGestureEvent(GestureAction action, const GestureEvent& event);

    // Page navigation from the left/right tap zones, panel toggle otherwise.
    // touchPoint may be null when the gesture layer has no position.
    void handleSingleTap(const ScreenPos* touchPoint);

    // Toggle between 1x and the double tap scale factor
    void handleDoubleTap(const ScreenPos* touchPoint);

    // Pinch updates. value is the magnification relative to the start of the pinch,
    // a value of exactly 1 marks the start of a new pinch sequence.
    void handleMagnificationChanged(float value, const ScreenPos* touchPoint);
    void handleMagnificationEnded(float value);

    // Panning, only while zoomed in. Return false when ignored.
    bool handleDragStarted();
    bool handleDragChanged(const glm::vec2& translation);
    bool handleDragEnded();

    // Vertical swipe on the control panel
    void handlePanelDismiss(const glm::vec2& predictedEndTranslation);

    const TransformState& getTransform() const { return m_transform; }
    const ReaderSettings& getSettings() const { return m_settings; }
    const GestureConfiguration& getConfiguration() const { return m_config; }

    // Recognizer enablement for the gesture layer
    bool isDragEnabled() const { return m_transform.scale > 1.f; }
    bool isTapSimultaneous() const { return m_transform.scale > 1.f; }
    bool isTapExclusive() const { return m_transform.scale == 1.f; }
    bool isMagnificationEnabled() const { return true; }

    void setActionListener(std::shared_ptr<ReaderActionListener> listener);
    void setTransformListener(std::shared_ptr<TransformListener> listener);

private:
    void resetToDefaults();
    void updateScaleAnchor(const ScreenPos& touchPoint);
    glm::vec2 constrain(const glm::vec2& candidate) const;
    void commitBase();
    void publish(const Transition& transition);

    ViewportMetrics* m_viewport;

    ReaderSettings m_settings;
    GestureConfiguration m_config;

    std::shared_ptr<ReaderActionListener> m_actionListener;
    std::shared_ptr<TransformListener> m_transformListener;

    // Published transform
    TransformState m_transform;

    // Committed values that gesture deltas are applied to
    float m_baseScale;
    glm::vec2 m_baseOffset;
    // Scaled translation of the drag in progress
    glm::vec2 m_currentPanOffset;
};

}
