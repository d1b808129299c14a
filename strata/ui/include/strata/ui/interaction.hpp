#pragma once

#include <strata/ui/input_event.hpp>
#include <strata/ui/ui_types.hpp>
#include <strata/ui/widget_id.hpp>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace strata::ui {

// Per-widget interaction flags
struct InteractionState {
    bool hovered = false;
    bool active = false;    // Pressed and tracking
    bool focused = false;
};

// Hit-testable widget geometry for one frame, listed in paint order
struct HitTestEntry {
    WidgetId id;
    Rect bounds;
    bool focusable = false;
    std::optional<Rect> clip;   // Visible region when inside a clipping container
    std::optional<WidgetId> scroll_target;  // Receives wheel input instead of this widget

    bool hit(Vec2 position) const {
        return bounds.contains(position) && (!clip || clip->contains(position));
    }
};

enum class InteractionEventType : uint8_t {
    PointerEnter,
    PointerLeave,
    PointerDown,
    PointerUp,
    Click,
    Scroll,
    FocusIn,
    FocusOut,
    KeyDown,
    KeyUp
};

const char* interaction_event_name(InteractionEventType type);

// Result of input processing, addressed to one widget
struct InteractionEvent {
    InteractionEventType type = InteractionEventType::Click;
    WidgetId widget;
    PointerId pointer;
    Vec2 position{0.0f};
    Vec2 local_position{0.0f};  // Relative to the widget's top-left corner
    Vec2 scroll_delta{0.0f};
    Key key = Key::Unknown;
    Modifiers modifiers;
    uint32_t character = 0;
};

/**
 * @brief Hover / active / focus tracking for one UI layer
 *
 * Input events are resolved against the hit-test entries of the most recent
 * frame (topmost entry first). Resulting InteractionEvents are returned and
 * also buffered per widget so the next declarative pass can consume them
 * with take_click() / take_events().
 *
 * Mouse and touch share one state machine: a mouse press is keyed by its
 * button, a touch by its touch id. Hover is tracked per device (the mouse, or
 * each finger while it is down).
 */
class InteractionSystem {
public:
    InteractionSystem() = default;

    // Replace the geometry used for hit testing
    void update_hit_test(std::vector<HitTestEntry> entries);
    const std::vector<HitTestEntry>& hit_test_entries() const { return m_entries; }

    // Topmost entry containing the point
    std::optional<HitTestEntry> hit_test(Vec2 position) const;

    std::vector<InteractionEvent> handle_input(const InputEvent& event);

    // Flags for a widget; default (all false) if never seen
    InteractionState state(WidgetId id) const;
    bool is_hovered(WidgetId id) const;
    bool is_active(WidgetId id) const;
    bool has_focus(WidgetId id) const { return m_focused && *m_focused == id; }
    bool has_active_press() const { return !m_pressed.empty(); }

    // Focus
    std::optional<WidgetId> focused() const { return m_focused; }
    std::vector<InteractionEvent> set_focus(std::optional<WidgetId> id);
    std::vector<InteractionEvent> focus_next();
    std::vector<InteractionEvent> focus_previous();

    // Buffered events for the declarative pass
    bool take_click(WidgetId id);
    std::vector<InteractionEvent> take_events(WidgetId id);
    bool has_pending_events() const { return !m_pending.empty(); }

    // End of a declarative pass: forget every tracked widget that was not
    // observed, and drop events nobody consumed
    void retain_observed(const std::unordered_set<WidgetId>& observed);

    void clear();

private:
    // Device whose position drives hover: the mouse, or one touch
    static PointerId hover_device(PointerId pointer);

    std::optional<WidgetId> hovered_by(PointerId device) const;
    std::optional<WidgetId> pressed_by(PointerId pointer) const;
    std::optional<WidgetId> captured_for(PointerId device) const;

    void update_hover(PointerId device, std::optional<WidgetId> target, Vec2 position,
                      std::vector<InteractionEvent>& events);
    void press(PointerId pointer, Vec2 position, bool allow_focus, std::vector<InteractionEvent>& events);
    void release(PointerId pointer, Vec2 position, bool allow_click, std::vector<InteractionEvent>& events);
    void change_focus(std::optional<WidgetId> id, std::vector<InteractionEvent>& events);
    void cycle_focus(bool forward, std::vector<InteractionEvent>& events);
    void handle_key_down(const KeyDown& key, std::vector<InteractionEvent>& events);

    InteractionEvent make_event(InteractionEventType type, WidgetId widget, PointerId pointer,
                                Vec2 position) const;
    std::optional<Rect> bounds_of(WidgetId id) const;
    bool is_present(WidgetId id) const;
    void buffer(const std::vector<InteractionEvent>& events);

    std::vector<HitTestEntry> m_entries;
    std::vector<WidgetId> m_focusable;

    std::vector<std::pair<PointerId, WidgetId>> m_hovered;
    std::vector<std::pair<PointerId, WidgetId>> m_pressed;
    std::optional<WidgetId> m_focused;

    bool m_mouse_in_window = false;
    Vec2 m_mouse_position{0.0f};

    std::vector<InteractionEvent> m_pending;
};

} // namespace strata::ui
