#include <strata/ui/interaction.hpp>
#include <strata/core/log.hpp>
#include <algorithm>
#include <limits>

namespace strata::ui {

using core::log;
using core::LogLevel;

namespace {

// Hover for the mouse is tracked per device, not per button
const PointerId MOUSE_DEVICE{PointerId::Kind::Mouse, std::numeric_limits<uint64_t>::max()};

} // anonymous namespace

const char* interaction_event_name(InteractionEventType type) {
    switch (type) {
        case InteractionEventType::PointerEnter: return "PointerEnter";
        case InteractionEventType::PointerLeave: return "PointerLeave";
        case InteractionEventType::PointerDown:  return "PointerDown";
        case InteractionEventType::PointerUp:    return "PointerUp";
        case InteractionEventType::Click:        return "Click";
        case InteractionEventType::Scroll:       return "Scroll";
        case InteractionEventType::FocusIn:      return "FocusIn";
        case InteractionEventType::FocusOut:     return "FocusOut";
        case InteractionEventType::KeyDown:      return "KeyDown";
        case InteractionEventType::KeyUp:        return "KeyUp";
    }
    return "Unknown";
}

// ============================================================================
// Geometry
// ============================================================================

void InteractionSystem::update_hit_test(std::vector<HitTestEntry> entries) {
    m_entries = std::move(entries);

    // Tab order is paint order
    m_focusable.clear();
    for (const auto& entry : m_entries) {
        if (entry.focusable) {
            m_focusable.push_back(entry.id);
        }
    }

    // Widgets may have moved under a stationary mouse
    if (m_mouse_in_window) {
        std::vector<InteractionEvent> events;
        auto hit = hit_test(m_mouse_position);
        update_hover(MOUSE_DEVICE, hit ? std::optional<WidgetId>(hit->id) : std::nullopt,
                     m_mouse_position, events);
        buffer(events);
    }
}

std::optional<HitTestEntry> InteractionSystem::hit_test(Vec2 position) const {
    for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
        if (it->hit(position)) {
            return *it;
        }
    }
    return std::nullopt;
}

std::optional<Rect> InteractionSystem::bounds_of(WidgetId id) const {
    for (const auto& entry : m_entries) {
        if (entry.id == id) return entry.bounds;
    }
    return std::nullopt;
}

bool InteractionSystem::is_present(WidgetId id) const {
    return bounds_of(id).has_value();
}

// ============================================================================
// Input
// ============================================================================

std::vector<InteractionEvent> InteractionSystem::handle_input(const InputEvent& event) {
    std::vector<InteractionEvent> events;

    if (const auto* move = std::get_if<PointerMove>(&event)) {
        m_mouse_in_window = true;
        m_mouse_position = move->position;
        auto hit = hit_test(move->position);
        update_hover(MOUSE_DEVICE, hit ? std::optional<WidgetId>(hit->id) : std::nullopt,
                     move->position, events);
    } else if (const auto* down = std::get_if<PointerDown>(&event)) {
        m_mouse_in_window = true;
        m_mouse_position = down->position;
        press(PointerId::mouse(down->button), down->position,
              down->button == MouseButton::Left, events);
    } else if (const auto* up = std::get_if<PointerUp>(&event)) {
        m_mouse_position = up->position;
        release(PointerId::mouse(up->button), up->position, true, events);
        auto hit = hit_test(up->position);
        update_hover(MOUSE_DEVICE, hit ? std::optional<WidgetId>(hit->id) : std::nullopt,
                     up->position, events);
    } else if (std::holds_alternative<PointerLeave>(event)) {
        // Presses stay captured so a drag can finish outside the window
        m_mouse_in_window = false;
        update_hover(MOUSE_DEVICE, std::nullopt, m_mouse_position, events);
    } else if (const auto* scroll = std::get_if<Scroll>(&event)) {
        m_mouse_position = scroll->position;
        if (auto hit = hit_test(scroll->position)) {
            WidgetId target = hit->scroll_target.value_or(hit->id);
            auto e = make_event(InteractionEventType::Scroll, target, MOUSE_DEVICE, scroll->position);
            e.scroll_delta = scroll->delta;
            events.push_back(e);
        }
    } else if (const auto* touch_down = std::get_if<TouchDown>(&event)) {
        press(PointerId::touch(touch_down->touch_id), touch_down->position, true, events);
    } else if (const auto* touch_move = std::get_if<TouchMove>(&event)) {
        PointerId touch = PointerId::touch(touch_move->touch_id);
        // A finger only hovers while it is down
        if (pressed_by(touch)) {
            auto hit = hit_test(touch_move->position);
            update_hover(touch, hit ? std::optional<WidgetId>(hit->id) : std::nullopt,
                         touch_move->position, events);
        }
    } else if (const auto* touch_up = std::get_if<TouchUp>(&event)) {
        PointerId touch = PointerId::touch(touch_up->touch_id);
        release(touch, touch_up->position, true, events);
        update_hover(touch, std::nullopt, touch_up->position, events);
    } else if (const auto* cancel = std::get_if<TouchCancel>(&event)) {
        PointerId touch = PointerId::touch(cancel->touch_id);
        release(touch, cancel->position, false, events);
        update_hover(touch, std::nullopt, cancel->position, events);
    } else if (const auto* key_down = std::get_if<KeyDown>(&event)) {
        handle_key_down(*key_down, events);
    } else if (const auto* key_up = std::get_if<KeyUp>(&event)) {
        if (m_focused) {
            auto e = make_event(InteractionEventType::KeyUp, *m_focused, MOUSE_DEVICE, m_mouse_position);
            e.key = key_up->key;
            e.modifiers = key_up->modifiers;
            events.push_back(e);
        }
    }

    buffer(events);
    return events;
}

void InteractionSystem::handle_key_down(const KeyDown& key, std::vector<InteractionEvent>& events) {
    if (key.key == Key::Tab) {
        if (!key.is_repeat) {
            cycle_focus(!key.modifiers.shift, events);
        }
        return;
    }

    if (!m_focused) return;

    auto e = make_event(InteractionEventType::KeyDown, *m_focused, MOUSE_DEVICE, m_mouse_position);
    e.key = key.key;
    e.modifiers = key.modifiers;
    e.character = key.character;
    events.push_back(e);

    // Keyboard activation of the focused widget
    if (!key.is_repeat && (key.key == Key::Enter || key.key == Key::Space)) {
        events.push_back(make_event(InteractionEventType::Click, *m_focused, MOUSE_DEVICE, m_mouse_position));
    }
}

// ============================================================================
// State machine
// ============================================================================

PointerId InteractionSystem::hover_device(PointerId pointer) {
    return pointer.is_touch() ? pointer : MOUSE_DEVICE;
}

std::optional<WidgetId> InteractionSystem::hovered_by(PointerId device) const {
    for (const auto& [pointer, id] : m_hovered) {
        if (pointer == device) return id;
    }
    return std::nullopt;
}

std::optional<WidgetId> InteractionSystem::pressed_by(PointerId pointer) const {
    for (const auto& [p, id] : m_pressed) {
        if (p == pointer) return id;
    }
    return std::nullopt;
}

std::optional<WidgetId> InteractionSystem::captured_for(PointerId device) const {
    if (device.is_touch()) {
        return pressed_by(device);
    }
    for (const auto& [pointer, id] : m_pressed) {
        if (!pointer.is_touch()) return id;
    }
    return std::nullopt;
}

void InteractionSystem::update_hover(PointerId device, std::optional<WidgetId> target, Vec2 position,
                                     std::vector<InteractionEvent>& events) {
    // While a press is tracking, no other widget becomes hovered
    if (auto captured = captured_for(device); captured && target && *target != *captured) {
        target = std::nullopt;
    }

    auto previous = hovered_by(device);
    if (previous == target) return;

    if (previous) {
        m_hovered.erase(
            std::remove_if(m_hovered.begin(), m_hovered.end(),
                [device](const auto& entry) { return entry.first == device; }),
            m_hovered.end()
        );
        events.push_back(make_event(InteractionEventType::PointerLeave, *previous, device, position));
    }

    if (target) {
        m_hovered.emplace_back(device, *target);
        events.push_back(make_event(InteractionEventType::PointerEnter, *target, device, position));
    }
}

void InteractionSystem::press(PointerId pointer, Vec2 position, bool allow_focus,
                              std::vector<InteractionEvent>& events) {
    auto hit = hit_test(position);
    update_hover(hover_device(pointer), hit ? std::optional<WidgetId>(hit->id) : std::nullopt,
                 position, events);

    if (!hit) {
        // Press on empty space clears focus
        if (allow_focus) {
            change_focus(std::nullopt, events);
        }
        return;
    }

    m_pressed.erase(
        std::remove_if(m_pressed.begin(), m_pressed.end(),
            [pointer](const auto& entry) { return entry.first == pointer; }),
        m_pressed.end()
    );
    m_pressed.emplace_back(pointer, hit->id);
    events.push_back(make_event(InteractionEventType::PointerDown, hit->id, pointer, position));

    if (allow_focus && hit->focusable) {
        change_focus(hit->id, events);
    }
}

void InteractionSystem::release(PointerId pointer, Vec2 position, bool allow_click,
                                std::vector<InteractionEvent>& events) {
    auto pressed = pressed_by(pointer);
    if (!pressed) return;

    m_pressed.erase(
        std::remove_if(m_pressed.begin(), m_pressed.end(),
            [pointer](const auto& entry) { return entry.first == pointer; }),
        m_pressed.end()
    );

    if (!is_present(*pressed)) {
        log(LogLevel::Trace, "InteractionSystem: release for vanished widget {}", pressed->value());
        return;
    }
    if (!allow_click) {
        return;
    }

    events.push_back(make_event(InteractionEventType::PointerUp, *pressed, pointer, position));

    auto hit = hit_test(position);
    if (hit && hit->id == *pressed) {
        events.push_back(make_event(InteractionEventType::Click, *pressed, pointer, position));
    }
}

InteractionEvent InteractionSystem::make_event(InteractionEventType type, WidgetId widget,
                                               PointerId pointer, Vec2 position) const {
    InteractionEvent e;
    e.type = type;
    e.widget = widget;
    e.pointer = pointer;
    e.position = position;
    if (auto bounds = bounds_of(widget)) {
        e.local_position = position - bounds->position();
    } else {
        e.local_position = position;
    }
    return e;
}

InteractionState InteractionSystem::state(WidgetId id) const {
    InteractionState s;
    s.hovered = is_hovered(id);
    s.active = is_active(id);
    s.focused = has_focus(id);
    return s;
}

bool InteractionSystem::is_hovered(WidgetId id) const {
    return std::any_of(m_hovered.begin(), m_hovered.end(),
                       [id](const auto& entry) { return entry.second == id; });
}

bool InteractionSystem::is_active(WidgetId id) const {
    return std::any_of(m_pressed.begin(), m_pressed.end(),
                       [id](const auto& entry) { return entry.second == id; });
}

// ============================================================================
// Focus
// ============================================================================

void InteractionSystem::change_focus(std::optional<WidgetId> id, std::vector<InteractionEvent>& events) {
    if (m_focused == id) return;

    if (m_focused) {
        events.push_back(make_event(InteractionEventType::FocusOut, *m_focused, MOUSE_DEVICE, m_mouse_position));
    }
    m_focused = id;
    if (m_focused) {
        events.push_back(make_event(InteractionEventType::FocusIn, *m_focused, MOUSE_DEVICE, m_mouse_position));
    }
}

void InteractionSystem::cycle_focus(bool forward, std::vector<InteractionEvent>& events) {
    if (m_focusable.empty()) return;

    auto it = m_focused
        ? std::find(m_focusable.begin(), m_focusable.end(), *m_focused)
        : m_focusable.end();

    if (it == m_focusable.end()) {
        change_focus(forward ? m_focusable.front() : m_focusable.back(), events);
        return;
    }

    if (forward) {
        ++it;
        if (it == m_focusable.end()) {
            it = m_focusable.begin();  // Wrap around
        }
    } else {
        if (it == m_focusable.begin()) {
            it = m_focusable.end();  // Wrap around
        }
        --it;
    }
    change_focus(*it, events);
}

std::vector<InteractionEvent> InteractionSystem::set_focus(std::optional<WidgetId> id) {
    std::vector<InteractionEvent> events;
    change_focus(id, events);
    buffer(events);
    return events;
}

std::vector<InteractionEvent> InteractionSystem::focus_next() {
    std::vector<InteractionEvent> events;
    cycle_focus(true, events);
    buffer(events);
    return events;
}

std::vector<InteractionEvent> InteractionSystem::focus_previous() {
    std::vector<InteractionEvent> events;
    cycle_focus(false, events);
    buffer(events);
    return events;
}

// ============================================================================
// Event buffer
// ============================================================================

void InteractionSystem::buffer(const std::vector<InteractionEvent>& events) {
    m_pending.insert(m_pending.end(), events.begin(), events.end());
}

bool InteractionSystem::take_click(WidgetId id) {
    auto is_click = [id](const InteractionEvent& e) {
        return e.widget == id && e.type == InteractionEventType::Click;
    };
    auto it = std::remove_if(m_pending.begin(), m_pending.end(), is_click);
    bool clicked = it != m_pending.end();
    m_pending.erase(it, m_pending.end());
    return clicked;
}

std::vector<InteractionEvent> InteractionSystem::take_events(WidgetId id) {
    std::vector<InteractionEvent> taken;
    std::vector<InteractionEvent> remaining;
    for (auto& e : m_pending) {
        (e.widget == id ? taken : remaining).push_back(e);
    }
    m_pending.swap(remaining);
    return taken;
}

void InteractionSystem::retain_observed(const std::unordered_set<WidgetId>& observed) {
    auto gone = [&observed](const auto& entry) { return observed.count(entry.second) == 0; };
    m_hovered.erase(std::remove_if(m_hovered.begin(), m_hovered.end(), gone), m_hovered.end());
    m_pressed.erase(std::remove_if(m_pressed.begin(), m_pressed.end(), gone), m_pressed.end());

    if (m_focused && observed.count(*m_focused) == 0) {
        log(LogLevel::Trace, "InteractionSystem: focused widget {} disappeared", m_focused->value());
        m_focused.reset();
    }

    m_pending.clear();
}

void InteractionSystem::clear() {
    m_entries.clear();
    m_focusable.clear();
    m_hovered.clear();
    m_pressed.clear();
    m_focused.reset();
    m_mouse_in_window = false;
    m_pending.clear();
}

} // namespace strata::ui
