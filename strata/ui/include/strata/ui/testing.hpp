#pragma once

#include <strata/ui/interaction.hpp>
#include <algorithm>
#include <vector>

namespace strata::ui::testing {

// Drives an InteractionSystem with synthetic input for tests.
//
// @code
// InteractionHarness h;
// h.add_widget(WidgetId(1), Rect(0, 0, 100, 40));
// auto events = h.click(Vec2(10, 10));
// REQUIRE(InteractionHarness::count(events, InteractionEventType::Click) == 1);
// @endcode
class InteractionHarness {
public:
    InteractionHarness() = default;

    InteractionSystem& system() { return m_system; }

    // Widgets are registered in paint order; later ones are on top
    InteractionHarness& add_widget(WidgetId id, const Rect& bounds, bool focusable = false) {
        m_entries.push_back(HitTestEntry{id, bounds, focusable});
        m_system.update_hit_test(m_entries);
        return *this;
    }

    void remove_widget(WidgetId id) {
        m_entries.erase(
            std::remove_if(m_entries.begin(), m_entries.end(),
                [id](const HitTestEntry& e) { return e.id == id; }),
            m_entries.end()
        );
        m_system.update_hit_test(m_entries);
    }

    std::vector<InteractionEvent> send(const InputEvent& event) {
        return m_system.handle_input(event);
    }

    std::vector<InteractionEvent> move_to(Vec2 position) { return send(PointerMove{position}); }
    std::vector<InteractionEvent> press(Vec2 position, MouseButton button = MouseButton::Left) {
        return send(PointerDown{position, button});
    }
    std::vector<InteractionEvent> release(Vec2 position, MouseButton button = MouseButton::Left) {
        return send(PointerUp{position, button});
    }

    // Move, press and release at one position; returns all resulting events
    std::vector<InteractionEvent> click(Vec2 position, MouseButton button = MouseButton::Left) {
        std::vector<InteractionEvent> all = move_to(position);
        append(all, press(position, button));
        append(all, release(position, button));
        return all;
    }

    std::vector<InteractionEvent> tap(uint64_t touch_id, Vec2 position) {
        std::vector<InteractionEvent> all = send(TouchDown{touch_id, position});
        append(all, send(TouchUp{touch_id, position}));
        return all;
    }

    std::vector<InteractionEvent> press_key(Key key, Modifiers modifiers = {}) {
        return send(KeyDown{key, modifiers, 0, false});
    }

    static size_t count(const std::vector<InteractionEvent>& events, InteractionEventType type) {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
            [type](const InteractionEvent& e) { return e.type == type; }));
    }

    static size_t count(const std::vector<InteractionEvent>& events, InteractionEventType type, WidgetId id) {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
            [type, id](const InteractionEvent& e) { return e.type == type && e.widget == id; }));
    }

private:
    static void append(std::vector<InteractionEvent>& into, const std::vector<InteractionEvent>& more) {
        into.insert(into.end(), more.begin(), more.end());
    }

    InteractionSystem m_system;
    std::vector<HitTestEntry> m_entries;
};

} // namespace strata::ui::testing
