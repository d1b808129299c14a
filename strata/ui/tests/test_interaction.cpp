#include <catch2/catch_test_macros.hpp>
#include <strata/ui/testing.hpp>
#include <string>
#include <unordered_set>

using namespace strata::ui;
using strata::ui::testing::InteractionHarness;
using Type = InteractionEventType;

namespace {

const WidgetId A(1);
const WidgetId B(2);
const WidgetId C(3);

const Vec2 IN_A(10, 10);
const Vec2 IN_B(110, 10);
const Vec2 OUTSIDE(500, 500);

// Two side-by-side widgets, both focusable
void add_pair(InteractionHarness& h) {
    h.add_widget(A, Rect(0, 0, 100, 40), true);
    h.add_widget(B, Rect(100, 0, 100, 40), true);
}

} // anonymous namespace

// ============================================================================
// Hit testing
// ============================================================================

TEST_CASE("Hit test picks the topmost entry", "[ui][interaction]") {
    InteractionHarness h;
    h.add_widget(A, Rect(0, 0, 100, 100));
    h.add_widget(B, Rect(50, 50, 100, 100));

    REQUIRE(h.system().hit_test(Vec2(75, 75))->id == B);
    REQUIRE(h.system().hit_test(Vec2(25, 25))->id == A);
    REQUIRE_FALSE(h.system().hit_test(OUTSIDE).has_value());
}

// ============================================================================
// Hover
// ============================================================================

TEST_CASE("Pointer enter and leave", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    auto events = h.move_to(IN_A);
    REQUIRE(InteractionHarness::count(events, Type::PointerEnter, A) == 1);
    REQUIRE(h.system().is_hovered(A));

    events = h.move_to(IN_A + Vec2(1, 1));
    REQUIRE(events.empty());

    events = h.move_to(IN_B);
    REQUIRE(InteractionHarness::count(events, Type::PointerLeave, A) == 1);
    REQUIRE(InteractionHarness::count(events, Type::PointerEnter, B) == 1);
    REQUIRE(events[0].type == Type::PointerLeave);

    SECTION("Leaving the window clears hover") {
        events = h.send(PointerLeave{});
        REQUIRE(InteractionHarness::count(events, Type::PointerLeave, B) == 1);
        REQUIRE_FALSE(h.system().is_hovered(B));
    }

    SECTION("Geometry change under a stationary mouse") {
        h.remove_widget(B);
        REQUIRE_FALSE(h.system().is_hovered(B));
        h.add_widget(C, Rect(100, 0, 50, 50));
        REQUIRE(h.system().is_hovered(C));
    }
}

TEST_CASE("Local position is relative to the widget", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    auto events = h.move_to(Vec2(130, 25));
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].local_position == Vec2(30, 25));
}

// ============================================================================
// Press and click
// ============================================================================

TEST_CASE("Click requires press and release on the same widget", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    SECTION("Press and release inside") {
        auto events = h.click(IN_A);
        REQUIRE(InteractionHarness::count(events, Type::PointerDown, A) == 1);
        REQUIRE(InteractionHarness::count(events, Type::PointerUp, A) == 1);
        REQUIRE(InteractionHarness::count(events, Type::Click, A) == 1);
        REQUIRE_FALSE(h.system().is_active(A));
    }

    SECTION("Drag off before release") {
        h.move_to(IN_A);
        h.press(IN_A);
        REQUIRE(h.system().is_active(A));

        auto moved = h.move_to(IN_B);
        // Captured: B does not become hovered while A is pressed
        REQUIRE(InteractionHarness::count(moved, Type::PointerEnter, B) == 0);
        REQUIRE_FALSE(h.system().is_hovered(B));

        auto released = h.release(IN_B);
        REQUIRE(InteractionHarness::count(released, Type::PointerUp, A) == 1);
        REQUIRE(InteractionHarness::count(released, Type::Click) == 0);
        REQUIRE(h.system().is_hovered(B));
    }

    SECTION("Drag off and back") {
        h.press(IN_A);
        h.move_to(OUTSIDE);
        h.move_to(IN_A);
        auto released = h.release(IN_A);
        REQUIRE(InteractionHarness::count(released, Type::Click, A) == 1);
    }

    SECTION("Press survives leaving the window") {
        h.press(IN_A);
        h.send(PointerLeave{});
        REQUIRE(h.system().is_active(A));
        auto released = h.release(OUTSIDE);
        REQUIRE(InteractionHarness::count(released, Type::PointerUp, A) == 1);
        REQUIRE(InteractionHarness::count(released, Type::Click) == 0);
    }

    SECTION("Widget vanishes while pressed") {
        h.press(IN_A);
        h.remove_widget(A);
        auto released = h.release(IN_A);
        REQUIRE(released.empty());
        REQUIRE_FALSE(h.system().is_active(A));
    }

    SECTION("Buttons track independently") {
        h.press(IN_A, MouseButton::Right);
        auto released = h.release(IN_A, MouseButton::Left);
        REQUIRE(InteractionHarness::count(released, Type::Click) == 0);
        REQUIRE(h.system().is_active(A));

        released = h.release(IN_A, MouseButton::Right);
        REQUIRE(InteractionHarness::count(released, Type::Click, A) == 1);
    }
}

TEST_CASE("Touch shares the pointer state machine", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    SECTION("Tap clicks and focuses") {
        auto events = h.tap(7, IN_B);
        REQUIRE(InteractionHarness::count(events, Type::Click, B) == 1);
        REQUIRE(h.system().has_focus(B));
        // The finger no longer hovers once lifted
        REQUIRE_FALSE(h.system().is_hovered(B));
    }

    SECTION("Cancel never clicks") {
        h.send(TouchDown{7, IN_A});
        REQUIRE(h.system().is_active(A));
        auto events = h.send(TouchCancel{7, IN_A});
        REQUIRE(InteractionHarness::count(events, Type::Click) == 0);
        REQUIRE(InteractionHarness::count(events, Type::PointerUp) == 0);
        REQUIRE_FALSE(h.system().is_active(A));
    }

    SECTION("Two fingers press two widgets") {
        h.send(TouchDown{1, IN_A});
        h.send(TouchDown{2, IN_B});
        REQUIRE(h.system().is_active(A));
        REQUIRE(h.system().is_active(B));

        auto events = h.send(TouchUp{2, IN_B});
        REQUIRE(InteractionHarness::count(events, Type::Click, B) == 1);
        REQUIRE(h.system().is_active(A));
    }

    SECTION("Moving finger without a press does not hover") {
        auto events = h.send(TouchMove{3, IN_A});
        REQUIRE(events.empty());
    }
}

TEST_CASE("Scroll goes to the widget under the pointer", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    auto events = h.send(Scroll{IN_B, Vec2(0, -3)});
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].type == Type::Scroll);
    REQUIRE(events[0].widget == B);
    REQUIRE(events[0].scroll_delta == Vec2(0, -3));

    REQUIRE(h.send(Scroll{OUTSIDE, Vec2(0, 1)}).empty());
}

// ============================================================================
// Focus
// ============================================================================

TEST_CASE("Focus follows clicks", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);
    h.add_widget(C, Rect(0, 100, 50, 50), false);

    auto events = h.click(IN_A);
    REQUIRE(InteractionHarness::count(events, Type::FocusIn, A) == 1);
    REQUIRE(h.system().focused() == A);

    SECTION("Clicking another focusable moves focus") {
        events = h.click(IN_B);
        REQUIRE(InteractionHarness::count(events, Type::FocusOut, A) == 1);
        REQUIRE(InteractionHarness::count(events, Type::FocusIn, B) == 1);
    }

    SECTION("Clicking a non-focusable widget keeps focus") {
        h.click(Vec2(10, 110));
        REQUIRE(h.system().has_focus(A));
    }

    SECTION("Clicking empty space clears focus") {
        events = h.click(OUTSIDE);
        REQUIRE(InteractionHarness::count(events, Type::FocusOut, A) == 1);
        REQUIRE_FALSE(h.system().focused().has_value());
    }

    SECTION("Right click does not focus") {
        h.click(IN_B, MouseButton::Right);
        REQUIRE(h.system().has_focus(A));
    }
}

TEST_CASE("Tab cycles focus in paint order", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);
    h.add_widget(C, Rect(0, 100, 50, 50), true);

    Modifiers shift;
    shift.shift = true;

    h.press_key(Key::Tab);
    REQUIRE(h.system().focused() == A);
    h.press_key(Key::Tab);
    REQUIRE(h.system().focused() == B);
    h.press_key(Key::Tab);
    REQUIRE(h.system().focused() == C);

    SECTION("Wraps forward") {
        h.press_key(Key::Tab);
        REQUIRE(h.system().focused() == A);
    }

    SECTION("Shift+Tab goes backward and wraps") {
        h.press_key(Key::Tab, shift);
        REQUIRE(h.system().focused() == B);
        h.press_key(Key::Tab, shift);
        h.press_key(Key::Tab, shift);
        REQUIRE(h.system().focused() == C);
    }

    SECTION("Nothing focusable") {
        InteractionHarness empty;
        empty.add_widget(A, Rect(0, 0, 10, 10), false);
        REQUIRE(empty.press_key(Key::Tab).empty());
    }
}

TEST_CASE("Keys route to the focused widget", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    SECTION("No focus, no events") {
        REQUIRE(h.press_key(Key::Enter).empty());
    }

    SECTION("Enter activates") {
        h.system().set_focus(B);
        auto events = h.press_key(Key::Enter);
        REQUIRE(InteractionHarness::count(events, Type::KeyDown, B) == 1);
        REQUIRE(InteractionHarness::count(events, Type::Click, B) == 1);
    }

    SECTION("Repeat does not activate") {
        h.system().set_focus(B);
        auto events = h.send(KeyDown{Key::Space, Modifiers{}, 0, true});
        REQUIRE(InteractionHarness::count(events, Type::KeyDown, B) == 1);
        REQUIRE(InteractionHarness::count(events, Type::Click) == 0);
    }

    SECTION("Key up and characters") {
        h.system().set_focus(A);
        auto down = h.send(KeyDown{Key::Character, Modifiers{}, 'x', false});
        REQUIRE(down[0].character == 'x');
        auto up = h.send(KeyUp{Key::Character, Modifiers{}});
        REQUIRE(InteractionHarness::count(up, Type::KeyUp, A) == 1);
    }
}

// ============================================================================
// Frame bookkeeping
// ============================================================================

TEST_CASE("Buffered events are consumed per widget", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    h.click(IN_A);
    REQUIRE(h.system().has_pending_events());

    auto for_b = h.system().take_events(B);
    REQUIRE(for_b.empty());

    REQUIRE(h.system().take_click(A));
    REQUIRE_FALSE(h.system().take_click(A));

    auto rest = h.system().take_events(A);
    REQUIRE(InteractionHarness::count(rest, Type::PointerDown) == 1);
    REQUIRE_FALSE(h.system().has_pending_events());
}

TEST_CASE("retain_observed drops state for widgets that disappeared", "[ui][interaction]") {
    InteractionHarness h;
    add_pair(h);

    h.click(IN_A);
    h.move_to(IN_A);
    h.press(IN_A);
    REQUIRE(h.system().has_focus(A));
    REQUIRE(h.system().is_active(A));

    SECTION("Still observed") {
        h.system().retain_observed(std::unordered_set<WidgetId>{A, B});
        REQUIRE(h.system().has_focus(A));
        REQUIRE(h.system().is_active(A));
        REQUIRE(h.system().is_hovered(A));
        REQUIRE_FALSE(h.system().has_pending_events());
    }

    SECTION("Gone") {
        h.system().retain_observed(std::unordered_set<WidgetId>{B});
        REQUIRE_FALSE(h.system().focused().has_value());
        REQUIRE_FALSE(h.system().is_active(A));
        REQUIRE_FALSE(h.system().is_hovered(A));
    }
}

TEST_CASE("interaction_event_name", "[ui][interaction]") {
    REQUIRE(std::string(interaction_event_name(Type::Click)) == "Click");
    REQUIRE(std::string(interaction_event_name(Type::FocusOut)) == "FocusOut");
}
