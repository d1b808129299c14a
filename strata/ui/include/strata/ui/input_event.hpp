#pragma once

#include <strata/core/math.hpp>
#include <cstdint>
#include <optional>
#include <variant>

namespace strata::ui {

using core::Vec2;

enum class MouseButton : uint8_t {
    Left,
    Right,
    Middle
};

enum class Key : uint16_t {
    Unknown,
    Tab,
    Enter,
    Escape,
    Space,
    Backspace,
    Delete,
    Left,
    Right,
    Up,
    Down,
    Home,
    End,
    Character   // Printable key; see KeyDown::character
};

struct Modifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool super = false;
};

// Device-reported pointer identity: a mouse button or a touch id
struct PointerId {
    enum class Kind : uint8_t { Mouse, Touch };

    Kind kind = Kind::Mouse;
    uint64_t id = 0;

    static PointerId mouse(MouseButton button) {
        return PointerId{Kind::Mouse, static_cast<uint64_t>(button)};
    }
    static PointerId touch(uint64_t touch_id) {
        return PointerId{Kind::Touch, touch_id};
    }

    bool is_touch() const { return kind == Kind::Touch; }

    bool operator==(const PointerId& other) const { return kind == other.kind && id == other.id; }
    bool operator!=(const PointerId& other) const { return !(*this == other); }
};

// Mouse events
struct PointerDown {
    Vec2 position{0.0f};
    MouseButton button = MouseButton::Left;
};

struct PointerUp {
    Vec2 position{0.0f};
    MouseButton button = MouseButton::Left;
};

struct PointerMove {
    Vec2 position{0.0f};
};

// Mouse left the window; hover clears, active presses stay captured
struct PointerLeave {};

struct Scroll {
    Vec2 position{0.0f};
    Vec2 delta{0.0f};
};

// Touch events, keyed by touch id
struct TouchDown {
    uint64_t touch_id = 0;
    Vec2 position{0.0f};
};

struct TouchMove {
    uint64_t touch_id = 0;
    Vec2 position{0.0f};
};

struct TouchUp {
    uint64_t touch_id = 0;
    Vec2 position{0.0f};
};

struct TouchCancel {
    uint64_t touch_id = 0;
    Vec2 position{0.0f};
};

// Keyboard events
struct KeyDown {
    Key key = Key::Unknown;
    Modifiers modifiers;
    uint32_t character = 0;     // Unicode code point for Key::Character
    bool is_repeat = false;
};

struct KeyUp {
    Key key = Key::Unknown;
    Modifiers modifiers;
};

using InputEvent = std::variant<
    PointerDown, PointerUp, PointerMove, PointerLeave, Scroll,
    TouchDown, TouchMove, TouchUp, TouchCancel,
    KeyDown, KeyUp>;

// Screen position carried by the event, if any
std::optional<Vec2> event_position(const InputEvent& event);

// Pointer and touch events (everything except keyboard)
bool is_pointer_event(const InputEvent& event);

} // namespace strata::ui
