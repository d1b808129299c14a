#pragma once

#include <strata/core/math.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <variant>

namespace strata::ui {

using namespace strata::core;

// Layout direction
enum class LayoutDirection : uint8_t {
    Vertical,
    Horizontal
};

// RGBA colour, components in [0, 1]
using Color = Vec4;

namespace colors {
    inline const Color Transparent{0.0f, 0.0f, 0.0f, 0.0f};
    inline const Color White{1.0f, 1.0f, 1.0f, 1.0f};
    inline const Color Black{0.0f, 0.0f, 0.0f, 1.0f};
} // namespace colors

inline Color rgb(float r, float g, float b) { return Color(r, g, b, 1.0f); }
inline Color rgba(float r, float g, float b, float a) { return Color(r, g, b, a); }

// Rectangle for UI bounds
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    Rect() = default;
    Rect(float x_, float y_, float w_, float h_) : x(x_), y(y_), width(w_), height(h_) {}
    Rect(Vec2 pos, Vec2 size) : x(pos.x), y(pos.y), width(size.x), height(size.y) {}

    Vec2 position() const { return Vec2(x, y); }
    Vec2 size() const { return Vec2(width, height); }
    Vec2 center() const { return Vec2(x + width * 0.5f, y + height * 0.5f); }

    float left() const { return x; }
    float right() const { return x + width; }
    float top() const { return y; }
    float bottom() const { return y + height; }

    bool empty() const { return width <= 0.0f || height <= 0.0f; }

    bool contains(Vec2 point) const {
        return point.x >= x && point.x <= x + width &&
               point.y >= y && point.y <= y + height;
    }

    bool intersects(const Rect& other) const {
        return x < other.right() && right() > other.x &&
               y < other.bottom() && bottom() > other.y;
    }

    // Overlapping area, or nullopt when the rectangles do not overlap
    std::optional<Rect> intersect(const Rect& other) const {
        float new_x = std::max(x, other.x);
        float new_y = std::max(y, other.y);
        float new_right = std::min(right(), other.right());
        float new_bottom = std::min(bottom(), other.bottom());

        if (new_right <= new_x || new_bottom <= new_y) {
            return std::nullopt;
        }
        return Rect(new_x, new_y, new_right - new_x, new_bottom - new_y);
    }

    Rect inset(float amount) const {
        return Rect(x + amount, y + amount,
                    std::max(0.0f, width - 2.0f * amount),
                    std::max(0.0f, height - 2.0f * amount));
    }

    static Rect from_min_max(Vec2 min, Vec2 max) {
        return Rect(min.x, min.y, max.x - min.x, max.y - min.y);
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

// Padding/margin with 4 sides
struct EdgeInsets {
    float left = 0.0f;
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;

    EdgeInsets() = default;
    EdgeInsets(float all) : left(all), top(all), right(all), bottom(all) {}
    EdgeInsets(float horizontal, float vertical)
        : left(horizontal), top(vertical), right(horizontal), bottom(vertical) {}
    EdgeInsets(float l, float t, float r, float b) : left(l), top(t), right(r), bottom(b) {}

    float horizontal() const { return left + right; }
    float vertical() const { return top + bottom; }
    Vec2 total() const { return Vec2(horizontal(), vertical()); }
};

// Text styling
struct TextStyle {
    float size = 16.0f;
    Color color = colors::White;
};

// Corner radii, clockwise from top-left
struct CornerRadii {
    float top_left = 0.0f;
    float top_right = 0.0f;
    float bottom_right = 0.0f;
    float bottom_left = 0.0f;

    static CornerRadii uniform(float radius) {
        return CornerRadii{radius, radius, radius, radius};
    }
};

struct Shadow {
    Vec2 offset{0.0f};
    float blur = 0.0f;
    Color color = colors::Black;
};

// Frame background fills
struct SolidFill {
    Color color = colors::White;
};

struct LinearGradient {
    Color start = colors::White;
    Color end = colors::Black;
    float angle = 0.0f;     // Radians; 0 = left to right
};

struct RadialGradient {
    Color center = colors::White;
    Color edge = colors::Black;
};

using Fill = std::variant<SolidFill, LinearGradient, RadialGradient>;

// Rounded, bordered, optionally shadowed rectangle
struct FrameStyle {
    Fill fill = SolidFill{};
    float border_width = 0.0f;
    Color border_color = colors::Black;
    CornerRadii corner_radii;
    std::optional<Shadow> shadow;

    FrameStyle& with_background(const Color& color) {
        fill = SolidFill{color};
        return *this;
    }

    FrameStyle& with_linear_gradient(const Color& start, const Color& end, float angle) {
        fill = LinearGradient{start, end, angle};
        return *this;
    }

    FrameStyle& with_radial_gradient(const Color& center, const Color& edge) {
        fill = RadialGradient{center, edge};
        return *this;
    }

    FrameStyle& with_border(float width, const Color& color) {
        border_width = width;
        border_color = color;
        return *this;
    }

    FrameStyle& with_corner_radius(float radius) {
        corner_radii = CornerRadii::uniform(radius);
        return *this;
    }

    FrameStyle& with_shadow(Vec2 offset, float blur, const Color& color) {
        shadow = Shadow{offset, blur, color};
        return *this;
    }

    // False when nothing in the style would produce visible pixels
    bool is_visible() const;
};

} // namespace strata::ui
