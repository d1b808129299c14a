#pragma once

#include <strata/ui/ui_types.hpp>
#include <strata/ui/widget_id.hpp>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata::ui {

// Box constraints handed to the layout solver
struct BoxStyle {
    LayoutDirection direction = LayoutDirection::Vertical;  // Child flow (containers)
    float spacing = 5.0f;                                   // Gap between children
    EdgeInsets padding;
    std::optional<Vec2> size;       // Fixed size; otherwise fit content
    std::optional<Vec2> position;   // Absolute placement; skips the parent flow
};

// Layout solver seam. Boxes are registered as a tree keyed by WidgetId;
// resolved rectangles are queried synchronously during the same frame.
class ILayoutSolver {
public:
    virtual ~ILayoutSolver() = default;

    virtual void begin_frame(const Rect& viewport) = 0;

    // Start a container; returns the rectangle its content may occupy
    virtual Rect open_container(WidgetId id, const BoxStyle& style) = 0;
    // Finish the innermost container; returns its resolved bounds
    virtual Rect close_container(WidgetId id) = 0;

    // Leaf box with intrinsic content size
    virtual Rect place(WidgetId id, const BoxStyle& style, Vec2 content_size) = 0;

    // Empty gap along the current container's flow
    virtual void add_space(float amount) = 0;

    virtual std::optional<Rect> bounds(WidgetId id) const = 0;
};

// Flow layout: children stack along the container direction with fixed
// spacing; containers size to fit their content plus padding.
class StackLayout : public ILayoutSolver {
public:
    explicit StackLayout(float margin = 10.0f, float spacing = 5.0f);

    void begin_frame(const Rect& viewport) override;
    Rect open_container(WidgetId id, const BoxStyle& style) override;
    Rect close_container(WidgetId id) override;
    Rect place(WidgetId id, const BoxStyle& style, Vec2 content_size) override;
    void add_space(float amount) override;
    std::optional<Rect> bounds(WidgetId id) const override;

    void set_margin(float margin) { m_margin = margin; }
    float get_margin() const { return m_margin; }
    void set_spacing(float spacing) { m_spacing = spacing; }
    float get_spacing() const { return m_spacing; }

    size_t open_depth() const { return m_frames.size() - 1; }

private:
    struct Frame {
        WidgetId id;
        Vec2 origin{0.0f};
        Vec2 cursor{0.0f};
        Vec2 content_start{0.0f};
        LayoutDirection direction = LayoutDirection::Vertical;
        float spacing = 0.0f;
        float max_cross = 0.0f;
        bool has_children = false;
        EdgeInsets padding;
        std::optional<Vec2> fixed_size;
        bool absolute = false;
    };

    void advance(Frame& frame, Vec2 size);

    Rect m_viewport;
    float m_margin;
    float m_spacing;
    std::vector<Frame> m_frames;
    std::unordered_map<WidgetId, Rect> m_bounds;
};

// Text metrics seam
class ITextMeasurer {
public:
    virtual ~ITextMeasurer() = default;
    virtual Vec2 measure(std::string_view text, const TextStyle& style) const = 0;
};

// Monospace approximation: every character is size * factor wide
class ApproximateTextMeasurer : public ITextMeasurer {
public:
    explicit ApproximateTextMeasurer(float char_width_factor = 0.6f)
        : m_char_width_factor(char_width_factor) {}

    Vec2 measure(std::string_view text, const TextStyle& style) const override {
        return Vec2(static_cast<float>(text.size()) * style.size * m_char_width_factor, style.size);
    }

private:
    float m_char_width_factor;
};

} // namespace strata::ui
