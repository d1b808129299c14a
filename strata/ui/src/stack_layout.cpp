#include <strata/ui/layout.hpp>
#include <strata/core/log.hpp>
#include <algorithm>
#include <stdexcept>

namespace strata::ui {

StackLayout::StackLayout(float margin, float spacing)
    : m_margin(margin), m_spacing(spacing) {
    begin_frame(Rect());
}

void StackLayout::begin_frame(const Rect& viewport) {
    m_viewport = viewport;
    m_bounds.clear();
    m_frames.clear();

    Frame root;
    root.origin = viewport.position();
    root.content_start = viewport.position() + Vec2(m_margin, m_margin);
    root.cursor = root.content_start;
    root.spacing = m_spacing;
    m_frames.push_back(root);
}

void StackLayout::advance(Frame& frame, Vec2 size) {
    if (frame.direction == LayoutDirection::Vertical) {
        frame.cursor.y += size.y + frame.spacing;
        frame.max_cross = std::max(frame.max_cross, size.x);
    } else {
        frame.cursor.x += size.x + frame.spacing;
        frame.max_cross = std::max(frame.max_cross, size.y);
    }
    frame.has_children = true;
}

Rect StackLayout::open_container(WidgetId id, const BoxStyle& style) {
    Frame& parent = m_frames.back();

    Frame frame;
    frame.id = id;
    frame.absolute = style.position.has_value();
    frame.origin = style.position.value_or(parent.cursor);
    frame.content_start = frame.origin + Vec2(style.padding.left, style.padding.top);
    frame.cursor = frame.content_start;
    frame.direction = style.direction;
    frame.spacing = style.spacing;
    frame.padding = style.padding;
    frame.fixed_size = style.size;
    m_frames.push_back(frame);

    // Content may extend to the fixed size, or to the viewport edge
    Vec2 extent = style.size.value_or(
        Vec2(std::max(0.0f, m_viewport.right() - frame.origin.x),
             std::max(0.0f, m_viewport.bottom() - frame.origin.y)));
    return Rect(frame.origin, extent);
}

Rect StackLayout::close_container(WidgetId id) {
    if (m_frames.size() <= 1 || m_frames.back().id != id) {
        core::log(core::LogLevel::Error, "StackLayout: close_container({}) does not match the open container",
                  id.value());
        throw std::logic_error("StackLayout: mismatched close_container");
    }

    Frame frame = m_frames.back();
    m_frames.pop_back();

    Vec2 content(0.0f);
    if (frame.has_children) {
        if (frame.direction == LayoutDirection::Vertical) {
            content = Vec2(frame.max_cross, frame.cursor.y - frame.content_start.y - frame.spacing);
        } else {
            content = Vec2(frame.cursor.x - frame.content_start.x - frame.spacing, frame.max_cross);
        }
    }

    Vec2 size = frame.fixed_size.value_or(content + frame.padding.total());
    Rect rect(frame.origin, size);
    m_bounds[id] = rect;

    if (!frame.absolute) {
        advance(m_frames.back(), size);
    }
    return rect;
}

Rect StackLayout::place(WidgetId id, const BoxStyle& style, Vec2 content_size) {
    Frame& parent = m_frames.back();

    Vec2 size = style.size.value_or(content_size + style.padding.total());
    Vec2 position = style.position.value_or(parent.cursor);
    Rect rect(position, size);
    m_bounds[id] = rect;

    if (!style.position) {
        advance(parent, size);
    }
    return rect;
}

void StackLayout::add_space(float amount) {
    Frame& frame = m_frames.back();
    if (frame.direction == LayoutDirection::Vertical) {
        frame.cursor.y += amount;
    } else {
        frame.cursor.x += amount;
    }
}

std::optional<Rect> StackLayout::bounds(WidgetId id) const {
    auto it = m_bounds.find(id);
    if (it == m_bounds.end()) return std::nullopt;
    return it->second;
}

} // namespace strata::ui
