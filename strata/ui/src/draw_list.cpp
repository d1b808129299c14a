#include <strata/ui/draw_list.hpp>
#include <strata/core/log.hpp>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace strata::ui {

bool FrameStyle::is_visible() const {
    bool visible_fill = std::visit([](const auto& f) {
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, SolidFill>) {
            return f.color.a > 0.0f;
        } else if constexpr (std::is_same_v<T, LinearGradient>) {
            return f.start.a > 0.0f || f.end.a > 0.0f;
        } else {
            return f.center.a > 0.0f || f.edge.a > 0.0f;
        }
    }, fill);
    bool visible_border = border_width > 0.0f && border_color.a > 0.0f;
    bool visible_shadow = shadow.has_value() && shadow->color.a > 0.0f;
    return visible_fill || visible_border || visible_shadow;
}

size_t DrawList::append(DrawPayload payload) {
    m_commands.push_back(DrawCommand{m_next_order++, std::move(payload)});
    return m_commands.size() - 1;
}

void DrawList::insert_before(size_t index, DrawPayload payload) {
    if (index > m_commands.size()) {
        index = m_commands.size();
    }
    m_commands.insert(m_commands.begin() + static_cast<std::ptrdiff_t>(index),
                      DrawCommand{m_next_order++, std::move(payload)});
}

void DrawList::add_rect(const Rect& rect, const Color& color) {
    if (color.a <= 0.0f) return;
    append(FilledRect{rect, color});
}

void DrawList::insert_rect(size_t index, const Rect& rect, const Color& color) {
    if (color.a <= 0.0f) return;
    insert_before(index, FilledRect{rect, color});
}

void DrawList::add_frame(const Rect& rect, const FrameStyle& style) {
    if (!style.is_visible()) return;
    append(FrameShape{rect, style});
}

void DrawList::insert_frame(size_t index, const Rect& rect, const FrameStyle& style) {
    if (!style.is_visible()) return;
    insert_before(index, FrameShape{rect, style});
}

void DrawList::add_text(Vec2 position, std::string text, const TextStyle& style) {
    if (text.empty()) return;
    append(TextRun{position, std::move(text), style});
}

Rect DrawList::intersect_clip(const std::optional<Rect>& parent, const Rect& rect) {
    if (!parent) return rect;
    if (auto overlap = parent->intersect(rect)) {
        return *overlap;
    }
    // Disjoint: zero-sized clip so nothing inside is visible
    return Rect(rect.x, rect.y, 0.0f, 0.0f);
}

void DrawList::push_clip(const Rect& rect) {
    Rect clip = intersect_clip(current_clip(), rect);
    m_clip_stack.push_back(clip);
    append(ClipPush{clip});
}

void DrawList::pop_clip() {
    if (m_clip_stack.empty()) {
        core::log(core::LogLevel::Warn, "DrawList: pop_clip with no clip pushed");
        return;
    }
    m_clip_stack.pop_back();
    append(ClipPop{});
}

std::optional<Rect> DrawList::current_clip() const {
    if (m_clip_stack.empty()) return std::nullopt;
    return m_clip_stack.back();
}

std::optional<Rect> DrawList::enclosing_clip(size_t index) const {
    std::vector<Rect> stack;
    for (size_t i = 0; i < index && i < m_commands.size(); ++i) {
        if (const auto* push = m_commands[i].get_if<ClipPush>()) {
            stack.push_back(push->rect);
        } else if (m_commands[i].is<ClipPop>() && !stack.empty()) {
            stack.pop_back();
        }
    }
    if (stack.empty()) return std::nullopt;
    return stack.back();
}

void DrawList::resize_clip(size_t index, const Rect& rect) {
    if (index >= m_commands.size() || !m_commands[index].is<ClipPush>()) {
        core::log(core::LogLevel::Warn, "DrawList: resize_clip target {} is not a clip", index);
        return;
    }
    Rect clip = intersect_clip(enclosing_clip(index), rect);
    std::get<ClipPush>(m_commands[index].payload).rect = clip;
}

void DrawList::clear() {
    m_commands.clear();
    m_clip_stack.clear();
    m_next_order = 0;
}

} // namespace strata::ui
