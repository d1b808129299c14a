#pragma once

#include <strata/ui/ui_types.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::ui {

// Draw command payloads
struct FilledRect {
    Rect rect;
    Color color;
};

struct FrameShape {
    Rect rect;
    FrameStyle style;
};

struct TextRun {
    Vec2 position{0.0f};
    std::string text;
    TextStyle style;
};

struct ClipPush {
    Rect rect;
};

struct ClipPop {};

using DrawPayload = std::variant<FilledRect, FrameShape, TextRun, ClipPush, ClipPop>;

// One emitted drawing operation; immutable once in the list
struct DrawCommand {
    uint32_t order = 0;     // Emission sequence, stable tiebreak for equal depth
    DrawPayload payload;

    template<typename T>
    bool is() const { return std::holds_alternative<T>(payload); }

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&payload); }
};

/**
 * @brief Ordered list of draw commands for one layer and one frame
 *
 * Command order is paint order: later commands paint over earlier ones.
 * insert_before() lets a container emit its background after its children
 * while keeping the background underneath them.
 *
 * @code
 * size_t mark = list.mark();
 * ... emit children ...
 * list.insert_rect(mark, bounds, background);
 * @endcode
 */
class DrawList {
public:
    DrawList() = default;

    // Raw sequence operations
    size_t append(DrawPayload payload);
    void insert_before(size_t index, DrawPayload payload);

    // Current end position, for a later insert_before
    size_t mark() const { return m_commands.size(); }

    // Builders; fully transparent or empty payloads are skipped
    void add_rect(const Rect& rect, const Color& color);
    void insert_rect(size_t index, const Rect& rect, const Color& color);
    void add_frame(const Rect& rect, const FrameStyle& style);
    void insert_frame(size_t index, const Rect& rect, const FrameStyle& style);
    void add_text(Vec2 position, std::string text, const TextStyle& style);

    // Clipping; nested clips are intersected with the enclosing one
    void push_clip(const Rect& rect);
    void pop_clip();
    std::optional<Rect> current_clip() const;
    size_t clip_depth() const { return m_clip_stack.size(); }

    // Replace the rectangle of an emitted ClipPush (container bounds known late)
    void resize_clip(size_t index, const Rect& rect);

    void clear();

    const std::vector<DrawCommand>& commands() const { return m_commands; }
    const DrawCommand& operator[](size_t index) const { return m_commands[index]; }
    size_t size() const { return m_commands.size(); }
    bool empty() const { return m_commands.empty(); }

    auto begin() const { return m_commands.begin(); }
    auto end() const { return m_commands.end(); }

private:
    // Clip in effect just before the command at index
    std::optional<Rect> enclosing_clip(size_t index) const;
    static Rect intersect_clip(const std::optional<Rect>& parent, const Rect& rect);

    std::vector<DrawCommand> m_commands;
    std::vector<Rect> m_clip_stack;
    uint32_t m_next_order = 0;
};

} // namespace strata::ui
