#pragma once

#include <strata/core/engine_settings.hpp>
#include <strata/entity/entity_store.hpp>
#include <strata/ui/draw_list.hpp>
#include <strata/ui/interaction.hpp>
#include <strata/ui/layout.hpp>
#include <strata/ui/scroll_state.hpp>
#include <strata/ui/widget_id.hpp>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace strata::ui {

// Everything one declarative pass produced
struct FrameOutput {
    DrawList draw_list;
    std::unordered_set<WidgetId> observed;      // Every id generated this frame
    std::vector<HitTestEntry> hit_entries;      // Paint order
};

// Interaction summary returned by interactive widgets
struct Response {
    WidgetId id;
    Rect bounds;
    bool hovered = false;
    bool active = false;
    bool focused = false;
    bool clicked = false;
};

// Options for generic containers
struct ContainerOptions {
    BoxStyle box;
    std::optional<Color> background;    // Plain rectangle behind the children
    std::optional<FrameStyle> frame;    // Styled frame behind the children
    bool clip = false;                  // Clip children to the container bounds
    bool hit_testable = false;          // Block hits to widgets underneath
};

// Visual style for button()
struct ButtonStyle {
    Color normal = rgb(0.25f, 0.25f, 0.3f);
    Color hovered = rgb(0.35f, 0.35f, 0.42f);
    Color active = rgb(0.15f, 0.15f, 0.2f);
    Color focus_border = rgb(0.4f, 0.6f, 1.0f);
    float corner_radius = 4.0f;
    EdgeInsets padding{12.0f, 6.0f};
};

/**
 * @brief Drives one declarative render pass for one UI layer
 *
 * Each frame: begin_frame(), a sequence of widget calls, end_frame(). Widget
 * calls compute their WidgetId from the identity stack, ask the layout solver
 * for a box, query the attached InteractionSystem (if any) for interactive
 * widgets, and emit draw commands in paint order.
 *
 * @code
 * ui.begin_frame(Rect(0, 0, 800, 600));
 * ui.horizontal([&] {
 *     if (ui.button("+", "inc").clicked) ++count;
 *     if (ui.button("-", "dec").clicked) --count;
 * });
 * FrameOutput out = ui.end_frame();
 * @endcode
 */
class UIContext {
public:
    UIContext();
    explicit UIContext(const core::UiSettings& settings);
    ~UIContext();

    UIContext(const UIContext&) = delete;
    UIContext& operator=(const UIContext&) = delete;

    // Collaborators
    void set_layout_solver(std::unique_ptr<ILayoutSolver> solver);
    ILayoutSolver& layout_solver() { return *m_layout; }
    void set_text_measurer(std::unique_ptr<ITextMeasurer> measurer);
    const ITextMeasurer& text_measurer() const { return *m_measurer; }

    // Non-owning; interactive widgets report idle state when unset
    void set_interaction(InteractionSystem* interaction) { m_interaction = interaction; }
    InteractionSystem* interaction() const { return m_interaction; }

    // Frame lifecycle
    void begin_frame(const Rect& viewport);
    // Throws IdStackError if containers or scopes are still open
    FrameOutput end_frame();
    bool in_frame() const { return m_in_frame; }
    const Rect& viewport() const { return m_viewport; }

    // Leaf widgets
    void text(std::string_view text);
    void text(std::string_view text, const TextStyle& style);
    void rect(Vec2 size, const Color& color);
    void frame(Vec2 size, const FrameStyle& style);
    void space(float amount);

    Response button(std::string_view label, const WidgetKey& key = {});
    Response button(std::string_view label, const ButtonStyle& style, const WidgetKey& key = {});

    // Containers (explicit begin/end)
    WidgetId begin_container(const ContainerOptions& options, const WidgetKey& key = {});
    Rect end_container();

    // Containers (scoped)
    template<typename F>
    Rect container(const ContainerOptions& options, F&& body, const WidgetKey& key = {}) {
        begin_container(options, key);
        std::forward<F>(body)();
        return end_container();
    }

    template<typename F>
    Rect vertical(F&& body) {
        return container(direction_options(LayoutDirection::Vertical), std::forward<F>(body));
    }

    template<typename F>
    Rect horizontal(F&& body) {
        return container(direction_options(LayoutDirection::Horizontal), std::forward<F>(body));
    }

    // Rounded/bordered frame sized to its children; children are clipped to it
    template<typename F>
    Rect frame_container(const FrameStyle& style, F&& body, float padding = 0.0f) {
        ContainerOptions options = direction_options(LayoutDirection::Vertical);
        options.box.padding = EdgeInsets(padding);
        options.frame = style;
        options.clip = true;
        return container(options, std::forward<F>(body));
    }

    // Fixed window at an absolute position with a title bar; content is clipped
    template<typename F>
    Rect window(std::string_view title, Vec2 position, Vec2 size, F&& body) {
        begin_window(title, position, size);
        std::forward<F>(body)();
        return end_window();
    }

    void begin_window(std::string_view title, Vec2 position, Vec2 size);
    Rect end_window();

    // Fixed-size viewport onto vertically stacked children. The offset lives
    // in `state`; wheel input over the area or any of its children moves it,
    // and a scrollbar is drawn while the content overflows.
    template<typename F>
    Rect scroll_area(const entity::Entity<ScrollState>& state, Vec2 size, F&& body, const WidgetKey& key = {}) {
        begin_scroll_area(state, size, key);
        std::forward<F>(body)();
        return end_scroll_area();
    }

    WidgetId begin_scroll_area(const entity::Entity<ScrollState>& state, Vec2 size, const WidgetKey& key = {});
    Rect end_scroll_area();

    // Custom widgets
    WidgetId next_id(const WidgetKey& key = {});
    Response interact(WidgetId id, const Rect& bounds, bool focusable);
    std::vector<InteractionEvent> take_events(WidgetId id);

    // Introspection
    const DrawList& draw_list() const { return m_draw_list; }
    size_t scope_depth() const { return m_ids.depth(); }
    const TextStyle& default_text_style() const { return m_default_text; }

private:
    struct OpenContainer {
        WidgetId id;
        size_t draw_mark = 0;
        std::optional<size_t> clip_index;
        std::optional<Color> background;
        std::optional<FrameStyle> frame;
        bool hit_testable = false;
        size_t hit_mark = 0;
        bool window = false;
        bool scroll_area = false;
        WidgetId content_id;                    // Offset child container of a scroll area
        entity::Entity<ScrollState> scroll;
    };

    // Innermost open scroll area; wheel input over its children goes there
    std::optional<WidgetId> enclosing_scroll_area() const;
    void add_hit_entry(size_t index, WidgetId id, const Rect& bounds, bool focusable);

    ContainerOptions direction_options(LayoutDirection direction) const;
    void observe(WidgetId id) { m_observed.insert(id); }
    void require_frame(const char* operation) const;

    std::unique_ptr<ILayoutSolver> m_layout;
    std::unique_ptr<ITextMeasurer> m_measurer;
    InteractionSystem* m_interaction = nullptr;

    IdStack m_ids;
    DrawList m_draw_list;
    std::unordered_set<WidgetId> m_observed;
    std::vector<HitTestEntry> m_hit_entries;
    std::vector<OpenContainer> m_containers;

    Rect m_viewport;
    TextStyle m_default_text;
    float m_spacing = 5.0f;
    bool m_in_frame = false;
};

} // namespace strata::ui
