#include <strata/ui/ui_context.hpp>
#include <strata/core/log.hpp>
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace strata::ui {

using core::log;
using core::LogLevel;

namespace {

constexpr float WINDOW_TITLE_HEIGHT = 24.0f;
constexpr float WINDOW_CONTENT_INSET = 8.0f;
const Color WINDOW_BACKGROUND = rgb(0.2f, 0.2f, 0.2f);
const Color WINDOW_TITLE_BAR = rgb(0.3f, 0.3f, 0.3f);

constexpr float SCROLLBAR_WIDTH = 8.0f;
constexpr float SCROLLBAR_INSET = 2.0f;
constexpr float SCROLLBAR_MIN_THUMB = 20.0f;
const Color SCROLLBAR_TRACK = rgba(0.0f, 0.0f, 0.0f, 0.1f);
const Color SCROLLBAR_THUMB = rgba(0.5f, 0.5f, 0.5f, 0.5f);

} // anonymous namespace

UIContext::UIContext()
    : UIContext(core::EngineSettings::get().ui) {
}

UIContext::UIContext(const core::UiSettings& settings)
    : m_layout(std::make_unique<StackLayout>(settings.default_margin, settings.default_spacing))
    , m_measurer(std::make_unique<ApproximateTextMeasurer>(settings.char_width_factor))
    , m_spacing(settings.default_spacing) {
    m_default_text.size = settings.default_text_size;
}

UIContext::~UIContext() = default;

void UIContext::set_layout_solver(std::unique_ptr<ILayoutSolver> solver) {
    if (!solver) {
        log(LogLevel::Warn, "UIContext: ignoring null layout solver");
        return;
    }
    m_layout = std::move(solver);
}

void UIContext::set_text_measurer(std::unique_ptr<ITextMeasurer> measurer) {
    if (!measurer) {
        log(LogLevel::Warn, "UIContext: ignoring null text measurer");
        return;
    }
    m_measurer = std::move(measurer);
}

// ============================================================================
// Frame lifecycle
// ============================================================================

void UIContext::begin_frame(const Rect& viewport) {
    if (m_in_frame) {
        log(LogLevel::Warn, "UIContext: begin_frame called twice; discarding the previous frame");
    }
    m_viewport = viewport;
    m_draw_list.clear();
    m_ids.reset();
    m_layout->begin_frame(viewport);
    m_observed.clear();
    m_hit_entries.clear();
    m_containers.clear();
    m_in_frame = true;
}

FrameOutput UIContext::end_frame() {
    require_frame("end_frame");

    if (!m_containers.empty()) {
        log(LogLevel::Error, "UIContext: {} container(s) still open at end_frame", m_containers.size());
        throw IdStackError("UIContext: unbalanced containers at frame end");
    }
    m_ids.check_balanced();

    m_in_frame = false;

    FrameOutput output;
    output.draw_list = std::move(m_draw_list);
    output.observed = std::move(m_observed);
    output.hit_entries = std::move(m_hit_entries);

    m_draw_list = DrawList();
    m_observed.clear();
    m_hit_entries.clear();
    return output;
}

void UIContext::require_frame(const char* operation) const {
    if (!m_in_frame) {
        log(LogLevel::Error, "UIContext: {} outside begin_frame/end_frame", operation);
        throw std::logic_error(std::string("UIContext: ") + operation + " outside a frame");
    }
}

WidgetId UIContext::next_id(const WidgetKey& key) {
    WidgetId id = m_ids.next_id(key);
    observe(id);
    return id;
}

// ============================================================================
// Leaf widgets
// ============================================================================

void UIContext::text(std::string_view text) {
    this->text(text, m_default_text);
}

void UIContext::text(std::string_view text, const TextStyle& style) {
    require_frame("text");
    WidgetId id = next_id();
    Rect bounds = m_layout->place(id, BoxStyle{}, m_measurer->measure(text, style));
    m_draw_list.add_text(bounds.position(), std::string(text), style);
}

void UIContext::rect(Vec2 size, const Color& color) {
    require_frame("rect");
    WidgetId id = next_id();
    BoxStyle box;
    box.size = size;
    Rect bounds = m_layout->place(id, box, size);
    m_draw_list.add_rect(bounds, color);
}

void UIContext::frame(Vec2 size, const FrameStyle& style) {
    require_frame("frame");
    WidgetId id = next_id();
    BoxStyle box;
    box.size = size;
    Rect bounds = m_layout->place(id, box, size);
    m_draw_list.add_frame(bounds, style);
}

void UIContext::space(float amount) {
    require_frame("space");
    m_layout->add_space(amount);
}

Response UIContext::button(std::string_view label, const WidgetKey& key) {
    return button(label, ButtonStyle{}, key);
}

Response UIContext::button(std::string_view label, const ButtonStyle& style, const WidgetKey& key) {
    require_frame("button");
    WidgetId id = next_id(key);

    BoxStyle box;
    box.padding = style.padding;
    Rect bounds = m_layout->place(id, box, m_measurer->measure(label, m_default_text));

    Response response = interact(id, bounds, true);

    Color fill = style.normal;
    if (response.active) {
        fill = style.active;
    } else if (response.hovered) {
        fill = style.hovered;
    }

    FrameStyle frame_style;
    frame_style.with_background(fill).with_corner_radius(style.corner_radius);
    if (response.focused) {
        frame_style.with_border(2.0f, style.focus_border);
    }
    m_draw_list.add_frame(bounds, frame_style);
    m_draw_list.add_text(bounds.position() + Vec2(style.padding.left, style.padding.top),
                         std::string(label), m_default_text);
    return response;
}

Response UIContext::interact(WidgetId id, const Rect& bounds, bool focusable) {
    observe(id);
    add_hit_entry(m_hit_entries.size(), id, bounds, focusable);

    Response response;
    response.id = id;
    response.bounds = bounds;
    if (m_interaction) {
        InteractionState state = m_interaction->state(id);
        response.hovered = state.hovered;
        response.active = state.active;
        response.focused = state.focused;
        response.clicked = m_interaction->take_click(id);
    }
    return response;
}

void UIContext::add_hit_entry(size_t index, WidgetId id, const Rect& bounds, bool focusable) {
    // Widgets scrolled or clipped entirely out of view take no input
    std::optional<Rect> clip = m_draw_list.current_clip();
    if (clip && !clip->intersects(bounds)) return;

    HitTestEntry entry{id, bounds, focusable, clip, enclosing_scroll_area()};
    m_hit_entries.insert(m_hit_entries.begin() + static_cast<std::ptrdiff_t>(index), entry);
}

std::optional<WidgetId> UIContext::enclosing_scroll_area() const {
    for (auto it = m_containers.rbegin(); it != m_containers.rend(); ++it) {
        if (it->scroll_area) return it->id;
    }
    return std::nullopt;
}

std::vector<InteractionEvent> UIContext::take_events(WidgetId id) {
    if (!m_interaction) return {};
    return m_interaction->take_events(id);
}

// ============================================================================
// Containers
// ============================================================================

ContainerOptions UIContext::direction_options(LayoutDirection direction) const {
    ContainerOptions options;
    options.box.direction = direction;
    options.box.spacing = m_spacing;
    return options;
}

WidgetId UIContext::begin_container(const ContainerOptions& options, const WidgetKey& key) {
    require_frame("begin_container");
    WidgetId id = m_ids.push_scope(key);
    observe(id);

    Rect available = m_layout->open_container(id, options.box);

    OpenContainer open;
    open.id = id;
    open.draw_mark = m_draw_list.mark();
    open.background = options.background;
    open.frame = options.frame;
    open.hit_testable = options.hit_testable;
    open.hit_mark = m_hit_entries.size();

    if (options.clip) {
        // Provisional; resized once the children have been laid out
        m_draw_list.push_clip(available);
        open.clip_index = m_draw_list.size() - 1;
    }

    m_containers.push_back(open);
    return id;
}

Rect UIContext::end_container() {
    require_frame("end_container");
    if (m_containers.empty() || m_containers.back().window || m_containers.back().scroll_area) {
        log(LogLevel::Error, "UIContext: end_container without matching begin_container");
        throw IdStackError("UIContext: end_container without matching begin_container");
    }

    OpenContainer open = m_containers.back();
    m_containers.pop_back();

    if (open.clip_index) {
        m_draw_list.pop_clip();
    }

    Rect bounds = m_layout->close_container(open.id);

    if (open.clip_index) {
        m_draw_list.resize_clip(*open.clip_index, bounds);
    }

    // Background goes underneath everything the children emitted
    if (open.frame) {
        m_draw_list.insert_frame(open.draw_mark, bounds, *open.frame);
    } else if (open.background) {
        m_draw_list.insert_rect(open.draw_mark, bounds, *open.background);
    }

    if (open.hit_testable) {
        add_hit_entry(open.hit_mark, open.id, bounds, false);
    }

    m_ids.pop_scope();
    return bounds;
}

void UIContext::begin_window(std::string_view title, Vec2 position, Vec2 size) {
    require_frame("begin_window");
    WidgetId id = m_ids.push_scope(WidgetKey(title));
    observe(id);

    BoxStyle box;
    box.position = position;
    box.size = size;
    box.spacing = m_spacing;
    box.padding = EdgeInsets(WINDOW_CONTENT_INSET, WINDOW_TITLE_HEIGHT + WINDOW_CONTENT_INSET,
                             WINDOW_CONTENT_INSET, WINDOW_CONTENT_INSET);
    m_layout->open_container(id, box);

    Rect bounds(position, size);
    m_draw_list.add_rect(bounds, WINDOW_BACKGROUND);
    m_draw_list.add_rect(Rect(position, Vec2(size.x, WINDOW_TITLE_HEIGHT)), WINDOW_TITLE_BAR);
    m_draw_list.add_text(position + Vec2(8.0f, 4.0f), std::string(title), m_default_text);

    // The window blocks hits to anything drawn before it
    add_hit_entry(m_hit_entries.size(), id, bounds, false);

    m_draw_list.push_clip(Rect(position + Vec2(0.0f, WINDOW_TITLE_HEIGHT),
                               Vec2(size.x, std::max(0.0f, size.y - WINDOW_TITLE_HEIGHT))));

    OpenContainer open;
    open.id = id;
    open.draw_mark = m_draw_list.mark();
    open.window = true;
    m_containers.push_back(open);
}

Rect UIContext::end_window() {
    require_frame("end_window");
    if (m_containers.empty() || !m_containers.back().window) {
        log(LogLevel::Error, "UIContext: end_window without matching begin_window");
        throw IdStackError("UIContext: end_window without matching begin_window");
    }

    OpenContainer open = m_containers.back();
    m_containers.pop_back();

    m_draw_list.pop_clip();
    Rect bounds = m_layout->close_container(open.id);
    m_ids.pop_scope();
    return bounds;
}

// ============================================================================
// Scroll areas
// ============================================================================

WidgetId UIContext::begin_scroll_area(const entity::Entity<ScrollState>& state, Vec2 size, const WidgetKey& key) {
    require_frame("begin_scroll_area");
    WidgetId id = m_ids.push_scope(key);
    observe(id);

    // Wheel input gathered since the previous frame
    Vec2 delta(0.0f);
    for (const auto& event : take_events(id)) {
        if (event.type == InteractionEventType::Scroll) {
            delta += event.scroll_delta;
        }
    }
    if (delta != Vec2(0.0f)) {
        state.update([delta](ScrollState& s) { s.apply_scroll(delta); });
    }
    Vec2 offset = state.read([](const ScrollState& s) { return s.offset; });

    BoxStyle viewport_box;
    viewport_box.size = size;
    Rect viewport = m_layout->open_container(id, viewport_box);

    OpenContainer open;
    open.id = id;
    open.scroll_area = true;
    open.scroll = state;
    open.hit_mark = m_hit_entries.size();

    m_draw_list.push_clip(viewport);
    open.draw_mark = m_draw_list.mark();

    // Children flow in an absolutely placed box shifted by the offset
    BoxStyle content_box;
    content_box.position = viewport.position() - offset;
    content_box.spacing = m_spacing;
    open.content_id = m_ids.next_id(WidgetKey("scroll_content"));
    m_layout->open_container(open.content_id, content_box);

    m_containers.push_back(open);
    return id;
}

Rect UIContext::end_scroll_area() {
    require_frame("end_scroll_area");
    if (m_containers.empty() || !m_containers.back().scroll_area) {
        log(LogLevel::Error, "UIContext: end_scroll_area without matching begin_scroll_area");
        throw IdStackError("UIContext: end_scroll_area without matching begin_scroll_area");
    }

    OpenContainer open = m_containers.back();
    m_containers.pop_back();

    Rect content = m_layout->close_container(open.content_id);
    m_draw_list.pop_clip();
    Rect bounds = m_layout->close_container(open.id);

    // Extents bound next frame's offset; the entity only changes when they do
    ScrollState current = open.scroll.read([](const ScrollState& s) { return s; });
    ScrollState next = current;
    next.content_size = content.size();
    next.viewport_size = bounds.size();
    next.clamp_offset();
    if (next != current) {
        open.scroll.update([&next](ScrollState& s) { s = next; });
    }

    if (next.content_size.y > bounds.height) {
        float track_height = std::max(0.0f, bounds.height - 2.0f * SCROLLBAR_INSET);
        float visible = std::min(1.0f, bounds.height / next.content_size.y);
        float thumb_height = std::min(track_height, std::max(track_height * visible, SCROLLBAR_MIN_THUMB));
        float max_scroll = next.max_offset().y;
        float ratio = max_scroll > 0.0f ? next.offset.y / max_scroll : 0.0f;

        Rect track(bounds.right() - SCROLLBAR_WIDTH - SCROLLBAR_INSET, bounds.y + SCROLLBAR_INSET,
                   SCROLLBAR_WIDTH, track_height);
        Rect thumb(track.x, track.y + (track_height - thumb_height) * ratio, SCROLLBAR_WIDTH, thumb_height);

        FrameStyle track_style;
        track_style.with_background(SCROLLBAR_TRACK).with_corner_radius(SCROLLBAR_WIDTH * 0.5f);
        FrameStyle thumb_style;
        thumb_style.with_background(SCROLLBAR_THUMB).with_corner_radius(SCROLLBAR_WIDTH * 0.5f);
        m_draw_list.add_frame(track, track_style);
        m_draw_list.add_frame(thumb, thumb_style);
    }

    // Underneath the children so they keep their own clicks; wheel input
    // over them is redirected here through scroll_target
    std::optional<Rect> clip = m_draw_list.current_clip();
    if (!clip || clip->intersects(bounds)) {
        m_hit_entries.insert(m_hit_entries.begin() + static_cast<std::ptrdiff_t>(open.hit_mark),
                             HitTestEntry{open.id, bounds, false, clip});
    }

    m_ids.pop_scope();
    return bounds;
}

} // namespace strata::ui
