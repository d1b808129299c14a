#include <strata/layer/layer_manager.hpp>
#include <strata/core/engine_settings.hpp>
#include <strata/core/log.hpp>
#include <algorithm>
#include <stdexcept>

namespace strata::layer {

using core::log;
using core::LogLevel;

namespace {

// Sets a flag for the enclosing scope and restores its previous value on
// exit, including by exception, so nested scopes unwind correctly
struct FlagScope {
    explicit FlagScope(bool& flag) : m_flag(flag), m_previous(flag) { m_flag = true; }
    ~FlagScope() { m_flag = m_previous; }

    FlagScope(const FlagScope&) = delete;
    FlagScope& operator=(const FlagScope&) = delete;

private:
    bool& m_flag;
    bool m_previous;
};

bool is_mouse_event(const ui::InputEvent& event) {
    return std::holds_alternative<ui::PointerMove>(event) ||
           std::holds_alternative<ui::PointerDown>(event) ||
           std::holds_alternative<ui::PointerUp>(event) ||
           std::holds_alternative<ui::Scroll>(event);
}

} // anonymous namespace

InputOcclusion parse_input_occlusion(std::string_view name) {
    if (name == "blanket") return InputOcclusion::Blanket;
    if (name == "hit_test") return InputOcclusion::HitTest;

    log(LogLevel::Warn, "LayerManager: unknown input occlusion '{}', using blanket", name);
    return InputOcclusion::Blanket;
}

const char* input_occlusion_name(InputOcclusion occlusion) {
    switch (occlusion) {
        case InputOcclusion::Blanket: return "blanket";
        case InputOcclusion::HitTest: return "hit_test";
    }
    return "unknown";
}

LayerManager::LayerManager()
    : LayerManager(entity::EntityStore::get(),
                   parse_input_occlusion(core::EngineSettings::get().input.occlusion)) {
}

LayerManager::LayerManager(entity::EntityStore& entities)
    : LayerManager(entities, InputOcclusion::Blanket) {
}

LayerManager::LayerManager(entity::EntityStore& entities, InputOcclusion occlusion)
    : m_entities(entities), m_occlusion(occlusion) {
}

LayerManager::~LayerManager() = default;

// ============================================================================
// Registration
// ============================================================================

LayerId LayerManager::add_layer(int z_index, std::unique_ptr<Layer> layer) {
    if (!layer) {
        log(LogLevel::Error, "LayerManager: add_layer called with a null layer");
        return LayerId{};
    }

    Entry entry;
    entry.id = LayerId{m_next_id++};
    entry.z_index = z_index;
    entry.sequence = m_next_sequence++;
    LayerKind kind = layer->kind();
    entry.layer = std::move(layer);
    LayerId id = entry.id;

    if (deferring()) {
        m_pending_adds.push_back(std::move(entry));
        log(LogLevel::Debug, "LayerManager: queued {} layer {} at z={} until the current frame or event completes",
            layer_kind_name(kind), id.id, z_index);
        return id;
    }

    m_layers.push_back(std::move(entry));
    sort_layers();
    m_layers_changed = true;
    log(LogLevel::Debug, "LayerManager: added {} layer {} at z={}", layer_kind_name(kind), id.id, z_index);
    return id;
}

LayerId LayerManager::add_raw_layer(int z_index, const LayerOptions& options, RawLayerCallback callback,
                                    RawInputHandler input_handler) {
    return add_layer(z_index, std::make_unique<RawLayer>(options, std::move(callback), std::move(input_handler)));
}

LayerId LayerManager::add_ui_layer(int z_index, const LayerOptions& options, UiLayerCallback callback) {
    return add_layer(z_index, std::make_unique<UiLayer>(options, std::move(callback)));
}

bool LayerManager::replace_layer(LayerId id, int z_index, std::unique_ptr<Layer> layer) {
    if (deferring()) {
        log(LogLevel::Error, "LayerManager: replace_layer({}) called while rendering or dispatching input", id.id);
        throw std::logic_error("LayerManager: replace_layer inside a render callback or input handler");
    }
    if (!layer) {
        log(LogLevel::Error, "LayerManager: replace_layer({}) called with a null layer", id.id);
        return false;
    }

    Entry* entry = find(id);
    if (!entry) {
        log(LogLevel::Warn, "LayerManager: replace_layer({}) on unknown layer", id.id);
        return false;
    }

    entry->z_index = z_index;
    entry->layer = std::move(layer);
    if (m_pointer_target == id) {
        m_pointer_target.reset();
    }
    sort_layers();
    m_layers_changed = true;
    log(LogLevel::Debug, "LayerManager: replaced layer {} ({} at z={})", id.id,
        layer_kind_name(entry->layer->kind()), z_index);
    return true;
}

bool LayerManager::remove_layer(LayerId id) {
    if (deferring()) {
        bool queued_add = std::any_of(m_pending_adds.begin(), m_pending_adds.end(),
                                      [id](const Entry& e) { return e.id == id; });
        if (!find(id) && !queued_add) {
            log(LogLevel::Warn, "LayerManager: remove_layer({}) on unknown layer", id.id);
            return false;
        }
        m_pending_removals.push_back(id);
        return true;
    }

    auto it = std::find_if(m_layers.begin(), m_layers.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == m_layers.end()) {
        log(LogLevel::Warn, "LayerManager: remove_layer({}) on unknown layer", id.id);
        return false;
    }

    m_layers.erase(it);
    if (m_pointer_target == id) {
        m_pointer_target.reset();
    }
    m_layers_changed = true;
    log(LogLevel::Debug, "LayerManager: removed layer {}", id.id);
    return true;
}

void LayerManager::clear() {
    if (deferring()) {
        log(LogLevel::Error, "LayerManager: clear called while rendering or dispatching input");
        throw std::logic_error("LayerManager: clear inside a render callback or input handler");
    }
    m_layers.clear();
    m_pending_adds.clear();
    m_pending_removals.clear();
    m_pointer_target.reset();
    m_layers_changed = true;
    log(LogLevel::Debug, "LayerManager: cleared all layers");
}

void LayerManager::apply_pending() {
    // An enclosing render or dispatch still walks m_layers
    if (deferring()) return;
    if (m_pending_adds.empty() && m_pending_removals.empty()) return;

    for (auto& entry : m_pending_adds) {
        m_layers.push_back(std::move(entry));
    }
    m_pending_adds.clear();

    for (LayerId id : m_pending_removals) {
        auto it = std::find_if(m_layers.begin(), m_layers.end(),
                               [id](const Entry& e) { return e.id == id; });
        if (it != m_layers.end()) {
            m_layers.erase(it);
            if (m_pointer_target == id) {
                m_pointer_target.reset();
            }
        }
    }
    m_pending_removals.clear();

    sort_layers();
    m_layers_changed = true;
}

void LayerManager::sort_layers() {
    std::sort(m_layers.begin(), m_layers.end(), [](const Entry& a, const Entry& b) {
        if (a.z_index != b.z_index) return a.z_index < b.z_index;
        return a.sequence < b.sequence;
    });
}

LayerManager::Entry* LayerManager::find(LayerId id) {
    for (auto& entry : m_layers) {
        if (entry.id == id) return &entry;
    }
    return nullptr;
}

const LayerManager::Entry* LayerManager::find(LayerId id) const {
    for (const auto& entry : m_layers) {
        if (entry.id == id) return &entry;
    }
    return nullptr;
}

Layer* LayerManager::get_layer(LayerId id) {
    Entry* entry = find(id);
    return entry ? entry->layer.get() : nullptr;
}

const Layer* LayerManager::get_layer(LayerId id) const {
    const Entry* entry = find(id);
    return entry ? entry->layer.get() : nullptr;
}

std::optional<int> LayerManager::z_index(LayerId id) const {
    const Entry* entry = find(id);
    if (!entry) return std::nullopt;
    return entry->z_index;
}

std::vector<LayerId> LayerManager::layer_order() const {
    std::vector<LayerId> order;
    order.reserve(m_layers.size());
    for (const auto& entry : m_layers) {
        order.push_back(entry.id);
    }
    return order;
}

// ============================================================================
// Rendering
// ============================================================================

FrameComposition LayerManager::render_frame(Vec2 size, float scale_factor) {
    if (m_rendering) {
        log(LogLevel::Error, "LayerManager: render_frame called from inside a render callback");
        throw std::logic_error("LayerManager: re-entrant render_frame");
    }

    FrameComposition composition;
    composition.size = size;
    composition.scale_factor = scale_factor;

    m_entities.clear_invalidation();
    m_layers_changed = false;

    {
        FlagScope rendering(m_rendering);
        FrameInfo frame{size, scale_factor};

        for (auto& entry : m_layers) {
            LayerOutput output;
            output.id = entry.id;
            output.kind = entry.layer->kind();
            output.z_index = entry.z_index;
            output.options = entry.layer->options();
            output.is_first = composition.layers.empty();
            output.content = entry.layer->render(frame, m_entities);
            composition.layers.push_back(std::move(output));
        }
    }

    apply_pending();
    m_input_since_render = false;

    // Observers see this frame's mutations; a change requests another frame
    m_entities.flush();

    log(LogLevel::Trace, "LayerManager: composed {} layer(s) at {}x{}",
        composition.layers.size(), size.x, size.y);
    return composition;
}

FrameComposition LayerManager::render_frame(IRenderer& renderer, Vec2 size, float scale_factor) {
    FrameComposition composition = render_frame(size, scale_factor);
    renderer.submit(composition);
    return composition;
}

bool LayerManager::needs_redraw() const {
    if (m_input_since_render || m_layers_changed) return true;
    if (m_entities.invalidation_requested() || m_entities.has_pending_changes()) return true;

    return std::any_of(m_layers.begin(), m_layers.end(), [](const Entry& entry) {
        return entry.layer->next_frame_requested() || entry.layer->has_pending_input();
    });
}

// ============================================================================
// Input routing
// ============================================================================

LayerManager::Entry* LayerManager::topmost_input_layer() {
    for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it) {
        if (it->layer->options().receives_input) {
            return &*it;
        }
    }
    return nullptr;
}

LayerManager::Entry* LayerManager::select_key_target() {
    // The layer holding keyboard focus, else the topmost input layer
    for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it) {
        if (it->layer->options().receives_input && it->layer->has_focus()) {
            return &*it;
        }
    }
    return topmost_input_layer();
}

LayerManager::Entry* LayerManager::select_pointer_target(const ui::InputEvent& event) {
    Entry* target = nullptr;

    // A layer tracking a press keeps the pointer until release
    for (auto it = m_layers.rbegin(); it != m_layers.rend() && !target; ++it) {
        if (it->layer->options().receives_input && it->layer->is_capturing()) {
            target = &*it;
        }
    }

    if (!target) {
        if (std::holds_alternative<ui::PointerLeave>(event)) {
            if (m_pointer_target) {
                target = find(*m_pointer_target);
            }
        } else if (auto position = ui::event_position(event)) {
            for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it) {
                if (it->layer->options().receives_input && it->layer->claims(*position)) {
                    target = &*it;
                    break;
                }
            }
        }
    }

    if (is_mouse_event(event)) {
        // The layer that had the mouse last sees it leave
        if (m_pointer_target && (!target || target->id != *m_pointer_target)) {
            if (Entry* previous = find(*m_pointer_target)) {
                previous->layer->handle_input(ui::PointerLeave{});
            }
        }
        m_pointer_target = target ? std::optional<LayerId>(target->id) : std::nullopt;
    } else if (std::holds_alternative<ui::PointerLeave>(event)) {
        m_pointer_target.reset();
    }

    return target;
}

std::optional<LayerId> LayerManager::route_input(const ui::InputEvent& event) {
    std::optional<LayerId> delivered;
    {
        FlagScope dispatching(m_dispatching);
        delivered = dispatch_input(event);
    }
    apply_pending();
    return delivered;
}

std::optional<LayerId> LayerManager::dispatch_input(const ui::InputEvent& event) {
    Entry* target = nullptr;

    if (m_occlusion == InputOcclusion::Blanket) {
        target = topmost_input_layer();
    } else if (ui::is_pointer_event(event)) {
        target = select_pointer_target(event);
    } else {
        target = select_key_target();
    }

    if (!target) {
        log(LogLevel::Trace, "LayerManager: no layer takes the input event");
        return std::nullopt;
    }

    // Handlers may register or remove layers; those changes are queued
    // until the event has been delivered
    LayerId id = target->id;
    target->layer->handle_input(event);
    m_input_since_render = true;
    return id;
}

} // namespace strata::layer
