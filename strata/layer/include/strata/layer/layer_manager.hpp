#pragma once

#include <strata/layer/layer.hpp>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace strata::layer {

// How the topmost input-enabled layer occludes the layers beneath it
enum class InputOcclusion : uint8_t {
    Blanket,    // The topmost layer with receives_input takes every event
    HitTest     // Pointer events fall through unless a widget is under them
};

// Parses "blanket" / "hit_test"; unknown values fall back to Blanket with a warning
InputOcclusion parse_input_occlusion(std::string_view name);
const char* input_occlusion_name(InputOcclusion occlusion);

// One layer's contribution to a frame
struct LayerOutput {
    LayerId id;
    LayerKind kind = LayerKind::Ui;
    int z_index = 0;
    LayerOptions options;
    bool is_first = false;      // Bottom layer of the composition
    LayerContent content;

    bool should_clear() const { return is_first || options.clear; }

    const ui::DrawList* draw_list() const { return std::get_if<ui::DrawList>(&content); }
    const RawCommandBuffer* raw_commands() const { return std::get_if<RawCommandBuffer>(&content); }
};

// Per-layer results in paint order (ascending z)
struct FrameComposition {
    Vec2 size{0.0f};
    float scale_factor = 1.0f;
    std::vector<LayerOutput> layers;

    bool empty() const { return layers.empty(); }
};

// Consumer of composed frames; owns every GPU resource
class IRenderer {
public:
    virtual ~IRenderer() = default;
    virtual void submit(const FrameComposition& frame) = 0;
};

/**
 * @brief Ordered stack of raw and UI layers
 *
 * Layers render in ascending z_index; equal z_index keeps registration order.
 * Input walks the stack top-down and is delivered to exactly one layer: the
 * topmost with receives_input. Under InputOcclusion::Blanket that layer
 * takes the event even when nothing of it is under the pointer, which is how
 * a modal overlay blocks everything below it.
 *
 * Layers added or removed from inside a render callback or an input handler
 * take effect once the current frame has been composed or the event has been
 * delivered. Replacing or clearing layers from either is a usage error.
 *
 * @code
 * LayerManager layers;
 * layers.add_raw_layer(0, LayerOptions{}, [](RawLayerContext& ctx) {
 *     ctx.draw_fullscreen_quad("background", {{"time", 0.5f}});
 * });
 * layers.add_ui_layer(1, LayerOptions{}.with_input(), [&](UiLayerContext& ctx) {
 *     if (ctx.ui().button("Quit").clicked) running = false;
 * });
 *
 * layers.route_input(ui::PointerDown{...});
 * layers.render_frame(renderer, Vec2(1280, 720), 1.0f);
 * @endcode
 */
class LayerManager {
public:
    // Uses the global EntityStore and EngineSettings input.occlusion
    LayerManager();
    explicit LayerManager(entity::EntityStore& entities);
    LayerManager(entity::EntityStore& entities, InputOcclusion occlusion);
    ~LayerManager();

    LayerManager(const LayerManager&) = delete;
    LayerManager& operator=(const LayerManager&) = delete;

    // Registration
    LayerId add_layer(int z_index, std::unique_ptr<Layer> layer);
    LayerId add_raw_layer(int z_index, const LayerOptions& options, RawLayerCallback callback,
                          RawInputHandler input_handler = {});
    LayerId add_ui_layer(int z_index, const LayerOptions& options, UiLayerCallback callback);

    // Swap in a new layer under the same id; it starts with fresh state.
    // Not allowed from inside a render callback or an input handler.
    bool replace_layer(LayerId id, int z_index, std::unique_ptr<Layer> layer);
    bool remove_layer(LayerId id);
    void clear();

    Layer* get_layer(LayerId id);
    const Layer* get_layer(LayerId id) const;
    std::optional<int> z_index(LayerId id) const;
    size_t layer_count() const { return m_layers.size(); }
    bool empty() const { return m_layers.empty(); }

    // Bottom to top
    std::vector<LayerId> layer_order() const;

    // Rendering
    FrameComposition render_frame(Vec2 size, float scale_factor = 1.0f);
    FrameComposition render_frame(IRenderer& renderer, Vec2 size, float scale_factor = 1.0f);

    // Input; returns the layer that received the event, if any
    std::optional<LayerId> route_input(const ui::InputEvent& event);

    void set_input_occlusion(InputOcclusion occlusion) { m_occlusion = occlusion; }
    InputOcclusion input_occlusion() const { return m_occlusion; }

    // True when a layer asked for another frame, input arrived or layers were
    // registered since the last frame, or an entity changed
    bool needs_redraw() const;

    entity::EntityStore& entities() { return m_entities; }

private:
    struct Entry {
        LayerId id;
        int z_index = 0;
        uint64_t sequence = 0;  // Tie-break for equal z_index
        std::unique_ptr<Layer> layer;
    };

    void sort_layers();
    void apply_pending();
    bool deferring() const { return m_rendering || m_dispatching; }
    std::optional<LayerId> dispatch_input(const ui::InputEvent& event);
    Entry* find(LayerId id);
    const Entry* find(LayerId id) const;

    // Target selection, top-down
    Entry* topmost_input_layer();
    Entry* select_pointer_target(const ui::InputEvent& event);
    Entry* select_key_target();

    entity::EntityStore& m_entities;
    InputOcclusion m_occlusion = InputOcclusion::Blanket;

    std::vector<Entry> m_layers;    // Ascending (z_index, sequence)
    uint32_t m_next_id = 0;
    uint64_t m_next_sequence = 0;

    // Registration changes made while rendering
    std::vector<Entry> m_pending_adds;
    std::vector<LayerId> m_pending_removals;

    std::optional<LayerId> m_pointer_target;   // Last layer given a mouse event (HitTest)
    bool m_input_since_render = false;
    bool m_layers_changed = false;     // Registration changed since the last frame
    bool m_rendering = false;
    bool m_dispatching = false;         // Inside route_input
};

} // namespace strata::layer
