#pragma once

#include <strata/core/math.hpp>
#include <strata/entity/entity_store.hpp>
#include <strata/ui/draw_list.hpp>
#include <strata/ui/input_event.hpp>
#include <strata/ui/interaction.hpp>
#include <strata/ui/ui_context.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace strata::layer {

using namespace strata::core;

// Handle returned by LayerManager registration
struct LayerId {
    uint32_t id = std::numeric_limits<uint32_t>::max();
    bool valid() const { return id != std::numeric_limits<uint32_t>::max(); }
    bool operator==(const LayerId& other) const { return id == other.id; }
    bool operator!=(const LayerId& other) const { return id != other.id; }
};

enum class LayerKind : uint8_t {
    Raw,
    Ui
};

const char* layer_kind_name(LayerKind kind);

// How a layer composites over the ones below it
enum class BlendMode : uint8_t {
    Alpha,      // Standard alpha blending
    Additive,
    Multiply,
    Replace     // No blending
};

struct LayerOptions {
    bool receives_input = false;
    BlendMode blend_mode = BlendMode::Alpha;
    bool clear = false;                         // Clear the target before this layer draws
    Vec4 clear_color{0.0f, 0.0f, 0.0f, 0.0f};

    LayerOptions& with_input() {
        receives_input = true;
        return *this;
    }

    LayerOptions& with_blend_mode(BlendMode mode) {
        blend_mode = mode;
        return *this;
    }

    LayerOptions& with_clear(const Vec4& color) {
        clear = true;
        clear_color = color;
        return *this;
    }
};

// ============================================================================
// Raw layers
// ============================================================================

struct ShaderUniform {
    std::string name;
    float value = 0.0f;
};

// Fullscreen quad drawn with a named shader program
struct FullscreenQuad {
    std::string shader;
    std::vector<ShaderUniform> uniforms;

    // Value of a uniform, or fallback when the quad does not set it
    float uniform(const std::string& name, float fallback = 0.0f) const;
};

// Shader invocations recorded by a raw layer for the renderer
class RawCommandBuffer {
public:
    void draw_fullscreen_quad(const std::string& shader, std::vector<ShaderUniform> uniforms = {});

    const std::vector<FullscreenQuad>& commands() const { return m_commands; }
    size_t size() const { return m_commands.size(); }
    bool empty() const { return m_commands.empty(); }
    void clear() { m_commands.clear(); }

private:
    std::vector<FullscreenQuad> m_commands;
};

// Per-frame surface parameters handed to every layer
struct FrameInfo {
    Vec2 size{0.0f};
    float scale_factor = 1.0f;
};

class RawLayerContext {
public:
    RawLayerContext(RawCommandBuffer& commands, const FrameInfo& frame)
        : m_commands(commands), m_frame(frame) {}

    Vec2 size() const { return m_frame.size; }
    float scale_factor() const { return m_frame.scale_factor; }

    void draw_fullscreen_quad(const std::string& shader, std::vector<ShaderUniform> uniforms = {}) {
        m_commands.draw_fullscreen_quad(shader, std::move(uniforms));
    }
    RawCommandBuffer& commands() { return m_commands; }

    // Ask the host loop for another frame (animation)
    void request_next_frame() { m_next_frame_requested = true; }
    bool next_frame_requested() const { return m_next_frame_requested; }

private:
    RawCommandBuffer& m_commands;
    FrameInfo m_frame;
    bool m_next_frame_requested = false;
};

// ============================================================================
// UI layers
// ============================================================================

class UiLayerContext {
public:
    UiLayerContext(ui::UIContext& ui, entity::EntityStore& entities, const FrameInfo& frame)
        : m_ui(ui), m_entities(entities), m_frame(frame) {}

    ui::UIContext& ui() { return m_ui; }
    entity::EntityStore& entities() { return m_entities; }
    Vec2 size() const { return m_frame.size; }
    float scale_factor() const { return m_frame.scale_factor; }

    void request_next_frame() { m_next_frame_requested = true; }
    bool next_frame_requested() const { return m_next_frame_requested; }

private:
    ui::UIContext& m_ui;
    entity::EntityStore& m_entities;
    FrameInfo m_frame;
    bool m_next_frame_requested = false;
};

using RawLayerCallback = std::function<void(RawLayerContext&)>;
using RawInputHandler = std::function<void(const ui::InputEvent&)>;
using UiLayerCallback = std::function<void(UiLayerContext&)>;

// What one layer produced for one frame
using LayerContent = std::variant<ui::DrawList, RawCommandBuffer>;

// ============================================================================
// Layer interface
// ============================================================================

/**
 * @brief A compositor surface owned by the LayerManager
 *
 * Layers are immutable in configuration: to change options or callback,
 * replace the layer through the manager.
 */
class Layer {
public:
    explicit Layer(const LayerOptions& options) : m_options(options) {}
    virtual ~Layer() = default;

    Layer(const Layer&) = delete;
    Layer& operator=(const Layer&) = delete;

    const LayerOptions& options() const { return m_options; }
    virtual LayerKind kind() const = 0;

    // Run the render callback for one frame
    virtual LayerContent render(const FrameInfo& frame, entity::EntityStore& entities) = 0;

    // Deliver an input event this layer was selected for
    virtual void handle_input(const ui::InputEvent& event) = 0;

    // Hit-test queries used by InputOcclusion::HitTest
    virtual bool claims(Vec2 /*position*/) const { return false; }
    virtual bool is_capturing() const { return false; }
    virtual bool has_focus() const { return false; }

    // Set by the last render when the callback asked for another frame
    bool next_frame_requested() const { return m_next_frame_requested; }
    // Input arrived that the next render has not seen yet
    virtual bool has_pending_input() const { return false; }

protected:
    bool m_next_frame_requested = false;

private:
    LayerOptions m_options;
};

// Direct shader access, bypassing the declarative UI
class RawLayer : public Layer {
public:
    RawLayer(const LayerOptions& options, RawLayerCallback callback, RawInputHandler input_handler = {});

    LayerKind kind() const override { return LayerKind::Raw; }
    LayerContent render(const FrameInfo& frame, entity::EntityStore& entities) override;
    void handle_input(const ui::InputEvent& event) override;

private:
    RawLayerCallback m_callback;
    RawInputHandler m_input_handler;
};

// One UIContext and its InteractionSystem; hover/focus state persists across frames
class UiLayer : public Layer {
public:
    UiLayer(const LayerOptions& options, UiLayerCallback callback);
    UiLayer(const LayerOptions& options, UiLayerCallback callback, const core::UiSettings& settings);

    LayerKind kind() const override { return LayerKind::Ui; }
    LayerContent render(const FrameInfo& frame, entity::EntityStore& entities) override;
    void handle_input(const ui::InputEvent& event) override;

    bool claims(Vec2 position) const override;
    bool is_capturing() const override { return m_interaction.has_active_press(); }
    bool has_focus() const override { return m_interaction.focused().has_value(); }
    bool has_pending_input() const override { return m_interaction.has_pending_events(); }

    ui::UIContext& ui() { return m_ui; }
    ui::InteractionSystem& interaction() { return m_interaction; }
    const ui::InteractionSystem& interaction() const { return m_interaction; }

private:
    UiLayerCallback m_callback;
    ui::UIContext m_ui;
    ui::InteractionSystem m_interaction;
};

} // namespace strata::layer
