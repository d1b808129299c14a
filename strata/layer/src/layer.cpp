#include <strata/layer/layer.hpp>
#include <strata/core/log.hpp>

namespace strata::layer {

const char* layer_kind_name(LayerKind kind) {
    switch (kind) {
        case LayerKind::Raw: return "raw";
        case LayerKind::Ui:  return "ui";
    }
    return "unknown";
}

// ============================================================================
// Raw command buffer
// ============================================================================

float FullscreenQuad::uniform(const std::string& name, float fallback) const {
    for (const auto& u : uniforms) {
        if (u.name == name) return u.value;
    }
    return fallback;
}

void RawCommandBuffer::draw_fullscreen_quad(const std::string& shader, std::vector<ShaderUniform> uniforms) {
    if (shader.empty()) {
        core::log(core::LogLevel::Warn, "RawCommandBuffer: fullscreen quad without a shader ignored");
        return;
    }

    FullscreenQuad quad;
    quad.shader = shader;
    quad.uniforms = std::move(uniforms);
    m_commands.push_back(std::move(quad));
}

// ============================================================================
// RawLayer
// ============================================================================

RawLayer::RawLayer(const LayerOptions& options, RawLayerCallback callback, RawInputHandler input_handler)
    : Layer(options)
    , m_callback(std::move(callback))
    , m_input_handler(std::move(input_handler)) {
}

LayerContent RawLayer::render(const FrameInfo& frame, entity::EntityStore& /*entities*/) {
    RawCommandBuffer commands;
    RawLayerContext context(commands, frame);
    if (m_callback) {
        m_callback(context);
    }
    m_next_frame_requested = context.next_frame_requested();
    return LayerContent(std::move(commands));
}

void RawLayer::handle_input(const ui::InputEvent& event) {
    if (m_input_handler) {
        m_input_handler(event);
    }
}

// ============================================================================
// UiLayer
// ============================================================================

UiLayer::UiLayer(const LayerOptions& options, UiLayerCallback callback)
    : UiLayer(options, std::move(callback), core::EngineSettings::get().ui) {
}

UiLayer::UiLayer(const LayerOptions& options, UiLayerCallback callback, const core::UiSettings& settings)
    : Layer(options)
    , m_callback(std::move(callback))
    , m_ui(settings) {
    m_ui.set_interaction(&m_interaction);
}

LayerContent UiLayer::render(const FrameInfo& frame, entity::EntityStore& entities) {
    UiLayerContext context(m_ui, entities, frame);

    m_ui.begin_frame(ui::Rect(Vec2(0.0f), frame.size));
    if (m_callback) {
        m_callback(context);
    }
    ui::FrameOutput output = m_ui.end_frame();

    // Forget widgets that were not declared this frame, then hit test
    // subsequent input against the fresh geometry
    m_interaction.retain_observed(output.observed);
    m_interaction.update_hit_test(std::move(output.hit_entries));

    m_next_frame_requested = context.next_frame_requested();
    return LayerContent(std::move(output.draw_list));
}

void UiLayer::handle_input(const ui::InputEvent& event) {
    m_interaction.handle_input(event);
}

bool UiLayer::claims(Vec2 position) const {
    return m_interaction.hit_test(position).has_value();
}

} // namespace strata::layer
