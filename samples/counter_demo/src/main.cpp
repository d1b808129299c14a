// Counter Demo
// A raw background layer, a counter UI layer and a modal confirmation overlay
// driven by scripted input. Frames are handed to a renderer that logs them.
// Usage: counter_demo [settings.json]

#include <strata/core/engine_settings.hpp>
#include <strata/core/log.hpp>
#include <strata/entity/lazy_entity.hpp>
#include <strata/layer/layer_manager.hpp>

#include <optional>

using namespace strata::core;
namespace entity = strata::entity;
namespace layer = strata::layer;
namespace ui = strata::ui;

// Logs each composed frame instead of drawing it
class LoggingRenderer : public layer::IRenderer {
public:
    void submit(const layer::FrameComposition& frame) override {
        log(LogLevel::Info, "[CounterDemo] Frame {}: {} layer(s) at {}x{}",
            m_frame++, frame.layers.size(), frame.size.x, frame.size.y);

        for (const auto& output : frame.layers) {
            if (const auto* commands = output.raw_commands()) {
                log(LogLevel::Info, "[CounterDemo]   z={} raw, {} quad(s), clear={}",
                    output.z_index, commands->size(), output.should_clear());
            } else if (const auto* draw_list = output.draw_list()) {
                log(LogLevel::Info, "[CounterDemo]   z={} ui, {} draw command(s), clear={}",
                    output.z_index, draw_list->size(), output.should_clear());
            }
        }
    }

private:
    uint64_t m_frame = 0;
};

void click(layer::LayerManager& layers, Vec2 position) {
    layers.route_input(ui::PointerMove{position});
    layers.route_input(ui::PointerDown{position, ui::MouseButton::Left});
    layers.route_input(ui::PointerUp{position, ui::MouseButton::Left});
}

int main(int argc, char** argv) {
    auto& settings = EngineSettings::get();
    if (argc > 1 && !settings.load(argv[1])) {
        log(LogLevel::Warn, "[CounterDemo] Using default settings");
    }
    set_log_level(settings.log_level);

    log(LogLevel::Info, "[CounterDemo] Starting...");

    layer::LayerManager layers;
    LoggingRenderer renderer;
    Vec2 size(static_cast<float>(settings.window.width), static_cast<float>(settings.window.height));
    float time = 0.0f;

    layers.add_raw_layer(0, layer::LayerOptions{}, [&time](layer::RawLayerContext& ctx) {
        ctx.draw_fullscreen_quad("gradient_background", {{"time", time}});
    });

    entity::LazyEntity<int> count;
    bool show_modal = false;
    std::optional<layer::LayerId> modal;

    layers.add_ui_layer(1, layer::LayerOptions{}.with_input(), [&](layer::UiLayerContext& ctx) {
        const auto& counter = count.get_or_init(0);
        int value = ctx.entities().read(counter, [](const int& v) { return v; });

        ctx.ui().vertical([&] {
            ctx.ui().text(std::format("Count: {}", value));
            ctx.ui().horizontal([&] {
                if (ctx.ui().button("+", "inc").clicked) {
                    ctx.entities().with_mut(counter, [](int& v) { ++v; });
                }
                if (ctx.ui().button("-", "dec").clicked) {
                    ctx.entities().with_mut(counter, [](int& v) { --v; });
                }
            });
            if (ctx.ui().button("Reset", "reset").clicked) {
                show_modal = true;
            }
        });
    });

    auto open_modal = [&]() {
        auto options = layer::LayerOptions{}.with_input().with_clear(Vec4(0.0f, 0.0f, 0.0f, 0.5f));
        modal = layers.add_ui_layer(10, options, [&](layer::UiLayerContext& ctx) {
            ctx.ui().window("Reset counter?", Vec2(400.0f, 300.0f), Vec2(240.0f, 120.0f), [&] {
                ctx.ui().horizontal([&] {
                    if (ctx.ui().button("Yes", "yes").clicked) {
                        ctx.entities().with_mut(count.get_or_init(0), [](int& v) { v = 0; });
                        show_modal = false;
                    }
                    if (ctx.ui().button("No", "no").clicked) {
                        show_modal = false;
                    }
                });
            });
        });
        log(LogLevel::Info, "[CounterDemo] Modal opened");
    };

    // Approximate position of the "+" button under the default UI settings
    const float margin = settings.ui.default_margin;
    const Vec2 inc_button(margin + 8.0f, margin + 30.0f);

    auto frame = [&]() {
        layers.render_frame(renderer, size, settings.window.scale_factor);
        time += 1.0f / 60.0f;

        if (show_modal && !modal) {
            open_modal();
        } else if (!show_modal && modal) {
            layers.remove_layer(*modal);
            modal.reset();
            log(LogLevel::Info, "[CounterDemo] Modal closed");
        }
    };

    frame();
    click(layers, inc_button);
    frame();
    click(layers, inc_button);
    frame();

    count.get_or_init(0).read([](const int& v) {
        log(LogLevel::Info, "[CounterDemo] Count after two clicks: {}", v);
    });

    show_modal = true;
    frame();
    frame();

    // The modal blankets the counter; this click never reaches it
    click(layers, inc_button);
    frame();

    log(LogLevel::Info, "[CounterDemo] Redraw pending: {}", layers.needs_redraw());
    log(LogLevel::Info, "[CounterDemo] Shutting down");
    return 0;
}
