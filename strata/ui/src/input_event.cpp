#include <strata/ui/input_event.hpp>

namespace strata::ui {

std::optional<Vec2> event_position(const InputEvent& event) {
    return std::visit([](const auto& e) -> std::optional<Vec2> {
        if constexpr (requires { e.position; }) {
            return e.position;
        } else {
            return std::nullopt;
        }
    }, event);
}

bool is_pointer_event(const InputEvent& event) {
    return !std::holds_alternative<KeyDown>(event) && !std::holds_alternative<KeyUp>(event);
}

} // namespace strata::ui
