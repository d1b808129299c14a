#pragma once

#include <strata/core/math.hpp>
#include <glm/common.hpp>

namespace strata::ui {

using core::Vec2;

// Persistent state of one scroll area, held in an entity so the offset
// survives from frame to frame
struct ScrollState {
    Vec2 offset{0.0f};          // Positive scrolls the content up / left
    Vec2 content_size{0.0f};    // Extent of the children last frame
    Vec2 viewport_size{0.0f};   // Visible extent last frame

    Vec2 max_offset() const {
        return glm::max(content_size - viewport_size, Vec2(0.0f));
    }

    void clamp_offset() {
        offset = glm::clamp(offset, Vec2(0.0f), max_offset());
    }

    // Wheel delta as reported by Scroll; positive y moves toward the top
    void apply_scroll(Vec2 delta) {
        offset -= delta;
        clamp_offset();
    }

    bool operator==(const ScrollState& other) const {
        return offset == other.offset && content_size == other.content_size &&
               viewport_size == other.viewport_size;
    }
    bool operator!=(const ScrollState& other) const { return !(*this == other); }
};

} // namespace strata::ui
