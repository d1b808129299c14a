#pragma once

#include <glm/glm.hpp>

namespace strata::core {

// Vector types
using Vec2 = glm::vec2;
using Vec4 = glm::vec4;

} // namespace strata::core
