// Simple color helper.
#pragma once

#include <algorithm>

namespace Engine {

struct Color {
    unsigned char r{0};
    unsigned char g{0};
    unsigned char b{0};
    unsigned char a{255};
};

// Scales alpha by a 0..1 opacity.
inline Color withOpacity(Color c, float opacity) {
    const float o = std::clamp(opacity, 0.0f, 1.0f);
    c.a = static_cast<unsigned char>(static_cast<float>(c.a) * o);
    return c;
}

}  // namespace Engine
