#pragma once

#include <cstdint>

#include "geometry/Geometry.hpp"

namespace vellum {

// Opaque renderer-side texture handle. 0 means "no texture, draw solid color".
using TextureID = std::uint32_t;

inline constexpr TextureID kNoTexture = 0;

enum class TextureFilteringMode : std::uint8_t { Nearest = 0, Linear = 1 };

enum class BlendMode : std::uint8_t {
    Alpha = 0,
    Add = 1,
    Subtract = 2,
    Multiply = 3,
    MultiplyX2 = 4,
    Screen = 5,
    Replace = 6,
    MultiplyAlpha = 7
};

/**
 * @brief Appearance of a renderable node.
 *
 * A node draws only when it carries this component.
 */
struct Sprite {
    Size size{};
    Point anchor_point{0.5f, 0.5f};
    TextureID texture_id{kNoTexture};
    Rect texture_rect{Rect::unit()};
    TextureFilteringMode filtering_mode{TextureFilteringMode::Linear};
    bool uses_mipmaps{false};
    Color color{Color::white()};
    float color_blend_factor{0.0f};
    BlendMode blend_mode{BlendMode::Alpha};
    Rect center_rect{Rect::unit()};  // nine-slice stretchable area, unit = no slicing
};

/**
 * @brief Tint sent to the renderer.
 *
 * Untextured sprites and a full blend factor use the color as is, a zero blend
 * factor leaves the texture untinted (white), anything between mixes the two.
 */
[[nodiscard]] inline Color effective_color(const Sprite& sprite) {
    if (sprite.texture_id == kNoTexture || sprite.color_blend_factor >= 1.0f) {
        return sprite.color;
    }
    if (sprite.color_blend_factor <= 0.0f) {
        return Color::white();
    }
    return lerp(Color::white(), sprite.color, sprite.color_blend_factor);
}

}  // namespace vellum
