module;
#include <cstdint>
#include <glm/glm.hpp>

export module ECS:Components.Visual;

import Graphics;

export namespace ECS::Components::Sprite
{
    // Cell of a registered sprite sheet, drawn at the entity's Transform.
    // Scale multiplies the sheet's cell size.
    struct Component
    {
        Graphics::TextureId Texture = Graphics::kPlaceholderTexture;
        uint32_t Index = 0;
        bool Flip = false;
        float Layer = 0.0f;
    };
}

export namespace ECS::Components::UiRect
{
    // Layout output in pixels, top-left origin. Transform is ignored.
    struct Component
    {
        Graphics::PixelRect Rect{};
        uint16_t Layer = 0;
        uint32_t Fill = Graphics::Color::White;
        uint32_t Outline = 0;
        glm::vec2 CornerRadius{0.0f};
        Graphics::ScissorId Scissor = Graphics::kNoScissor;
    };
}

export namespace ECS::Components::Glyph
{
    struct Component
    {
        Graphics::PixelRect Rect{};
        uint16_t Layer = 0;
        Graphics::TextureId Atlas = Graphics::kPlaceholderTexture;
        uint32_t Color = Graphics::Color::White;
        Graphics::ScissorId Scissor = Graphics::kNoScissor;
    };
}

export namespace ECS::Components::UiImage
{
    // A sheet cell laid out in pixels, top-left origin. Transform is ignored.
    struct Component
    {
        Graphics::PixelRect Rect{};
        uint16_t Layer = 0;
        Graphics::TextureId Sheet = Graphics::kPlaceholderTexture;
        uint32_t Index = 0;
        bool Flip = false;
        uint32_t Tint = Graphics::Color::White;
        Graphics::ScissorId Scissor = Graphics::kNoScissor;
    };
}

export namespace ECS::Components::Culling
{
    // Bounding-sphere radius before Transform scale. Filled in from the
    // sprite's sheet when missing.
    struct CullSize
    {
        float Radius = 0.0f;
    };

    // Present while the sprite intersects the camera frustum.
    struct VisibleTag
    {
    };
}
