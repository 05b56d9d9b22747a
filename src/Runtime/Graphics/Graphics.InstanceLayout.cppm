module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <glm/glm.hpp>

export module Graphics:InstanceLayout;

import RHI;

// =============================================================================
// Byte layouts shared with the GLSL in shaders/. Field order, sizes and
// offsets here are the vertex-input contract; every change must be mirrored
// in the shader and in the attribute tables below.
//
//   binding 0 (per vertex)   : QuadVertex       locations 0-1
//   binding 1 (per instance) : *Instance        locations 2..
// =============================================================================

export namespace Graphics
{
    struct QuadVertex
    {
        glm::vec3 Position;
        glm::vec2 Uv;
    };

    struct SpriteInstance
    {
        glm::vec4 PosScale; // x, y, layer, scale.x
        float ScaleY;
        uint32_t Index;
        uint32_t Flip;
    };

    // Rectangle in normalized UI space: center (X, Y) and full extents (W, H).
    struct UiRectInstance
    {
        float X;
        float Y;
        float W;
        float H;
        uint32_t Color;
        float Layer;     // depth in [0, 1], 0 = front
        glm::vec2 Radius;
        uint32_t Outline;
    };

    // Glyph quads share the rect layout; only the shader's V convention differs.
    using GlyphInstance = UiRectInstance;

    // A sheet cell drawn into a UI rectangle. Color tints the texel.
    struct UiImageInstance
    {
        float X;
        float Y;
        float W;
        float H;
        float Layer;     // depth in [0, 1], 0 = front
        uint32_t Index;
        uint32_t Flip;
        uint32_t Color;
    };

    struct SpriteSheetUniform
    {
        glm::vec2 Padding;
        glm::vec2 BoxSize;
        glm::vec2 ImageSize;
        uint32_t NumCols;
        uint32_t Tail = 0xDEADBEEF;
    };

    static_assert(std::is_standard_layout_v<QuadVertex>);
    static_assert(std::is_standard_layout_v<SpriteInstance>);
    static_assert(std::is_standard_layout_v<UiRectInstance>);
    static_assert(std::is_standard_layout_v<UiImageInstance>);
    static_assert(std::is_standard_layout_v<SpriteSheetUniform>);

    static_assert(sizeof(QuadVertex) == 20);
    static_assert(offsetof(QuadVertex, Uv) == 12);

    static_assert(sizeof(SpriteInstance) == 28);
    static_assert(offsetof(SpriteInstance, ScaleY) == 16);
    static_assert(offsetof(SpriteInstance, Index) == 20);
    static_assert(offsetof(SpriteInstance, Flip) == 24);

    static_assert(sizeof(UiRectInstance) == 36);
    static_assert(offsetof(UiRectInstance, Color) == 16);
    static_assert(offsetof(UiRectInstance, Layer) == 20);
    static_assert(offsetof(UiRectInstance, Radius) == 24);
    static_assert(offsetof(UiRectInstance, Outline) == 32);

    static_assert(sizeof(UiImageInstance) == 32);
    static_assert(offsetof(UiImageInstance, Layer) == 16);
    static_assert(offsetof(UiImageInstance, Index) == 20);
    static_assert(offsetof(UiImageInstance, Flip) == 24);
    static_assert(offsetof(UiImageInstance, Color) == 28);

    static_assert(sizeof(SpriteSheetUniform) == 32);
    static_assert(offsetof(SpriteSheetUniform, NumCols) == 24);

    inline constexpr uint32_t kGeometryBinding = 0;
    inline constexpr uint32_t kInstanceBinding = 1;

    inline constexpr std::array<RHI::VertexAttribute, 2> QuadVertexAttributes = {{
        {0, RHI::VertexFormat::Float3, 0},
        {1, RHI::VertexFormat::Float2, 12},
    }};

    inline constexpr std::array<RHI::VertexAttribute, 4> SpriteInstanceAttributes = {{
        {2, RHI::VertexFormat::Float4, 0},
        {3, RHI::VertexFormat::Float, 16},
        {4, RHI::VertexFormat::Uint, 20},
        {5, RHI::VertexFormat::Uint, 24},
    }};

    inline constexpr std::array<RHI::VertexAttribute, 5> UiRectInstanceAttributes = {{
        {2, RHI::VertexFormat::Float4, 0},
        {3, RHI::VertexFormat::Uint, 16},
        {4, RHI::VertexFormat::Float, 20},
        {5, RHI::VertexFormat::Float2, 24},
        {6, RHI::VertexFormat::Uint, 32},
    }};

    inline constexpr std::array<RHI::VertexAttribute, 5> UiImageInstanceAttributes = {{
        {2, RHI::VertexFormat::Float4, 0},
        {3, RHI::VertexFormat::Float, 16},
        {4, RHI::VertexFormat::Uint, 20},
        {5, RHI::VertexFormat::Uint, 24},
        {6, RHI::VertexFormat::Uint, 28},
    }};

    // Maps a UI layer (z-index, higher on top) to a depth value, 0 = front.
    [[nodiscard]] constexpr float UiLayerToDepth(float layer) noexcept
    {
        const float clamped = layer < 0.0f ? 0.0f : (layer > 65535.0f ? 65535.0f : layer);
        return (65535.0f - clamped) / 65535.0f;
    }
}
