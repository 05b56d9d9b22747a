module;

#include <cstdint>
#include <glm/glm.hpp>

export module Graphics:VisualRecord;

import :Color;

export namespace Graphics
{
    // Closed set of draw kinds. Each maps to one pipeline and one instance
    // layout through the table in PipelineLibrary.
    enum class PipelineKind : uint8_t
    {
        Sprite = 0,
        UIRect = 1,
        Glyph = 2,
        UIImage = 3
    };

    inline constexpr uint32_t kPipelineKindCount = 4;

    [[nodiscard]] constexpr bool IsKnownKind(PipelineKind kind) noexcept
    {
        return static_cast<uint32_t>(kind) < kPipelineKindCount;
    }

    // Screen-space kinds ignore the camera and draw over the world.
    [[nodiscard]] constexpr bool IsScreenSpace(PipelineKind kind) noexcept
    {
        return kind == PipelineKind::UIRect || kind == PipelineKind::Glyph || kind == PipelineKind::UIImage;
    }

    // Tie-break between kinds that share a layer bucket. Images sit above
    // plain rects and below text.
    [[nodiscard]] constexpr uint32_t KindDrawPriority(PipelineKind kind) noexcept
    {
        switch (kind)
        {
        case PipelineKind::Sprite: return 0;
        case PipelineKind::UIRect: return 1;
        case PipelineKind::UIImage: return 2;
        case PipelineKind::Glyph: return 3;
        }
        return kPipelineKindCount;
    }

    // Kinds whose instances carry a sheet index.
    [[nodiscard]] constexpr bool UsesSheetIndex(PipelineKind kind) noexcept
    {
        return kind == PipelineKind::Sprite || kind == PipelineKind::UIImage;
    }

    [[nodiscard]] constexpr const char* PipelineKindName(PipelineKind kind) noexcept
    {
        switch (kind)
        {
        case PipelineKind::Sprite: return "Sprite";
        case PipelineKind::UIRect: return "UIRect";
        case PipelineKind::Glyph: return "Glyph";
        case PipelineKind::UIImage: return "UIImage";
        }
        return "Unknown";
    }

    // 0 is the placeholder texture and is always registered.
    using TextureId = uint32_t;
    inline constexpr TextureId kPlaceholderTexture = 0;

    // 0 is the full render target.
    using ScissorId = uint32_t;
    inline constexpr ScissorId kNoScissor = 0;

    // One visible entity's state for this frame. Not retained by the core.
    //
    // Sprite: Position is the world position, Scale multiplies the sheet's
    // cell size. UIRect/Glyph/UIImage: Position is the rectangle centre and
    // Scale its full extents, both in normalized UI space. UIImage draws the
    // sheet cell SpriteIndex of Texture into that rectangle.
    struct VisualRecord
    {
        PipelineKind Kind = PipelineKind::Sprite;
        glm::vec2 Position{0.0f};
        glm::vec2 Scale{1.0f};
        float Rotation = 0.0f;
        uint32_t SpriteIndex = 0;
        bool Flip = false;
        uint32_t Color = Color::White;
        float Layer = 0.0f; // higher draws on top
        TextureId Texture = kPlaceholderTexture;
        ScissorId Scissor = kNoScissor;
        glm::vec2 CornerRadius{0.0f};
        uint32_t OutlineColor = 0;
    };
}
