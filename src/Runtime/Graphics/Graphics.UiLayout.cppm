module;

#include <algorithm>
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:UiLayout;

import RHI;
import :VisualRecord;
import :Color;

export namespace Graphics
{
    // Rectangle in pixels with a top-left origin, as produced by UI layout.
    struct PixelRect
    {
        float X = 0.0f;
        float Y = 0.0f;
        float W = 0.0f;
        float H = 0.0f;
    };

    struct UiRectPlacement
    {
        glm::vec2 Center{0.0f};
        glm::vec2 Extents{0.0f};
    };

    // Normalized UI space has its origin at the bottom-left of the target.
    [[nodiscard]] inline UiRectPlacement PixelToUi(const PixelRect& rect, glm::vec2 viewport)
    {
        if (viewport.x <= 0.0f || viewport.y <= 0.0f) return {};
        return UiRectPlacement{
            .Center = {(rect.X + rect.W * 0.5f) / viewport.x,
                       (viewport.y - rect.Y - rect.H * 0.5f) / viewport.y},
            .Extents = {rect.W / viewport.x, rect.H / viewport.y}
        };
    }

    struct UiRectStyle
    {
        uint32_t Fill = Color::White;
        uint32_t Outline = 0;
        glm::vec2 CornerRadius{0.0f};
        ScissorId Scissor = kNoScissor;
    };

    [[nodiscard]] inline VisualRecord MakeUiRect(const PixelRect& rect, uint16_t layer, glm::vec2 viewport,
                                                 const UiRectStyle& style = {})
    {
        const UiRectPlacement placement = PixelToUi(rect, viewport);
        VisualRecord record;
        record.Kind = PipelineKind::UIRect;
        record.Position = placement.Center;
        record.Scale = placement.Extents;
        record.Color = style.Fill;
        record.Layer = static_cast<float>(layer);
        record.Scissor = style.Scissor;
        record.CornerRadius = style.CornerRadius;
        record.OutlineColor = style.Outline;
        return record;
    }

    [[nodiscard]] inline VisualRecord MakeGlyph(const PixelRect& rect, uint16_t layer, glm::vec2 viewport,
                                                TextureId atlas, uint32_t color, ScissorId scissor = kNoScissor)
    {
        const UiRectPlacement placement = PixelToUi(rect, viewport);
        VisualRecord record;
        record.Kind = PipelineKind::Glyph;
        record.Position = placement.Center;
        record.Scale = placement.Extents;
        record.Color = color;
        record.Layer = static_cast<float>(layer);
        record.Texture = atlas;
        record.Scissor = scissor;
        return record;
    }

    // Cell `index` of a registered sheet, stretched over a pixel rectangle.
    [[nodiscard]] inline VisualRecord MakeUiImage(const PixelRect& rect, uint16_t layer, glm::vec2 viewport,
                                                  TextureId sheet, uint32_t index, bool flip = false,
                                                  uint32_t tint = Color::White, ScissorId scissor = kNoScissor)
    {
        const UiRectPlacement placement = PixelToUi(rect, viewport);
        VisualRecord record;
        record.Kind = PipelineKind::UIImage;
        record.Position = placement.Center;
        record.Scale = placement.Extents;
        record.Color = tint;
        record.Layer = static_cast<float>(layer);
        record.Texture = sheet;
        record.SpriteIndex = index;
        record.Flip = flip;
        record.Scissor = scissor;
        return record;
    }

    // Clip rectangles referenced by UI records. Id 0 always means the full
    // render target; other ids are valid until Reset, which the frame
    // renderer calls once a frame has been presented or skipped.
    class ScissorTable
    {
    public:
        [[nodiscard]] ScissorId Define(const RHI::ScissorRect& rect)
        {
            m_Rects.push_back(rect);
            return static_cast<ScissorId>(m_Rects.size());
        }

        [[nodiscard]] bool Contains(ScissorId id) const { return id <= m_Rects.size(); }

        // Unknown ids fall back to the full target. The result is clamped to
        // the target extent.
        [[nodiscard]] RHI::ScissorRect Resolve(ScissorId id, RHI::Extent2D target) const
        {
            const RHI::ScissorRect full{0, 0, target.Width, target.Height};
            if (id == kNoScissor || id > m_Rects.size()) return full;

            const RHI::ScissorRect& rect = m_Rects[id - 1];
            const int64_t x0 = std::clamp<int64_t>(rect.X, 0, target.Width);
            const int64_t y0 = std::clamp<int64_t>(rect.Y, 0, target.Height);
            const int64_t x1 = std::clamp<int64_t>(static_cast<int64_t>(rect.X) + rect.Width, 0, target.Width);
            const int64_t y1 = std::clamp<int64_t>(static_cast<int64_t>(rect.Y) + rect.Height, 0, target.Height);
            return RHI::ScissorRect{
                static_cast<int32_t>(x0),
                static_cast<int32_t>(y0),
                static_cast<uint32_t>(x1 - x0),
                static_cast<uint32_t>(y1 - y0)
            };
        }

        void Reset() { m_Rects.clear(); }
        [[nodiscard]] size_t Size() const { return m_Rects.size(); }

    private:
        std::vector<RHI::ScissorRect> m_Rects;
    };
}
