module;

#include <cmath>
#include <cstdint>
#include <glm/glm.hpp>

export module Graphics:SpriteSheet;

import :InstanceLayout;

export namespace Graphics
{
    struct UvRect
    {
        glm::vec2 Min{0.0f};
        glm::vec2 Max{0.0f};
    };

    // Addressing metadata for a grid atlas, in pixels. Cells are BoxSize
    // apart, row-major from the top-left; each cell samples only
    // [Padding, BoxSize - Padding] so bilinear filtering never reaches a
    // neighbour.
    struct SpriteSheetDescriptor
    {
        glm::vec2 Padding{0.0f};
        glm::vec2 BoxSize{1.0f};
        glm::vec2 ImageSize{1.0f};
        uint32_t NumCols = 1;

        [[nodiscard]] uint32_t RowCount() const
        {
            if (BoxSize.y <= 0.0f) return 0;
            return static_cast<uint32_t>(std::floor(ImageSize.y / BoxSize.y));
        }

        [[nodiscard]] bool IsIndexValid(uint32_t index) const
        {
            return NumCols > 0 && index / NumCols < RowCount();
        }

        // Same math as sprite.vert: flip, lerp into the padded cell, offset,
        // normalize. Caller guarantees IsIndexValid(index).
        [[nodiscard]] glm::vec2 SampleUV(uint32_t index, glm::vec2 uv, bool flip = false) const
        {
            const uint32_t row = index / NumCols;
            const uint32_t col = index % NumCols;

            if (flip) uv.x = 1.0f - uv.x;

            const glm::vec2 cellOrigin = BoxSize * glm::vec2(static_cast<float>(col), static_cast<float>(row));
            const glm::vec2 inCell = glm::mix(Padding, BoxSize - Padding, uv);
            return (cellOrigin + inCell) / ImageSize;
        }

        [[nodiscard]] UvRect CellRect(uint32_t index) const
        {
            return {SampleUV(index, glm::vec2(0.0f)), SampleUV(index, glm::vec2(1.0f))};
        }

        [[nodiscard]] SpriteSheetUniform ToUniform() const
        {
            return SpriteSheetUniform{
                .Padding = Padding,
                .BoxSize = BoxSize,
                .ImageSize = ImageSize,
                .NumCols = NumCols
            };
        }

        // Radius used by frustum culling, in sprite-local units.
        [[nodiscard]] float CullSize() const { return glm::max(BoxSize.x, BoxSize.y); }
    };
}
