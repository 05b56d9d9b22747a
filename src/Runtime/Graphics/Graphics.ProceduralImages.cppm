module;

#include <cstdint>
#include <span>

export module Graphics:ProceduralImages;

import :Image;
import :SpriteSheet;

// Generated RGBA8 images for demos and tests. No file decoding.
export namespace Graphics::ProceduralImages
{
    [[nodiscard]] Image SolidColor(uint32_t width, uint32_t height, uint32_t color);

    [[nodiscard]] Image Checkerboard(uint32_t width, uint32_t height, uint32_t cellSize,
                                     uint32_t colorA, uint32_t colorB);

    // Grid sheet of cols x rows cells, each boxSize pixels square with a
    // padding border of borderColor. Cell i is filled with
    // palette[i % palette.size()].
    [[nodiscard]] Image SpriteGrid(uint32_t cols, uint32_t rows, uint32_t boxSize, uint32_t padding,
                                   std::span<const uint32_t> palette, uint32_t borderColor);

    // Descriptor addressing the image SpriteGrid produces with the same arguments.
    [[nodiscard]] SpriteSheetDescriptor SpriteGridSheet(uint32_t cols, uint32_t rows, uint32_t boxSize, uint32_t padding);
}
