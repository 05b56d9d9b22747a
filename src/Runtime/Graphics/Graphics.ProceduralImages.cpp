module;

#include <cstdint>
#include <span>
#include <glm/glm.hpp>

module Graphics:ProceduralImages.Impl;

import :ProceduralImages;
import :Image;
import :SpriteSheet;
import :Color;

namespace Graphics::ProceduralImages
{
    namespace
    {
        Image Allocate(uint32_t width, uint32_t height)
        {
            Image image{.Width = width, .Height = height, .Pixels = {}};
            image.Pixels.resize(static_cast<size_t>(width) * height * 4);
            return image;
        }

        void SetPixel(Image& image, uint32_t x, uint32_t y, uint32_t color)
        {
            const size_t offset = (static_cast<size_t>(y) * image.Width + x) * 4;
            image.Pixels[offset + 0] = Color::R(color);
            image.Pixels[offset + 1] = Color::G(color);
            image.Pixels[offset + 2] = Color::B(color);
            image.Pixels[offset + 3] = Color::A(color);
        }
    }

    Image SolidColor(uint32_t width, uint32_t height, uint32_t color)
    {
        Image image = Allocate(width, height);
        for (uint32_t y = 0; y < height; ++y)
            for (uint32_t x = 0; x < width; ++x)
                SetPixel(image, x, y, color);
        return image;
    }

    Image Checkerboard(uint32_t width, uint32_t height, uint32_t cellSize, uint32_t colorA, uint32_t colorB)
    {
        if (cellSize == 0) cellSize = 1;
        Image image = Allocate(width, height);
        for (uint32_t y = 0; y < height; ++y)
        {
            for (uint32_t x = 0; x < width; ++x)
            {
                const bool even = ((x / cellSize) + (y / cellSize)) % 2 == 0;
                SetPixel(image, x, y, even ? colorA : colorB);
            }
        }
        return image;
    }

    Image SpriteGrid(uint32_t cols, uint32_t rows, uint32_t boxSize, uint32_t padding,
                     std::span<const uint32_t> palette, uint32_t borderColor)
    {
        Image image = Allocate(cols * boxSize, rows * boxSize);
        for (uint32_t y = 0; y < image.Height; ++y)
        {
            for (uint32_t x = 0; x < image.Width; ++x)
            {
                const uint32_t cx = x % boxSize;
                const uint32_t cy = y % boxSize;
                const bool border = cx < padding || cy < padding ||
                                    cx >= boxSize - padding || cy >= boxSize - padding;

                uint32_t color = borderColor;
                if (!border && !palette.empty())
                {
                    const uint32_t cell = (y / boxSize) * cols + (x / boxSize);
                    color = palette[cell % palette.size()];
                }
                SetPixel(image, x, y, color);
            }
        }
        return image;
    }

    SpriteSheetDescriptor SpriteGridSheet(uint32_t cols, uint32_t rows, uint32_t boxSize, uint32_t padding)
    {
        return SpriteSheetDescriptor{
            .Padding = glm::vec2(static_cast<float>(padding)),
            .BoxSize = glm::vec2(static_cast<float>(boxSize)),
            .ImageSize = glm::vec2(static_cast<float>(cols * boxSize), static_cast<float>(rows * boxSize)),
            .NumCols = cols
        };
    }
}
