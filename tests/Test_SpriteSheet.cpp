#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <glm/glm.hpp>

import Graphics;

using namespace Graphics;

namespace
{
    // 4x4 grid of 32px cells with a 2px gutter on a 128x128 image.
    SpriteSheetDescriptor MakeGridSheet()
    {
        return ProceduralImages::SpriteGridSheet(4, 4, 32, 2);
    }

    bool Overlaps(const UvRect& a, const UvRect& b)
    {
        return a.Min.x < b.Max.x && b.Min.x < a.Max.x &&
               a.Min.y < b.Max.y && b.Min.y < a.Max.y;
    }
}

TEST(SpriteSheet, RowCountAndIndexRange)
{
    const SpriteSheetDescriptor sheet = MakeGridSheet();
    EXPECT_EQ(sheet.RowCount(), 4u);
    EXPECT_TRUE(sheet.IsIndexValid(0));
    EXPECT_TRUE(sheet.IsIndexValid(15));
    EXPECT_FALSE(sheet.IsIndexValid(16));
}

TEST(SpriteSheet, ZeroColumnsHasNoValidIndex)
{
    SpriteSheetDescriptor sheet = MakeGridSheet();
    sheet.NumCols = 0;
    EXPECT_FALSE(sheet.IsIndexValid(0));
}

TEST(SpriteSheet, SampleSkipsPadding)
{
    const SpriteSheetDescriptor sheet = MakeGridSheet();

    // Cell 5 is row 1, column 1.
    const glm::vec2 minUv = sheet.SampleUV(5, glm::vec2(0.0f));
    const glm::vec2 maxUv = sheet.SampleUV(5, glm::vec2(1.0f));
    EXPECT_FLOAT_EQ(minUv.x, 34.0f / 128.0f);
    EXPECT_FLOAT_EQ(minUv.y, 34.0f / 128.0f);
    EXPECT_FLOAT_EQ(maxUv.x, 62.0f / 128.0f);
    EXPECT_FLOAT_EQ(maxUv.y, 62.0f / 128.0f);
}

TEST(SpriteSheet, EveryCellInsideImageAndDisjoint)
{
    const SpriteSheetDescriptor sheet = MakeGridSheet();

    std::array<UvRect, 16> rects{};
    for (uint32_t i = 0; i < rects.size(); ++i)
    {
        rects[i] = sheet.CellRect(i);
        EXPECT_GE(rects[i].Min.x, 0.0f);
        EXPECT_GE(rects[i].Min.y, 0.0f);
        EXPECT_LE(rects[i].Max.x, 1.0f);
        EXPECT_LE(rects[i].Max.y, 1.0f);
        EXPECT_LT(rects[i].Min.x, rects[i].Max.x);
        EXPECT_LT(rects[i].Min.y, rects[i].Max.y);
    }

    for (uint32_t i = 0; i < rects.size(); ++i)
        for (uint32_t j = i + 1; j < rects.size(); ++j)
            EXPECT_FALSE(Overlaps(rects[i], rects[j])) << "cells " << i << " and " << j;
}

TEST(SpriteSheet, FlipMirrorsHorizontally)
{
    const SpriteSheetDescriptor sheet = MakeGridSheet();
    const glm::vec2 flipped = sheet.SampleUV(3, glm::vec2(0.25f, 0.5f), true);
    const glm::vec2 mirrored = sheet.SampleUV(3, glm::vec2(0.75f, 0.5f), false);
    EXPECT_FLOAT_EQ(flipped.x, mirrored.x);
    EXPECT_FLOAT_EQ(flipped.y, mirrored.y);
}

TEST(SpriteSheet, UniformCarriesDescriptor)
{
    const SpriteSheetUniform uniform = MakeGridSheet().ToUniform();
    EXPECT_FLOAT_EQ(uniform.Padding.x, 2.0f);
    EXPECT_FLOAT_EQ(uniform.BoxSize.y, 32.0f);
    EXPECT_FLOAT_EQ(uniform.ImageSize.x, 128.0f);
    EXPECT_EQ(uniform.NumCols, 4u);
}

TEST(SpriteSheet, CullSizeIsLargerCellSide)
{
    SpriteSheetDescriptor sheet = MakeGridSheet();
    sheet.BoxSize = glm::vec2(16.0f, 48.0f);
    EXPECT_FLOAT_EQ(sheet.CullSize(), 48.0f);
}

TEST(ProceduralImages, SpriteGridMatchesSheet)
{
    const std::array<uint32_t, 2> palette = {Color::Red, Color::Blue};
    const Image image = ProceduralImages::SpriteGrid(4, 2, 16, 1, palette, Color::Black);

    ASSERT_TRUE(image.IsValid());
    EXPECT_EQ(image.Width, 64u);
    EXPECT_EQ(image.Height, 32u);

    // Pixel (0,0) is gutter, pixel (8,8) is inside cell 0 (red), pixel (24,8)
    // is inside cell 1 (blue).
    auto pixel = [&](uint32_t x, uint32_t y) { return &image.Pixels[(static_cast<size_t>(y) * image.Width + x) * 4]; };
    EXPECT_EQ(pixel(0, 0)[0], 0);
    EXPECT_EQ(pixel(8, 8)[0], 255);
    EXPECT_EQ(pixel(24, 8)[2], 255);
    EXPECT_EQ(pixel(24, 8)[0], 0);
}

TEST(ProceduralImages, CheckerboardAlternates)
{
    const Image image = ProceduralImages::Checkerboard(4, 4, 2, Color::White, Color::Black);
    ASSERT_TRUE(image.IsValid());
    EXPECT_EQ(image.Pixels[0], 255);
    EXPECT_EQ(image.Pixels[(2) * 4], 0);
}
