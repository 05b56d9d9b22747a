#include <gtest/gtest.h>
#include <cstdint>
#include <glm/glm.hpp>

import RHI;
import Graphics;

using namespace Graphics;

TEST(UiLayout, PixelRectToNormalizedSpace)
{
    // 200x100 box at the top-left corner of an 800x600 target.
    const UiRectPlacement placement = PixelToUi({0.0f, 0.0f, 200.0f, 100.0f}, glm::vec2(800.0f, 600.0f));
    EXPECT_FLOAT_EQ(placement.Center.x, 100.0f / 800.0f);
    EXPECT_FLOAT_EQ(placement.Center.y, 550.0f / 600.0f);
    EXPECT_FLOAT_EQ(placement.Extents.x, 0.25f);
    EXPECT_FLOAT_EQ(placement.Extents.y, 100.0f / 600.0f);
}

TEST(UiLayout, EmptyViewportYieldsEmptyPlacement)
{
    const UiRectPlacement placement = PixelToUi({10.0f, 10.0f, 5.0f, 5.0f}, glm::vec2(0.0f, 600.0f));
    EXPECT_FLOAT_EQ(placement.Extents.x, 0.0f);
    EXPECT_FLOAT_EQ(placement.Extents.y, 0.0f);
}

TEST(UiLayout, MakeUiRectFillsRecord)
{
    const VisualRecord record = MakeUiRect({400.0f, 300.0f, 80.0f, 60.0f}, 7, glm::vec2(800.0f, 600.0f), {
        .Fill = Color::Transparent,
        .Outline = Color::Yellow,
        .CornerRadius = {0.1f, 0.1f},
        .Scissor = 2
    });

    EXPECT_EQ(record.Kind, PipelineKind::UIRect);
    EXPECT_FLOAT_EQ(record.Position.x, 440.0f / 800.0f);
    EXPECT_FLOAT_EQ(record.Position.y, 270.0f / 600.0f);
    EXPECT_FLOAT_EQ(record.Layer, 7.0f);
    EXPECT_EQ(record.Color, Color::Transparent);
    EXPECT_EQ(record.OutlineColor, Color::Yellow);
    EXPECT_EQ(record.Scissor, 2u);
}

TEST(UiLayout, MakeGlyphReferencesAtlas)
{
    const VisualRecord record = MakeGlyph({0.0f, 0.0f, 8.0f, 16.0f}, 3, glm::vec2(800.0f, 600.0f), 5, Color::White, 1);
    EXPECT_EQ(record.Kind, PipelineKind::Glyph);
    EXPECT_EQ(record.Texture, 5u);
    EXPECT_EQ(record.Scissor, 1u);
    EXPECT_EQ(record.Color, Color::White);
}

TEST(UiLayout, MakeUiImageAddressesSheetCell)
{
    const VisualRecord record = MakeUiImage({0.0f, 0.0f, 64.0f, 32.0f}, 9, glm::vec2(800.0f, 600.0f),
                                            4, 11, true, Color::Red, 3);
    EXPECT_EQ(record.Kind, PipelineKind::UIImage);
    EXPECT_TRUE(IsScreenSpace(record.Kind));
    EXPECT_EQ(record.Texture, 4u);
    EXPECT_EQ(record.SpriteIndex, 11u);
    EXPECT_TRUE(record.Flip);
    EXPECT_EQ(record.Color, Color::Red);
    EXPECT_EQ(record.Scissor, 3u);
    EXPECT_FLOAT_EQ(record.Position.x, 32.0f / 800.0f);
    EXPECT_FLOAT_EQ(record.Scale.y, 32.0f / 600.0f);
    EXPECT_FLOAT_EQ(record.Layer, 9.0f);
}

TEST(ScissorTable, ZeroAndUnknownIdsCoverTarget)
{
    ScissorTable table;
    const RHI::Extent2D target{800, 600};
    const RHI::ScissorRect full{0, 0, 800, 600};

    EXPECT_EQ(table.Resolve(kNoScissor, target), full);
    EXPECT_EQ(table.Resolve(17, target), full);
}

TEST(ScissorTable, DefineAssignsIdsFromOne)
{
    ScissorTable table;
    const ScissorId a = table.Define({10, 20, 30, 40});
    const ScissorId b = table.Define({0, 0, 1, 1});
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_TRUE(table.Contains(b));

    const RHI::ScissorRect resolved = table.Resolve(a, {800, 600});
    EXPECT_EQ(resolved, (RHI::ScissorRect{10, 20, 30, 40}));
}

TEST(ScissorTable, ResolveClampsToTarget)
{
    ScissorTable table;
    const ScissorId overhang = table.Define({-50, 550, 200, 200});
    const ScissorId outside = table.Define({1000, 1000, 10, 10});

    EXPECT_EQ(table.Resolve(overhang, {800, 600}), (RHI::ScissorRect{0, 550, 150, 50}));
    const RHI::ScissorRect empty = table.Resolve(outside, {800, 600});
    EXPECT_EQ(empty.Width, 0u);
    EXPECT_EQ(empty.Height, 0u);
}

TEST(ScissorTable, ResetForgetsRects)
{
    ScissorTable table;
    const ScissorId id = table.Define({10, 10, 10, 10});
    table.Reset();
    EXPECT_EQ(table.Size(), 0u);
    EXPECT_FALSE(table.Contains(id));
    EXPECT_EQ(table.Resolve(id, {64, 64}), (RHI::ScissorRect{0, 0, 64, 64}));
}
