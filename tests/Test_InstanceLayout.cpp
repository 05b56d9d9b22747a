#include <gtest/gtest.h>
#include <cmath>
#include <cstddef>
#include <cstdint>

import RHI;
import Graphics;

using namespace Graphics;

TEST(InstanceLayout, RecordSizesMatchShaderStrides)
{
    static_assert(sizeof(QuadVertex) == 20);
    static_assert(sizeof(SpriteInstance) == 28);
    static_assert(sizeof(UiRectInstance) == 36);
    static_assert(sizeof(GlyphInstance) == sizeof(UiRectInstance));
    static_assert(sizeof(UiImageInstance) == 32);
    static_assert(sizeof(SpriteSheetUniform) == 32);
    SUCCEED();
}

TEST(InstanceLayout, SpriteAttributesMatchOffsets)
{
    ASSERT_EQ(SpriteInstanceAttributes.size(), 4u);
    EXPECT_EQ(SpriteInstanceAttributes[0].Offset, offsetof(SpriteInstance, PosScale));
    EXPECT_EQ(SpriteInstanceAttributes[1].Offset, offsetof(SpriteInstance, ScaleY));
    EXPECT_EQ(SpriteInstanceAttributes[2].Offset, offsetof(SpriteInstance, Index));
    EXPECT_EQ(SpriteInstanceAttributes[3].Offset, offsetof(SpriteInstance, Flip));
    EXPECT_EQ(SpriteInstanceAttributes[2].Format, RHI::VertexFormat::Uint);
}

TEST(InstanceLayout, RectAttributesMatchOffsets)
{
    ASSERT_EQ(UiRectInstanceAttributes.size(), 5u);
    EXPECT_EQ(UiRectInstanceAttributes[0].Offset, offsetof(UiRectInstance, X));
    EXPECT_EQ(UiRectInstanceAttributes[1].Offset, offsetof(UiRectInstance, Color));
    EXPECT_EQ(UiRectInstanceAttributes[2].Offset, offsetof(UiRectInstance, Layer));
    EXPECT_EQ(UiRectInstanceAttributes[3].Offset, offsetof(UiRectInstance, Radius));
    EXPECT_EQ(UiRectInstanceAttributes[4].Offset, offsetof(UiRectInstance, Outline));
}

TEST(InstanceLayout, ImageAttributesMatchOffsets)
{
    ASSERT_EQ(UiImageInstanceAttributes.size(), 5u);
    EXPECT_EQ(UiImageInstanceAttributes[0].Offset, offsetof(UiImageInstance, X));
    EXPECT_EQ(UiImageInstanceAttributes[1].Offset, offsetof(UiImageInstance, Layer));
    EXPECT_EQ(UiImageInstanceAttributes[2].Offset, offsetof(UiImageInstance, Index));
    EXPECT_EQ(UiImageInstanceAttributes[3].Offset, offsetof(UiImageInstance, Flip));
    EXPECT_EQ(UiImageInstanceAttributes[4].Offset, offsetof(UiImageInstance, Color));
    EXPECT_EQ(UiImageInstanceAttributes[2].Format, RHI::VertexFormat::Uint);
}

TEST(InstanceLayout, InstanceLocationsFollowGeometry)
{
    for (const auto& attribute : SpriteInstanceAttributes) EXPECT_GE(attribute.Location, QuadVertexAttributes.size());
    for (const auto& attribute : UiRectInstanceAttributes) EXPECT_GE(attribute.Location, QuadVertexAttributes.size());
    for (const auto& attribute : UiImageInstanceAttributes) EXPECT_GE(attribute.Location, QuadVertexAttributes.size());
}

TEST(InstanceLayout, UiLayerDepthIsFrontForHighLayers)
{
    EXPECT_FLOAT_EQ(UiLayerToDepth(65535.0f), 0.0f);
    EXPECT_FLOAT_EQ(UiLayerToDepth(0.0f), 1.0f);
    EXPECT_LT(UiLayerToDepth(10.0f), UiLayerToDepth(9.0f));
    EXPECT_FLOAT_EQ(UiLayerToDepth(-5.0f), 1.0f);
    EXPECT_FLOAT_EQ(UiLayerToDepth(1e9f), 0.0f);
}

TEST(InstanceLayout, SheetUniformTailSentinel)
{
    SpriteSheetUniform uniform{};
    EXPECT_EQ(uniform.Tail, 0xDEADBEEFu);
}

TEST(GeometryTemplate, QuadCoversUnitSquare)
{
    EXPECT_EQ(QuadGeometry::GetIndexCount(), 6u);
    for (const QuadVertex& v : QuadVertices)
    {
        EXPECT_FLOAT_EQ(std::abs(v.Position.x), 0.5f);
        EXPECT_FLOAT_EQ(std::abs(v.Position.y), 0.5f);
        EXPECT_FLOAT_EQ(v.Uv.x, v.Position.x + 0.5f);
        EXPECT_FLOAT_EQ(v.Uv.y, v.Position.y + 0.5f);
    }
    for (uint16_t index : QuadIndices) EXPECT_LT(index, QuadVertices.size());
}
