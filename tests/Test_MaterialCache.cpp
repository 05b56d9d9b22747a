#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>

import Core;
import RHI;
import Graphics;

#include "FakeRenderDevice.h"

using namespace Graphics;

class MaterialCacheTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(Textures.Initialize(Device).has_value());
        auto id = Textures.Register(Device,
                                    ProceduralImages::SolidColor(64, 64, Color::Red),
                                    ProceduralImages::SpriteGridSheet(2, 2, 32, 1));
        ASSERT_TRUE(id.has_value());
        Atlas = *id;
    }

    void TearDown() override
    {
        Materials.Clear(Device);
        Textures.Release(Device);
    }

    FakeRenderDevice Device;
    TextureRegistry Textures;
    MaterialCache Materials;
    TextureId Atlas = kPlaceholderTexture;
};

TEST_F(MaterialCacheTest, BuildsOnceAndReuses)
{
    auto first = Materials.GetOrCreate(Device, Textures, Atlas);
    ASSERT_TRUE(first.has_value());
    auto second = Materials.GetOrCreate(Device, Textures, Atlas);
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(*first, *second);
    EXPECT_EQ(Materials.GetBuildCount(), 1u);
    EXPECT_EQ(Materials.Size(), 1u);
}

TEST_F(MaterialCacheTest, BindGroupCarriesTextureAndSheetUniform)
{
    auto group = Materials.GetOrCreate(Device, Textures, Atlas);
    ASSERT_TRUE(group.has_value());

    const RHI::BindGroupDesc* desc = Device.FindBindGroup(*group);
    ASSERT_NE(desc, nullptr);
    EXPECT_EQ(desc->Layout, RHI::BindGroupLayoutKind::Material);
    EXPECT_EQ(desc->Texture, Textures.GetTexture(Atlas));

    const auto* uniform = Device.FindBuffer(desc->Uniform);
    ASSERT_NE(uniform, nullptr);
    EXPECT_EQ(uniform->Desc.Usage, RHI::BufferUsage::Uniform);

    SpriteSheetUniform sheet{};
    std::memcpy(&sheet, uniform->Bytes.data(), sizeof(sheet));
    EXPECT_EQ(sheet.NumCols, 2u);
    EXPECT_FLOAT_EQ(sheet.BoxSize.x, 32.0f);
    EXPECT_FLOAT_EQ(sheet.Padding.y, 1.0f);
    EXPECT_EQ(sheet.Tail, 0xDEADBEEFu);
}

TEST_F(MaterialCacheTest, MissingTextureIsNotFound)
{
    auto group = Materials.GetOrCreate(Device, Textures, 1234);
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error(), Core::ErrorCode::ResourceNotFound);
    EXPECT_EQ(Materials.Size(), 0u);
}

TEST_F(MaterialCacheTest, RebuildsWhenTextureGenerationChanges)
{
    auto before = Materials.GetOrCreate(Device, Textures, Atlas);
    ASSERT_TRUE(before.has_value());

    ASSERT_TRUE(Textures.Replace(Device, Atlas, ProceduralImages::SolidColor(32, 32, Color::Blue)).has_value());

    auto after = Materials.GetOrCreate(Device, Textures, Atlas);
    ASSERT_TRUE(after.has_value());
    EXPECT_NE(*before, *after);
    EXPECT_EQ(Materials.GetBuildCount(), 2u);
    EXPECT_EQ(Device.FindBindGroup(*before), nullptr);

    const RHI::BindGroupDesc* desc = Device.FindBindGroup(*after);
    ASSERT_NE(desc, nullptr);
    EXPECT_EQ(desc->Texture, Textures.GetTexture(Atlas));
}

TEST_F(MaterialCacheTest, EndFrameEvictsUnreferencedEntries)
{
    ASSERT_TRUE(Materials.GetOrCreate(Device, Textures, Atlas).has_value());
    ASSERT_TRUE(Materials.GetOrCreate(Device, Textures, kPlaceholderTexture).has_value());
    Materials.EndFrame(Device);
    EXPECT_EQ(Materials.Size(), 2u);

    // Only the atlas is used next frame.
    ASSERT_TRUE(Materials.GetOrCreate(Device, Textures, Atlas).has_value());
    Materials.EndFrame(Device);

    EXPECT_TRUE(Materials.Contains(Atlas));
    EXPECT_FALSE(Materials.Contains(kPlaceholderTexture));
    EXPECT_EQ(Device.LiveBindGroups(), 1u);
}

TEST_F(MaterialCacheTest, InvalidateDropsEntryAndResources)
{
    ASSERT_TRUE(Materials.GetOrCreate(Device, Textures, Atlas).has_value());
    const size_t buffersBefore = Device.LiveBuffers();

    Materials.Invalidate(Device, Atlas);
    EXPECT_FALSE(Materials.Contains(Atlas));
    EXPECT_EQ(Device.LiveBindGroups(), 0u);
    EXPECT_EQ(Device.LiveBuffers(), buffersBefore - 1);

    Materials.Invalidate(Device, Atlas);
    EXPECT_EQ(Device.InvalidDestroys, 0u);
}

TEST_F(MaterialCacheTest, UniformAllocationFailurePropagates)
{
    Device.CreateBufferError = Core::ErrorCode::OutOfDeviceMemory;
    auto group = Materials.GetOrCreate(Device, Textures, Atlas);
    ASSERT_FALSE(group.has_value());
    EXPECT_EQ(group.error(), Core::ErrorCode::OutOfDeviceMemory);
    EXPECT_EQ(Materials.Size(), 0u);
}
