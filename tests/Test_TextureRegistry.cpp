#include <gtest/gtest.h>
#include <cstdint>
#include <optional>
#include <glm/glm.hpp>

import Core;
import RHI;
import Graphics;

#include "FakeRenderDevice.h"

using namespace Graphics;

class TextureRegistryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(Registry.Initialize(Device).has_value());
    }

    void TearDown() override
    {
        Registry.Release(Device);
    }

    FakeRenderDevice Device;
    TextureRegistry Registry;
};

TEST(TextureRegistry, RegisterBeforeInitializeFails)
{
    FakeRenderDevice device;
    TextureRegistry registry;
    auto id = registry.Register(device, ProceduralImages::SolidColor(2, 2, Color::Red));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error(), Core::ErrorCode::InvalidState);
}

TEST_F(TextureRegistryTest, PlaceholderIsAlwaysPresent)
{
    EXPECT_TRUE(Registry.Contains(kPlaceholderTexture));
    EXPECT_EQ(Registry.Count(), 1u);
    EXPECT_TRUE(Registry.GetTexture(kPlaceholderTexture).IsValid());

    const SpriteSheetDescriptor* sheet = Registry.GetSheet(kPlaceholderTexture);
    ASSERT_NE(sheet, nullptr);
    EXPECT_TRUE(sheet->IsIndexValid(0));
    EXPECT_FALSE(sheet->IsIndexValid(1));

    auto result = Registry.Unregister(Device, kPlaceholderTexture);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(TextureRegistryTest, RegisterWithoutSheetUsesWholeImage)
{
    auto id = Registry.Register(Device, ProceduralImages::SolidColor(64, 32, Color::Green));
    ASSERT_TRUE(id.has_value());
    EXPECT_NE(*id, kPlaceholderTexture);

    const SpriteSheetDescriptor* sheet = Registry.GetSheet(*id);
    ASSERT_NE(sheet, nullptr);
    EXPECT_EQ(sheet->NumCols, 1u);
    EXPECT_EQ(sheet->RowCount(), 1u);
    const UvRect cell = sheet->CellRect(0);
    EXPECT_FLOAT_EQ(cell.Min.x, 0.0f);
    EXPECT_FLOAT_EQ(cell.Max.x, 1.0f);
    EXPECT_FLOAT_EQ(cell.Max.y, 1.0f);
}

TEST_F(TextureRegistryTest, RejectsMalformedImageAndSheet)
{
    Image broken{.Width = 4, .Height = 4, .Pixels = {}};
    auto bad = Registry.Register(Device, broken);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), Core::ErrorCode::InvalidArgument);

    SpriteSheetDescriptor sheet = ProceduralImages::SpriteGridSheet(2, 2, 16, 0);
    sheet.Padding = glm::vec2(10.0f); // more than half a cell
    auto badSheet = Registry.Register(Device, ProceduralImages::SolidColor(32, 32, Color::Red), sheet);
    ASSERT_FALSE(badSheet.has_value());
    EXPECT_EQ(badSheet.error(), Core::ErrorCode::InvalidArgument);

    // Four 32px columns do not fit a 64px wide image.
    const SpriteSheetDescriptor tooWide{
        .Padding = glm::vec2(0.0f),
        .BoxSize = glm::vec2(32.0f),
        .ImageSize = glm::vec2(64.0f),
        .NumCols = 4
    };
    auto wide = Registry.Register(Device, ProceduralImages::SolidColor(64, 64, Color::Red), tooWide);
    ASSERT_FALSE(wide.has_value());
    EXPECT_EQ(wide.error(), Core::ErrorCode::InvalidArgument);

    // A cell taller than the image leaves no rows.
    const SpriteSheetDescriptor noRows{
        .Padding = glm::vec2(0.0f),
        .BoxSize = glm::vec2(32.0f, 128.0f),
        .ImageSize = glm::vec2(64.0f),
        .NumCols = 2
    };
    auto empty = Registry.Register(Device, ProceduralImages::SolidColor(64, 64, Color::Red), noRows);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), Core::ErrorCode::InvalidArgument);

    const SpriteSheetDescriptor exact{
        .Padding = glm::vec2(0.0f),
        .BoxSize = glm::vec2(32.0f),
        .ImageSize = glm::vec2(64.0f),
        .NumCols = 2
    };
    auto fits = Registry.Register(Device, ProceduralImages::SolidColor(64, 64, Color::Red), exact);
    ASSERT_TRUE(fits.has_value());

    EXPECT_EQ(Registry.Count(), 2u);
}

TEST_F(TextureRegistryTest, ReplaceBumpsGenerationAndKeepsId)
{
    auto id = Registry.Register(Device, ProceduralImages::SolidColor(8, 8, Color::Red));
    ASSERT_TRUE(id.has_value());
    const auto before = Registry.GetGeneration(*id);
    const RHI::TextureHandle oldTexture = Registry.GetTexture(*id);

    ASSERT_TRUE(Registry.Replace(Device, *id, ProceduralImages::SolidColor(16, 16, Color::Blue)).has_value());

    const auto after = Registry.GetGeneration(*id);
    ASSERT_TRUE(before && after);
    EXPECT_GT(*after, *before);
    EXPECT_NE(Registry.GetTexture(*id), oldTexture);
    EXPECT_EQ(Device.LiveTextures(), 2u);
}

TEST_F(TextureRegistryTest, ReplaceUnknownIdFails)
{
    auto result = Registry.Replace(Device, 99, ProceduralImages::SolidColor(1, 1, Color::Red));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ResourceNotFound);
}

TEST_F(TextureRegistryTest, UnregisterFreesIdForReuseWithNewGeneration)
{
    auto first = Registry.Register(Device, ProceduralImages::SolidColor(4, 4, Color::Red));
    ASSERT_TRUE(first.has_value());
    const uint32_t firstGeneration = *Registry.GetGeneration(*first);

    ASSERT_TRUE(Registry.Unregister(Device, *first).has_value());
    EXPECT_FALSE(Registry.Contains(*first));
    EXPECT_FALSE(Registry.GetGeneration(*first).has_value());
    EXPECT_EQ(Registry.GetSheet(*first), nullptr);

    auto again = Registry.Unregister(Device, *first);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::ResourceNotFound);

    auto second = Registry.Register(Device, ProceduralImages::SolidColor(4, 4, Color::Blue));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, *first);
    EXPECT_GT(*Registry.GetGeneration(*second), firstGeneration);
}

TEST_F(TextureRegistryTest, DeviceFailurePropagates)
{
    Device.CreateTextureError = Core::ErrorCode::OutOfDeviceMemory;
    auto id = Registry.Register(Device, ProceduralImages::SolidColor(4, 4, Color::Red));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error(), Core::ErrorCode::OutOfDeviceMemory);
    EXPECT_EQ(Registry.Count(), 1u);
}

TEST_F(TextureRegistryTest, ReleaseDestroysEveryTexture)
{
    ASSERT_TRUE(Registry.Register(Device, ProceduralImages::SolidColor(4, 4, Color::Red)).has_value());
    ASSERT_TRUE(Registry.Register(Device, ProceduralImages::SolidColor(4, 4, Color::Blue)).has_value());
    EXPECT_EQ(Device.LiveTextures(), 3u);

    Registry.Release(Device);
    EXPECT_EQ(Device.LiveTextures(), 0u);
    EXPECT_EQ(Registry.Count(), 0u);
}
