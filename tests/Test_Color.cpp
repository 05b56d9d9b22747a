#include <gtest/gtest.h>
#include <cstdint>
#include <glm/glm.hpp>

import Graphics;

using namespace Graphics;

TEST(Color, PacksRedInMostSignificantByte)
{
    const uint32_t c = Color::FromRgba8(0x12, 0x34, 0x56, 0x78);
    EXPECT_EQ(c, 0x12345678u);
    EXPECT_EQ(Color::R(c), 0x12);
    EXPECT_EQ(Color::G(c), 0x34);
    EXPECT_EQ(Color::B(c), 0x56);
    EXPECT_EQ(Color::A(c), 0x78);
}

TEST(Color, FromRgbIsOpaque)
{
    EXPECT_EQ(Color::FromRgb(0x336699), 0x336699FFu);
    EXPECT_EQ(Color::A(Color::Red), 0xFF);
    EXPECT_EQ(Color::Transparent, 0u);
}

TEST(Color, FromFloatsRoundsAndClamps)
{
    const uint32_t c = Color::FromFloats(2.0f, -1.0f, 0.5f, 1.0f);
    EXPECT_EQ(Color::R(c), 255);
    EXPECT_EQ(Color::G(c), 0);
    EXPECT_EQ(Color::B(c), 128);
    EXPECT_EQ(Color::A(c), 255);
}

TEST(Color, ToVec4Normalizes)
{
    const glm::vec4 white = Color::ToVec4(Color::White);
    EXPECT_FLOAT_EQ(white.r, 1.0f);
    EXPECT_FLOAT_EQ(white.a, 1.0f);

    const glm::vec4 none = Color::ToVec4(Color::Transparent);
    EXPECT_FLOAT_EQ(glm::dot(none, none), 0.0f);
}

TEST(Color, PackUnpackRoundTripsWithinOneStep)
{
    for (uint32_t v = 0; v < 256; v += 17)
    {
        const uint8_t r = static_cast<uint8_t>(v);
        const uint8_t g = static_cast<uint8_t>(255 - v);
        const uint8_t b = static_cast<uint8_t>((v * 7) & 0xFF);
        const uint8_t a = static_cast<uint8_t>((v * 3) & 0xFF);
        const glm::vec4 c = Color::ToVec4(Color::FromRgba8(r, g, b, a));
        EXPECT_NEAR(c.r, r / 255.0f, 1.0f / 255.0f);
        EXPECT_NEAR(c.g, g / 255.0f, 1.0f / 255.0f);
        EXPECT_NEAR(c.b, b / 255.0f, 1.0f / 255.0f);
        EXPECT_NEAR(c.a, a / 255.0f, 1.0f / 255.0f);

        const uint32_t repacked = Color::FromFloats(c.r, c.g, c.b, c.a);
        EXPECT_EQ(repacked, Color::FromRgba8(r, g, b, a));
    }
}

TEST(Color, ParseHexLongForms)
{
    auto rgb = Color::ParseHex("#336699");
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(*rgb, 0x336699FFu);

    auto rgba = Color::ParseHex("#11223344");
    ASSERT_TRUE(rgba.has_value());
    EXPECT_EQ(*rgba, 0x11223344u);
}

TEST(Color, ParseHexShortFormsRepeatDigits)
{
    auto rgb = Color::ParseHex("#abc");
    ASSERT_TRUE(rgb.has_value());
    EXPECT_EQ(*rgb, 0xAABBCCFFu);

    auto rgba = Color::ParseHex("#FfF8");
    ASSERT_TRUE(rgba.has_value());
    EXPECT_EQ(*rgba, 0xFFFFFF88u);
}

TEST(Color, ParseHexErrors)
{
    EXPECT_EQ(Color::ParseHex("336699").error(), Color::ParseError::MissingHash);
    EXPECT_EQ(Color::ParseHex("").error(), Color::ParseError::MissingHash);
    EXPECT_EQ(Color::ParseHex("#12345").error(), Color::ParseError::BadLength);
    EXPECT_EQ(Color::ParseHex("#").error(), Color::ParseError::BadLength);
    EXPECT_EQ(Color::ParseHex("#12g").error(), Color::ParseError::InvalidCharacter);
}
