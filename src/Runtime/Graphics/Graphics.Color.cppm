module;

#include <cstdint>
#include <expected>
#include <string_view>
#include <glm/glm.hpp>

export module Graphics:Color;

// =============================================================================
// Packed RGBA color, R in the most significant byte:
//   0xRRGGBBAA
// Shaders unpack with ((c >> 24) & 0xFF, (c >> 16) & 0xFF, (c >> 8) & 0xFF, c & 0xFF) / 255.
// =============================================================================

export namespace Graphics::Color
{
    [[nodiscard]] constexpr uint32_t FromRgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) noexcept
    {
        return (static_cast<uint32_t>(r) << 24)
             | (static_cast<uint32_t>(g) << 16)
             | (static_cast<uint32_t>(b) << 8)
             | static_cast<uint32_t>(a);
    }

    // 0xRRGGBB with opaque alpha.
    [[nodiscard]] constexpr uint32_t FromRgb(uint32_t rgb) noexcept
    {
        return (rgb << 8) | 0xFFu;
    }

    [[nodiscard]] constexpr uint32_t FromFloats(float r, float g, float b, float a = 1.0f) noexcept
    {
        auto clamp = [](float v) noexcept -> uint8_t {
            if (v <= 0.0f) return 0;
            if (v >= 1.0f) return 255;
            return static_cast<uint8_t>(v * 255.0f + 0.5f);
        };
        return FromRgba8(clamp(r), clamp(g), clamp(b), clamp(a));
    }

    [[nodiscard]] constexpr uint8_t R(uint32_t c) noexcept { return static_cast<uint8_t>((c >> 24) & 0xFF); }
    [[nodiscard]] constexpr uint8_t G(uint32_t c) noexcept { return static_cast<uint8_t>((c >> 16) & 0xFF); }
    [[nodiscard]] constexpr uint8_t B(uint32_t c) noexcept { return static_cast<uint8_t>((c >> 8) & 0xFF); }
    [[nodiscard]] constexpr uint8_t A(uint32_t c) noexcept { return static_cast<uint8_t>(c & 0xFF); }

    [[nodiscard]] glm::vec4 ToVec4(uint32_t c) noexcept;

    enum class ParseError : uint8_t
    {
        MissingHash,
        BadLength,
        InvalidCharacter
    };

    [[nodiscard]] std::string_view ParseErrorToString(ParseError error) noexcept;

    // Accepts #rgb, #rgba, #rrggbb and #rrggbbaa (case-insensitive). Short
    // forms repeat each digit, so #abc == #aabbcc. Missing alpha is opaque.
    [[nodiscard]] std::expected<uint32_t, ParseError> ParseHex(std::string_view text);

    inline constexpr uint32_t Black = FromRgb(0x000000);
    inline constexpr uint32_t White = FromRgb(0xFFFFFF);
    inline constexpr uint32_t Red = FromRgb(0xFF0000);
    inline constexpr uint32_t Green = FromRgb(0x00FF00);
    inline constexpr uint32_t Blue = FromRgb(0x0000FF);
    inline constexpr uint32_t Yellow = FromRgb(0xFFFF00);
    inline constexpr uint32_t Transparent = 0x00000000u;
}
