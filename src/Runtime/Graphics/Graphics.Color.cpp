module;

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <glm/glm.hpp>

module Graphics:Color.Impl;
import :Color;

namespace Graphics::Color
{
    namespace
    {
        std::optional<uint32_t> HexDigit(char c)
        {
            if (c >= '0' && c <= '9') return static_cast<uint32_t>(c - '0');
            if (c >= 'a' && c <= 'f') return static_cast<uint32_t>(c - 'a' + 10);
            if (c >= 'A' && c <= 'F') return static_cast<uint32_t>(c - 'A' + 10);
            return std::nullopt;
        }
    }

    glm::vec4 ToVec4(uint32_t c) noexcept
    {
        return glm::vec4(R(c), G(c), B(c), A(c)) / 255.0f;
    }

    std::string_view ParseErrorToString(ParseError error) noexcept
    {
        switch (error)
        {
        case ParseError::MissingHash: return "color strings must begin with '#'";
        case ParseError::BadLength: return "expected #rgb, #rgba, #rrggbb or #rrggbbaa";
        case ParseError::InvalidCharacter: return "invalid hexadecimal digit";
        }
        return "unknown";
    }

    std::expected<uint32_t, ParseError> ParseHex(std::string_view text)
    {
        if (text.empty() || text.front() != '#') return std::unexpected(ParseError::MissingHash);

        const std::string_view digits = text.substr(1);

        uint32_t nibbles[8] = {};
        for (size_t i = 0; i < digits.size() && i < 8; ++i)
        {
            auto value = HexDigit(digits[i]);
            if (!value) return std::unexpected(ParseError::InvalidCharacter);
            nibbles[i] = *value;
        }

        uint32_t channels[4] = {0, 0, 0, 0xFF};
        switch (digits.size())
        {
        case 3:
        case 4:
            for (size_t i = 0; i < digits.size(); ++i)
                channels[i] = nibbles[i] * 17; // 0xA -> 0xAA
            break;
        case 6:
        case 8:
            for (size_t i = 0; i < digits.size() / 2; ++i)
                channels[i] = nibbles[2 * i] * 16 + nibbles[2 * i + 1];
            break;
        default:
            return std::unexpected(ParseError::BadLength);
        }

        return FromRgba8(static_cast<uint8_t>(channels[0]), static_cast<uint8_t>(channels[1]),
                         static_cast<uint8_t>(channels[2]), static_cast<uint8_t>(channels[3]));
    }
}
