module;

#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

module Graphics:TextureRegistry.Impl;

import :TextureRegistry;
import :Image;
import :SpriteSheet;
import :VisualRecord;
import Core;
import RHI;

namespace Graphics
{
    namespace
    {
        Image MakePlaceholderImage()
        {
            constexpr uint8_t kMagenta[4] = {255, 0, 255, 255};
            constexpr uint8_t kBlack[4] = {0, 0, 0, 255};

            Image image{.Width = 2, .Height = 2, .Pixels = {}};
            image.Pixels.reserve(16);
            for (uint32_t y = 0; y < 2; ++y)
            {
                for (uint32_t x = 0; x < 2; ++x)
                {
                    const uint8_t* px = ((x + y) % 2 == 0) ? kMagenta : kBlack;
                    image.Pixels.insert(image.Pixels.end(), px, px + 4);
                }
            }
            return image;
        }
    }

    Core::Result TextureRegistry::Initialize(RHI::IRenderDevice& device)
    {
        Release(device);

        const Image placeholder = MakePlaceholderImage();
        auto texture = device.CreateTexture({
            .Width = placeholder.Width,
            .Height = placeholder.Height,
            .Rgba8Pixels = placeholder.Pixels,
            .Filter = RHI::TextureFilter::Nearest,
            .DebugName = "PlaceholderTexture"
        });
        if (!texture)
        {
            Core::Log::Error("TextureRegistry: failed to create placeholder texture ({})",
                             Core::ErrorCodeToString(texture.error()));
            return Core::Err(texture.error());
        }

        m_Entries.push_back({
            .Texture = *texture,
            .Sheet = WholeImageSheet(placeholder),
            .Filter = RHI::TextureFilter::Nearest,
            .Generation = 1,
            .Alive = true
        });
        m_LiveCount = 1;
        return Core::Ok();
    }

    void TextureRegistry::Release(RHI::IRenderDevice& device)
    {
        for (auto& entry : m_Entries)
        {
            if (entry.Alive && entry.Texture.IsValid()) device.DestroyTexture(entry.Texture);
        }
        m_Entries.clear();
        m_FreeIds.clear();
        m_LiveCount = 0;
    }

    Core::Expected<TextureId> TextureRegistry::Register(RHI::IRenderDevice& device,
                                                        const Image& image,
                                                        std::optional<SpriteSheetDescriptor> sheet,
                                                        RHI::TextureFilter filter)
    {
        if (m_Entries.empty())
        {
            Core::Log::Error("TextureRegistry: Register called before Initialize");
            return Core::Err<TextureId>(Core::ErrorCode::InvalidState);
        }
        if (!image.IsValid())
        {
            Core::Log::Error("TextureRegistry: rejected {}x{} image with {} bytes",
                             image.Width, image.Height, image.Pixels.size());
            return Core::Err<TextureId>(Core::ErrorCode::InvalidArgument);
        }

        const SpriteSheetDescriptor effectiveSheet = sheet.value_or(WholeImageSheet(image));
        if (!ValidateSheet(image, effectiveSheet)) return Core::Err<TextureId>(Core::ErrorCode::InvalidArgument);

        auto texture = device.CreateTexture({
            .Width = image.Width,
            .Height = image.Height,
            .Rgba8Pixels = image.Pixels,
            .Filter = filter,
            .DebugName = "RegisteredTexture"
        });
        if (!texture) return Core::Err<TextureId>(texture.error());

        TextureId id;
        if (!m_FreeIds.empty())
        {
            id = m_FreeIds.back();
            m_FreeIds.pop_back();
        }
        else
        {
            id = static_cast<TextureId>(m_Entries.size());
            m_Entries.emplace_back();
        }

        Entry& entry = m_Entries[id];
        entry.Texture = *texture;
        entry.Sheet = effectiveSheet;
        entry.Filter = filter;
        ++entry.Generation;
        entry.Alive = true;
        ++m_LiveCount;
        return id;
    }

    Core::Result TextureRegistry::Replace(RHI::IRenderDevice& device,
                                          TextureId id,
                                          const Image& image,
                                          std::optional<SpriteSheetDescriptor> sheet)
    {
        if (id >= m_Entries.size() || !m_Entries[id].Alive) return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (!image.IsValid()) return Core::Err(Core::ErrorCode::InvalidArgument);

        Entry& entry = m_Entries[id];
        const SpriteSheetDescriptor effectiveSheet = sheet.value_or(WholeImageSheet(image));
        if (!ValidateSheet(image, effectiveSheet)) return Core::Err(Core::ErrorCode::InvalidArgument);

        auto texture = device.CreateTexture({
            .Width = image.Width,
            .Height = image.Height,
            .Rgba8Pixels = image.Pixels,
            .Filter = entry.Filter,
            .DebugName = "RegisteredTexture"
        });
        if (!texture) return Core::Err(texture.error());

        // The old texture may still be sampled by a frame in flight; the
        // device defers the actual destruction.
        device.DestroyTexture(entry.Texture);
        entry.Texture = *texture;
        entry.Sheet = effectiveSheet;
        ++entry.Generation;
        return Core::Ok();
    }

    Core::Result TextureRegistry::Unregister(RHI::IRenderDevice& device, TextureId id)
    {
        if (id == kPlaceholderTexture) return Core::Err(Core::ErrorCode::InvalidArgument);
        if (id >= m_Entries.size() || !m_Entries[id].Alive) return Core::Err(Core::ErrorCode::ResourceNotFound);

        Entry& entry = m_Entries[id];
        device.DestroyTexture(entry.Texture);
        entry.Texture = {};
        entry.Alive = false;
        ++entry.Generation;
        m_FreeIds.push_back(id);
        --m_LiveCount;
        return Core::Ok();
    }

    bool TextureRegistry::Contains(TextureId id) const
    {
        return Find(id) != nullptr;
    }

    std::optional<uint32_t> TextureRegistry::GetGeneration(TextureId id) const
    {
        const Entry* entry = Find(id);
        if (!entry) return std::nullopt;
        return entry->Generation;
    }

    RHI::TextureHandle TextureRegistry::GetTexture(TextureId id) const
    {
        const Entry* entry = Find(id);
        return entry ? entry->Texture : RHI::TextureHandle{};
    }

    const SpriteSheetDescriptor* TextureRegistry::GetSheet(TextureId id) const
    {
        const Entry* entry = Find(id);
        return entry ? &entry->Sheet : nullptr;
    }

    const TextureRegistry::Entry* TextureRegistry::Find(TextureId id) const
    {
        if (id >= m_Entries.size()) return nullptr;
        const Entry& entry = m_Entries[id];
        return entry.Alive ? &entry : nullptr;
    }

    SpriteSheetDescriptor TextureRegistry::WholeImageSheet(const Image& image)
    {
        const glm::vec2 size(static_cast<float>(image.Width), static_cast<float>(image.Height));
        return SpriteSheetDescriptor{
            .Padding = glm::vec2(0.0f),
            .BoxSize = size,
            .ImageSize = size,
            .NumCols = 1
        };
    }

    bool TextureRegistry::ValidateSheet(const Image& image, const SpriteSheetDescriptor& sheet)
    {
        const bool ok = sheet.NumCols > 0 &&
                        sheet.BoxSize.x > 0.0f && sheet.BoxSize.y > 0.0f &&
                        sheet.ImageSize.x > 0.0f && sheet.ImageSize.y > 0.0f &&
                        sheet.Padding.x >= 0.0f && sheet.Padding.y >= 0.0f &&
                        2.0f * sheet.Padding.x <= sheet.BoxSize.x &&
                        2.0f * sheet.Padding.y <= sheet.BoxSize.y &&
                        static_cast<float>(sheet.NumCols) * sheet.BoxSize.x <= sheet.ImageSize.x &&
                        sheet.RowCount() > 0;
        if (!ok)
        {
            Core::Log::Error("TextureRegistry: invalid sprite sheet for {}x{} image (cols={}, box={}x{})",
                             image.Width, image.Height, sheet.NumCols, sheet.BoxSize.x, sheet.BoxSize.y);
        }
        return ok;
    }
}
