module;

#include <cstdint>
#include <optional>
#include <vector>

export module Graphics:TextureRegistry;

import Core;
import RHI;
import :Image;
import :SpriteSheet;
import :VisualRecord;

export namespace Graphics
{
    // Stable texture identities over device textures.
    //
    // Every slot carries a generation that increases on Replace and on slot
    // reuse, so anything cached against (id, generation) can detect that the
    // backing texture changed underneath it. Id 0 is the placeholder and is
    // never unregistered.
    class TextureRegistry
    {
    public:
        TextureRegistry() = default;
        TextureRegistry(const TextureRegistry&) = delete;
        TextureRegistry& operator=(const TextureRegistry&) = delete;

        // Uploads the 2x2 magenta/black placeholder as id 0.
        [[nodiscard]] Core::Result Initialize(RHI::IRenderDevice& device);
        void Release(RHI::IRenderDevice& device);

        // Textures without a sheet are addressed as a single cell covering
        // the whole image.
        [[nodiscard]] Core::Expected<TextureId> Register(RHI::IRenderDevice& device,
                                                         const Image& image,
                                                         std::optional<SpriteSheetDescriptor> sheet = std::nullopt,
                                                         RHI::TextureFilter filter = RHI::TextureFilter::Nearest);

        [[nodiscard]] Core::Result Replace(RHI::IRenderDevice& device,
                                           TextureId id,
                                           const Image& image,
                                           std::optional<SpriteSheetDescriptor> sheet = std::nullopt);

        [[nodiscard]] Core::Result Unregister(RHI::IRenderDevice& device, TextureId id);

        [[nodiscard]] bool Contains(TextureId id) const;
        [[nodiscard]] std::optional<uint32_t> GetGeneration(TextureId id) const;
        [[nodiscard]] RHI::TextureHandle GetTexture(TextureId id) const;
        [[nodiscard]] const SpriteSheetDescriptor* GetSheet(TextureId id) const;

        [[nodiscard]] size_t Count() const { return m_LiveCount; }

    private:
        struct Entry
        {
            RHI::TextureHandle Texture{};
            SpriteSheetDescriptor Sheet{};
            RHI::TextureFilter Filter = RHI::TextureFilter::Nearest;
            uint32_t Generation = 0;
            bool Alive = false;
        };

        [[nodiscard]] static bool ValidateSheet(const Image& image, const SpriteSheetDescriptor& sheet);
        [[nodiscard]] static SpriteSheetDescriptor WholeImageSheet(const Image& image);
        [[nodiscard]] const Entry* Find(TextureId id) const;

        std::vector<Entry> m_Entries;
        std::vector<TextureId> m_FreeIds;
        size_t m_LiveCount = 0;
    };
}
