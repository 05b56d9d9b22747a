module;

#include <cstdint>
#include <unordered_map>

export module Graphics:MaterialCache;

import Core;
import RHI;
import :VisualRecord;
import :TextureRegistry;

export namespace Graphics
{
    // Material bind groups (texture + sampler + sprite-sheet uniform) keyed by
    // texture id. Render thread only.
    //
    // Entries remember the texture generation they were built against and are
    // rebuilt lazily when the registry reports a newer one. Entries that no
    // batch asked for during a frame are dropped at EndFrame.
    class MaterialCache
    {
    public:
        MaterialCache() = default;
        MaterialCache(const MaterialCache&) = delete;
        MaterialCache& operator=(const MaterialCache&) = delete;

        [[nodiscard]] Core::Expected<RHI::BindGroupHandle> GetOrCreate(RHI::IRenderDevice& device,
                                                                      const TextureRegistry& textures,
                                                                      TextureId texture);

        void Invalidate(RHI::IRenderDevice& device, TextureId texture);
        void EndFrame(RHI::IRenderDevice& device);
        void Clear(RHI::IRenderDevice& device);

        [[nodiscard]] bool Contains(TextureId texture) const { return m_Entries.contains(texture); }
        [[nodiscard]] size_t Size() const { return m_Entries.size(); }
        [[nodiscard]] uint64_t GetBuildCount() const { return m_BuildCount; }

    private:
        struct Entry
        {
            RHI::BindGroupHandle Group{};
            RHI::BufferHandle SheetUniform{};
            uint32_t Generation = 0;
            bool Referenced = false;
        };

        static void DestroyEntry(RHI::IRenderDevice& device, Entry& entry);

        std::unordered_map<TextureId, Entry> m_Entries;
        uint64_t m_BuildCount = 0;
    };
}
