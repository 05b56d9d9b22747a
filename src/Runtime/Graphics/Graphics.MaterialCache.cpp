module;

#include <cstdint>
#include <unordered_map>

module Graphics:MaterialCache.Impl;

import :MaterialCache;
import :InstanceLayout;
import :SpriteSheet;
import :TextureRegistry;
import :VisualRecord;
import Core;
import RHI;

namespace Graphics
{
    Core::Expected<RHI::BindGroupHandle> MaterialCache::GetOrCreate(RHI::IRenderDevice& device,
                                                                   const TextureRegistry& textures,
                                                                   TextureId texture)
    {
        const auto generation = textures.GetGeneration(texture);
        if (!generation) return Core::Err<RHI::BindGroupHandle>(Core::ErrorCode::ResourceNotFound);

        if (auto it = m_Entries.find(texture); it != m_Entries.end())
        {
            if (it->second.Generation == *generation)
            {
                it->second.Referenced = true;
                return it->second.Group;
            }

            Core::Log::Debug("MaterialCache: texture {} changed (gen {} -> {}), rebuilding",
                             texture, it->second.Generation, *generation);
            DestroyEntry(device, it->second);
            m_Entries.erase(it);
        }

        const SpriteSheetUniform uniform = textures.GetSheet(texture)->ToUniform();

        auto buffer = device.CreateBuffer({
            .SizeBytes = sizeof(SpriteSheetUniform),
            .Usage = RHI::BufferUsage::Uniform,
            .Domain = RHI::BufferDomain::Static,
            .DebugName = "SpriteSheetUniform"
        });
        if (!buffer) return Core::Err<RHI::BindGroupHandle>(buffer.error());
        device.WriteBuffer(*buffer, &uniform, sizeof(uniform));

        auto group = device.CreateBindGroup({
            .Layout = RHI::BindGroupLayoutKind::Material,
            .Uniform = *buffer,
            .Texture = textures.GetTexture(texture)
        });
        if (!group)
        {
            device.DestroyBuffer(*buffer);
            return Core::Err<RHI::BindGroupHandle>(group.error());
        }

        m_Entries.emplace(texture, Entry{
            .Group = *group,
            .SheetUniform = *buffer,
            .Generation = *generation,
            .Referenced = true
        });
        ++m_BuildCount;
        return *group;
    }

    void MaterialCache::Invalidate(RHI::IRenderDevice& device, TextureId texture)
    {
        auto it = m_Entries.find(texture);
        if (it == m_Entries.end()) return;

        DestroyEntry(device, it->second);
        m_Entries.erase(it);
    }

    void MaterialCache::EndFrame(RHI::IRenderDevice& device)
    {
        for (auto it = m_Entries.begin(); it != m_Entries.end();)
        {
            if (!it->second.Referenced)
            {
                DestroyEntry(device, it->second);
                it = m_Entries.erase(it);
                continue;
            }
            it->second.Referenced = false;
            ++it;
        }
    }

    void MaterialCache::Clear(RHI::IRenderDevice& device)
    {
        for (auto& [texture, entry] : m_Entries) DestroyEntry(device, entry);
        m_Entries.clear();
    }

    void MaterialCache::DestroyEntry(RHI::IRenderDevice& device, Entry& entry)
    {
        if (entry.Group.IsValid()) device.DestroyBindGroup(entry.Group);
        if (entry.SheetUniform.IsValid()) device.DestroyBuffer(entry.SheetUniform);
        entry.Group = {};
        entry.SheetUniform = {};
    }
}
