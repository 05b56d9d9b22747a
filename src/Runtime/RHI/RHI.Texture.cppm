module;
#include <cstdint>
#include <memory>
#include <span>
#include "RHI.Vulkan.hpp"

export module RHI:Texture;

import :Device;
import :Image;
import :Types;

export namespace RHI
{
    // Sampled RGBA8 texture. Pixels are uploaded once through a staging buffer;
    // replacing the contents means creating a new texture.
    class VulkanTexture
    {
    public:
        VulkanTexture(VulkanDevice& device, const TextureDesc& desc);
        ~VulkanTexture();

        VulkanTexture(const VulkanTexture&) = delete;
        VulkanTexture& operator=(const VulkanTexture&) = delete;

        [[nodiscard]] VkImage GetImage() const { return m_Image ? m_Image->GetHandle() : VK_NULL_HANDLE; }
        [[nodiscard]] VkImageView GetView() const { return m_Image ? m_Image->GetView() : VK_NULL_HANDLE; }
        [[nodiscard]] VkSampler GetSampler() const { return m_Sampler; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Image ? m_Image->GetWidth() : 0; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Image ? m_Image->GetHeight() : 0; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        std::unique_ptr<VulkanImage> m_Image;
        VkSampler m_Sampler = VK_NULL_HANDLE;
        bool m_IsValid = false;

        bool CreateSampler(TextureFilter filter);
        bool Upload(std::span<const uint8_t> pixels, uint32_t width, uint32_t height);
    };
}
