module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI:Image;

import :Device;

export namespace RHI
{
    class VulkanImage
    {
    public:
        VulkanImage(VulkanDevice& device, uint32_t width, uint32_t height, VkFormat format,
                    VkImageUsageFlags usage, VkImageAspectFlags aspect);
        ~VulkanImage();

        VulkanImage(const VulkanImage&) = delete;
        VulkanImage& operator=(const VulkanImage&) = delete;

        [[nodiscard]] VkImage GetHandle() const { return m_Image; }
        [[nodiscard]] VkImageView GetView() const { return m_ImageView; }
        [[nodiscard]] VkFormat GetFormat() const { return m_Format; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Width; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Height; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        static VkFormat FindDepthFormat(VulkanDevice& device);

    private:
        VulkanDevice& m_Device;
        VkImage m_Image = VK_NULL_HANDLE;
        VkImageView m_ImageView = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        VkFormat m_Format;
        uint32_t m_Width = 0;
        uint32_t m_Height = 0;
        bool m_IsValid = true;
    };
}
