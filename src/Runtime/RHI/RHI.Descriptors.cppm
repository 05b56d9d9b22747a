module;
#include "RHI.Vulkan.hpp"

export module RHI:Descriptors;

import :Device;
import :Types;

export namespace RHI
{
    // Set layouts shared by every 2D pipeline: Camera (set 0) and Material (set 1).
    class DescriptorLayout
    {
    public:
        DescriptorLayout(VulkanDevice& device, BindGroupLayoutKind kind);
        ~DescriptorLayout();

        DescriptorLayout(const DescriptorLayout&) = delete;
        DescriptorLayout& operator=(const DescriptorLayout&) = delete;

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] BindGroupLayoutKind GetKind() const { return m_Kind; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        BindGroupLayoutKind m_Kind;
        bool m_IsValid = true;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
    };

    // Sets are freed individually when a material is evicted.
    class DescriptorPool
    {
    public:
        explicit DescriptorPool(VulkanDevice& device);
        ~DescriptorPool();

        DescriptorPool(const DescriptorPool&) = delete;
        DescriptorPool& operator=(const DescriptorPool&) = delete;

        [[nodiscard]] VkDescriptorSet Allocate(VkDescriptorSetLayout layout);
        void Free(VkDescriptorSet set);
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        bool m_IsValid = true;
        VkDescriptorPool m_Pool = VK_NULL_HANDLE;
    };
}
