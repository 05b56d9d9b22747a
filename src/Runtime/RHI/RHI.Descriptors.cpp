module;
#include <array>
#include <cstdint>
#include "RHI.Vulkan.hpp"

module RHI:Descriptors.Impl;
import :Descriptors;
import Core;

namespace RHI
{
    constexpr uint32_t kMaxSets = 1024;

    DescriptorLayout::DescriptorLayout(VulkanDevice& device, BindGroupLayoutKind kind)
        : m_Device(device), m_Kind(kind)
    {
        std::array<VkDescriptorSetLayoutBinding, 2> bindings{};
        uint32_t bindingCount = 0;

        if (kind == BindGroupLayoutKind::Camera)
        {
            bindings[0].binding = 0;
            bindings[0].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            bindings[0].descriptorCount = 1;
            bindings[0].stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
            bindingCount = 1;
        }
        else
        {
            bindings[0].binding = 0;
            bindings[0].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            bindings[0].descriptorCount = 1;
            bindings[0].stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;

            bindings[1].binding = 1;
            bindings[1].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            bindings[1].descriptorCount = 1;
            bindings[1].stageFlags = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
            bindingCount = 2;
        }

        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.bindingCount = bindingCount;
        layoutInfo.pBindings = bindings.data();

        if (vkCreateDescriptorSetLayout(m_Device.GetLogicalDevice(), &layoutInfo, nullptr, &m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout!");
            m_Layout = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    DescriptorLayout::~DescriptorLayout()
    {
        if (m_Layout) vkDestroyDescriptorSetLayout(m_Device.GetLogicalDevice(), m_Layout, nullptr);
    }

    DescriptorPool::DescriptorPool(VulkanDevice& device) : m_Device(device)
    {
        std::array<VkDescriptorPoolSize, 2> poolSizes{};
        poolSizes[0].type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
        poolSizes[0].descriptorCount = kMaxSets * 2;
        poolSizes[1].type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        poolSizes[1].descriptorCount = kMaxSets;

        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.flags = VK_DESCRIPTOR_POOL_CREATE_FREE_DESCRIPTOR_SET_BIT;
        poolInfo.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
        poolInfo.pPoolSizes = poolSizes.data();
        poolInfo.maxSets = kMaxSets;

        if (vkCreateDescriptorPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &m_Pool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool!");
            m_Pool = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    DescriptorPool::~DescriptorPool()
    {
        if (m_Pool) vkDestroyDescriptorPool(m_Device.GetLogicalDevice(), m_Pool, nullptr);
    }

    VkDescriptorSet DescriptorPool::Allocate(VkDescriptorSetLayout layout)
    {
        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.descriptorPool = m_Pool;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &layout;

        VkDescriptorSet set = VK_NULL_HANDLE;
        if (vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate descriptor set!");
            return VK_NULL_HANDLE;
        }
        return set;
    }

    void DescriptorPool::Free(VkDescriptorSet set)
    {
        if (set == VK_NULL_HANDLE) return;

        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        VkDescriptorPool pool = m_Pool;
        m_Device.SafeDestroy([logicalDevice, pool, set]()
        {
            vkFreeDescriptorSets(logicalDevice, pool, 1, &set);
        });
    }
}
