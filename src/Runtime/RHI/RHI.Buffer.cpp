module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;
import :Buffer;
import Core;

namespace RHI
{
    VulkanBuffer::VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage)
        : m_Device(device), m_SizeBytes(size)
    {
        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = size;
        bufferInfo.usage = usage;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = VMA_MEMORY_USAGE_AUTO;
        allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;

        VmaAllocationInfo resultInfo{};
        VkResult result = vmaCreateBuffer(device.GetAllocator(), &bufferInfo, &allocInfo,
                                          &m_Buffer, &m_Allocation, &resultInfo);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create buffer of {} bytes (VkResult {})", size, static_cast<int>(result));
            m_Buffer = VK_NULL_HANDLE;
            m_Allocation = VK_NULL_HANDLE;
            m_SizeBytes = 0;
            return;
        }

        m_MappedData = resultInfo.pMappedData;
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (!m_Buffer) return;

        VkBuffer buffer = m_Buffer;
        VmaAllocation allocation = m_Allocation;
        VmaAllocator allocator = m_Device.GetAllocator();

        m_Device.SafeDestroy([allocator, buffer, allocation]()
        {
            vmaDestroyBuffer(allocator, buffer, allocation);
        });
    }

    void VulkanBuffer::Flush(size_t offset, size_t size)
    {
        // No-op on coherent memory.
        vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset, size);
    }
}
