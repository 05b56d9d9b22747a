module;
#include <cstring>
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;

export namespace RHI
{
    // Host-visible buffer, persistently mapped at creation. The 2D renderer
    // streams everything it draws, so there is no device-local path.
    class VulkanBuffer
    {
    public:
        VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage);
        ~VulkanBuffer();

        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }
        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE && m_MappedData != nullptr; }

        // Returns false when the write would run past the end of the buffer.
        [[nodiscard]] bool Write(const void* data, size_t size, size_t offset = 0)
        {
            if (size == 0) return true;
            if (!data || !m_MappedData || offset + size > m_SizeBytes) return false;

            std::memcpy(static_cast<uint8_t*>(m_MappedData) + offset, data, size);
            Flush(offset, size);
            return true;
        }

        void Flush(size_t offset, size_t size);

    private:
        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;
        void* m_MappedData = nullptr;
        size_t m_SizeBytes = 0;
    };
}
