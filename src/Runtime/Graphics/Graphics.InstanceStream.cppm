module;

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

export module Graphics:InstanceStream;

import Core;
import RHI;

export namespace Graphics
{
    // Host-side instance records plus the device buffer they are streamed
    // into. Records are rebuilt from scratch every frame; capacity on both
    // sides only grows unless ShrinkToFit or Release is called.
    template <typename T>
    class InstanceStream
    {
    public:
        static constexpr size_t MinCapacity = 64;

        InstanceStream() = default;
        InstanceStream(const InstanceStream&) = delete;
        InstanceStream& operator=(const InstanceStream&) = delete;
        InstanceStream(InstanceStream&&) noexcept = default;
        InstanceStream& operator=(InstanceStream&&) noexcept = default;

        void Reset() { m_Records.clear(); }
        void Push(const T& record) { m_Records.push_back(record); }

        [[nodiscard]] size_t Size() const { return m_Records.size(); }
        [[nodiscard]] bool Empty() const { return m_Records.empty(); }
        [[nodiscard]] std::span<const T> Records() const { return m_Records; }
        [[nodiscard]] std::span<T> Records() { return m_Records; }

        // Removes host records matching pred, keeping the order of the rest.
        template <typename Pred>
        size_t EraseIf(Pred pred) { return std::erase_if(m_Records, pred); }

        [[nodiscard]] size_t DeviceCapacity() const { return m_DeviceCapacity; }
        [[nodiscard]] RHI::BufferHandle GetBuffer() const { return m_Buffer; }
        [[nodiscard]] uint64_t GetReallocationCount() const { return m_Reallocations; }

        // Copies the host records into the current frame slot of the device
        // buffer, growing it first if needed. An empty stream uploads nothing.
        [[nodiscard]] Core::Result Upload(RHI::IRenderDevice& device, std::string_view debugName = "InstanceStream")
        {
            if (m_Records.empty()) return Core::Ok();

            if (m_Records.size() > m_DeviceCapacity || !m_Buffer.IsValid())
            {
                auto result = Reallocate(device, GrowthCapacity(m_Records.size()), debugName);
                if (!result) return result;
            }

            device.WriteBuffer(m_Buffer, m_Records.data(), m_Records.size() * sizeof(T));
            return Core::Ok();
        }

        // Reallocates the device buffer down to the smallest capacity that
        // still fits the current records.
        [[nodiscard]] Core::Result ShrinkToFit(RHI::IRenderDevice& device, std::string_view debugName = "InstanceStream")
        {
            if (m_Records.empty())
            {
                Release(device);
                m_Records.shrink_to_fit();
                return Core::Ok();
            }

            const size_t target = GrowthCapacity(m_Records.size());
            m_Records.shrink_to_fit();
            if (target >= m_DeviceCapacity) return Core::Ok();
            return Reallocate(device, target, debugName);
        }

        void Release(RHI::IRenderDevice& device)
        {
            if (m_Buffer.IsValid()) device.DestroyBuffer(m_Buffer);
            m_Buffer = {};
            m_DeviceCapacity = 0;
        }

        [[nodiscard]] static size_t GrowthCapacity(size_t count)
        {
            return std::max(MinCapacity, std::bit_ceil(count));
        }

    private:
        std::vector<T> m_Records;
        RHI::BufferHandle m_Buffer{};
        size_t m_DeviceCapacity = 0;
        uint64_t m_Reallocations = 0;

        Core::Result Reallocate(RHI::IRenderDevice& device, size_t capacity, std::string_view debugName)
        {
            auto buffer = device.CreateBuffer({
                .SizeBytes = capacity * sizeof(T),
                .Usage = RHI::BufferUsage::Vertex,
                .Domain = RHI::BufferDomain::Dynamic,
                .DebugName = debugName
            });
            if (!buffer)
            {
                Core::Log::Error("InstanceStream '{}': failed to allocate {} records ({})",
                                 debugName, capacity, Core::ErrorCodeToString(buffer.error()));
                return Core::Err(buffer.error());
            }

            if (m_Buffer.IsValid()) device.DestroyBuffer(m_Buffer);
            m_Buffer = *buffer;
            m_DeviceCapacity = capacity;
            ++m_Reallocations;
            return Core::Ok();
        }
    };
}
