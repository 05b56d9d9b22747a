module;

#include <cstdint>
#include <concepts>
#include <memory>
#include <vector>
#include <deque>
#include <utility>

export module Core:ResourcePool;
import :Error;

export namespace Core
{
    template<typename H>
    concept GenerationalHandle = requires(H h) {
        { h.Index } -> std::convertible_to<uint32_t>;
        { h.Generation } -> std::convertible_to<uint32_t>;
    };

    // Slot pool for GPU-side objects owned by a render device.
    //
    // Render-thread only: no locking. Removal is deferred by FramesInFlight so
    // a resource referenced by a frame still executing on the GPU stays alive
    // until that frame's slot comes around again.
    template <typename T, GenerationalHandle Handle>
    class ResourcePool
    {
    public:
        ResourcePool() = default;

        ResourcePool(const ResourcePool&) = delete;
        ResourcePool& operator=(const ResourcePool&) = delete;
        ResourcePool(ResourcePool&&) noexcept = default;
        ResourcePool& operator=(ResourcePool&&) noexcept = default;

        void Initialize(const uint32_t framesInFlight)
        {
            m_FramesInFlight = framesInFlight;
        }

        Handle Add(std::unique_ptr<T> resource)
        {
            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            slot.Data = std::move(resource);
            ++slot.Generation;
            slot.IsActive = true;
            ++m_LiveCount;

            return {index, slot.Generation};
        }

        template<typename... Args>
        Handle Create(Args&&... args)
        {
            return Add(std::make_unique<T>(std::forward<Args>(args)...));
        }

        // Soft delete now (Get fails immediately), free after FramesInFlight.
        void Remove(Handle handle, uint64_t currentFrameNumber)
        {
            if (handle.Index >= m_Slots.size()) return;

            Slot& slot = m_Slots[handle.Index];
            if (slot.IsActive && slot.Generation == handle.Generation)
            {
                slot.IsActive = false;
                --m_LiveCount;

                m_PendingKillList.push_back({
                    .SlotIndex = handle.Index,
                    .Generation = handle.Generation,
                    .KillFrameNumber = currentFrameNumber
                });
            }
        }

        void ProcessDeletions(uint64_t currentFrameNumber)
        {
            if (m_PendingKillList.empty()) return;

            std::erase_if(m_PendingKillList, [&](const PendingKill& item)
            {
                if (currentFrameNumber <= item.KillFrameNumber + m_FramesInFlight)
                    return false;

                if (item.SlotIndex < m_Slots.size())
                {
                    Slot& slot = m_Slots[item.SlotIndex];
                    if (!slot.IsActive && slot.Generation == item.Generation)
                    {
                        slot.Data.reset();
                        m_FreeIndices.push_back(item.SlotIndex);
                    }
                }
                return true;
            });
        }

        [[nodiscard]] Expected<T*> TryGet(Handle handle) const
        {
            T* ptr = Get(handle);
            if (!ptr)
                return std::unexpected(ErrorCode::ResourceNotFound);
            return ptr;
        }

        // nullptr for stale or unknown handles.
        [[nodiscard]] T* Get(Handle handle) const
        {
            if (handle.Index < m_Slots.size())
            {
                const Slot& slot = m_Slots[handle.Index];
                if (slot.IsActive && slot.Generation == handle.Generation)
                {
                    return slot.Data.get();
                }
            }
            return nullptr;
        }

        // Drops everything immediately, pending kills included. Only valid once
        // the GPU is idle.
        void Clear()
        {
            m_PendingKillList.clear();
            m_Slots.clear();
            m_FreeIndices.clear();
            m_LiveCount = 0;
        }

        [[nodiscard]] size_t Capacity() const { return m_Slots.size(); }
        [[nodiscard]] size_t LiveCount() const { return m_LiveCount; }
        [[nodiscard]] size_t GetPendingDeletionCount() const { return m_PendingKillList.size(); }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data; // heap storage keeps pointers stable across slot growth
            uint32_t Generation = 0;
            bool IsActive = false;
        };

        struct PendingKill
        {
            uint32_t SlotIndex;
            uint32_t Generation;
            uint64_t KillFrameNumber;
        };

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<PendingKill> m_PendingKillList;

        size_t m_LiveCount = 0;
        uint32_t m_FramesInFlight = 2;
    };
}
