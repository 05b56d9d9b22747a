module;
#include <cstdint>
#include <limits>
#include <functional>

export module Core:Handle;

export namespace Core
{
    // -------------------------------------------------------------------------
    // StrongHandle - Type-safe generational handle template
    // -------------------------------------------------------------------------
    // The Tag parameter keeps handles of different GPU resource kinds apart at
    // compile time:
    //
    //   struct BufferTag {};
    //   using BufferHandle = Core::StrongHandle<BufferTag>;
    //
    //   struct BindGroupTag {};
    //   using BindGroupHandle = Core::StrongHandle<BindGroupTag>;
    //
    //   // BufferHandle b = bindGroup; // Compile error - different types!
    //
    // Generation is bumped every time a pool slot is recycled, so a handle that
    // outlived its resource fails lookups instead of aliasing the new one.
    // -------------------------------------------------------------------------
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;

        constexpr StrongHandle(uint32_t index, uint32_t gen) : Index(index), Generation(gen)
        {
        }

        [[nodiscard]] constexpr bool IsValid() const noexcept
        {
            return Index != INVALID_INDEX;
        }

        [[nodiscard]] constexpr explicit operator bool() const noexcept
        {
            return IsValid();
        }

        // Generation in the high half, index in the low half.
        [[nodiscard]] constexpr uint64_t Pack() const noexcept
        {
            return (static_cast<uint64_t>(Generation) << 32) | Index;
        }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

namespace std
{
    template <typename Tag>
    struct hash<Core::StrongHandle<Tag>>
    {
        std::size_t operator()(const Core::StrongHandle<Tag>& h) const noexcept
        {
            uint64_t val = h.Pack();

            // MurmurHash3 finalizer
            val ^= val >> 33;
            val *= 0xff51afd7ed558ccd;
            val ^= val >> 33;
            val *= 0xc4ceb9fe1a85ec53;
            val ^= val >> 33;

            return static_cast<std::size_t>(val);
        }
    };
}
