#include <gtest/gtest.h>
#include <cstdint>
#include <type_traits>
#include <unordered_set>

import Core;
import RHI;

// -----------------------------------------------------------------------------
// Basic Functionality
// -----------------------------------------------------------------------------

TEST(StrongHandle, DefaultConstructor_Invalid)
{
    RHI::BufferHandle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h.Index, RHI::BufferHandle::INVALID_INDEX);
    EXPECT_EQ(h.Generation, 0u);
}

TEST(StrongHandle, ZeroIndexIsValid)
{
    RHI::TextureHandle h(0, 1);
    EXPECT_TRUE(h.IsValid());
    EXPECT_EQ(h.Index, 0u);
}

TEST(StrongHandle, DifferentGenerationsAreDifferentHandles)
{
    RHI::BindGroupHandle a(7, 1);
    RHI::BindGroupHandle b(7, 2);
    EXPECT_NE(a, b);
    EXPECT_LT(a, b);
}

TEST(StrongHandle, PackKeepsGenerationInHighBits)
{
    RHI::PipelineHandle h(0x1234, 3);
    EXPECT_EQ(h.Pack(), (uint64_t{3} << 32) | 0x1234u);
}

// -----------------------------------------------------------------------------
// Type Safety
// -----------------------------------------------------------------------------

TEST(StrongHandle, KindsDoNotConvert)
{
    static_assert(!std::is_convertible_v<RHI::BufferHandle, RHI::TextureHandle>);
    static_assert(!std::is_convertible_v<RHI::BindGroupHandle, RHI::PipelineHandle>);
    SUCCEED();
}

// -----------------------------------------------------------------------------
// Hashing
// -----------------------------------------------------------------------------

TEST(StrongHandle, HashDistinguishesGenerations)
{
    std::unordered_set<RHI::BufferHandle> set;
    set.insert(RHI::BufferHandle(1, 1));
    set.insert(RHI::BufferHandle(1, 2));
    set.insert(RHI::BufferHandle(1, 1));
    EXPECT_EQ(set.size(), 2u);
}
