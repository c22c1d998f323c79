/**
 * @file test_bump.cpp
 * @brief Tests for BumpAllocator: alignment, disjointness, OOM, reset.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "linmem/mem/bump_allocator.hpp"

using linmem::mem::AllocError;
using linmem::mem::Block;
using linmem::mem::BumpAllocator;

namespace {

std::uintptr_t addr(const void* p) { return reinterpret_cast<std::uintptr_t>(p); }

bool disjoint(Block a, Block b) {
  // Zero-size blocks still occupy one reserved byte.
  const auto a0 = addr(a.data()), a1 = a0 + std::max<std::size_t>(a.size(), 1);
  const auto b0 = addr(b.data()), b1 = b0 + std::max<std::size_t>(b.size(), 1);
  return a1 <= b0 || b1 <= a0;
}

} // namespace

// ---------- Scenario ----------

/**
 * @test Bump_Scenario_1024
 * @brief 100 ok, 1000 fails with offset unchanged, 900 @ align 1 fills to 1000.
 */
TEST(BumpAllocator, Scenario_1024) {
  alignas(16) std::array<std::byte, 1024> buf{};
  BumpAllocator bump(buf);

  auto a = bump.allocate(100, 8);
  ASSERT_TRUE(a);
  EXPECT_EQ(a->data(), buf.data());
  EXPECT_EQ(a->size(), 100u);
  EXPECT_EQ(bump.used(), 100u);

  auto b = bump.allocate(1000, 8);
  ASSERT_FALSE(b);
  EXPECT_EQ(b.error(), AllocError::OutOfMemory);
  EXPECT_EQ(bump.used(), 100u);

  auto c = bump.allocate(900, 1);
  ASSERT_TRUE(c);
  EXPECT_EQ(c->data(), buf.data() + 100);
  EXPECT_EQ(bump.used(), 1000u);
  EXPECT_EQ(bump.remaining(), 24u);
}

// ---------- Alignment ----------

TEST(BumpAllocator, Alignment_AllPowersOfTwo) {
  alignas(256) std::array<std::byte, 4096> buf{};
  BumpAllocator bump(buf);

  for (std::size_t a = 1; a <= 256; a <<= 1) {
    // Odd sizes knock the offset off every boundary before the next request.
    auto blk = bump.allocate(3, a);
    ASSERT_TRUE(blk) << "alignment " << a;
    EXPECT_EQ(addr(blk->data()) % a, 0u) << "alignment " << a;
  }
}

TEST(BumpAllocator, Alignment_UnalignedBuffer) {
  alignas(64) std::array<std::byte, 256> storage{};
  // Start the buffer one byte past a 64-byte boundary.
  BumpAllocator bump(std::span<std::byte>(storage).subspan(1));

  auto blk = bump.allocate(8, 64);
  ASSERT_TRUE(blk);
  EXPECT_EQ(addr(blk->data()) % 64, 0u);
  EXPECT_EQ(blk->data(), storage.data() + 64);
  EXPECT_EQ(bump.used(), 63u + 8u);
}

TEST(BumpAllocator, Alignment_Invalid) {
  std::array<std::byte, 64> buf{};
  BumpAllocator bump(buf);

  auto zero = bump.allocate(8, 0);
  ASSERT_FALSE(zero);
  EXPECT_EQ(zero.error(), AllocError::InvalidAlignment);

  auto three = bump.allocate(8, 3);
  ASSERT_FALSE(three);
  EXPECT_EQ(three.error(), AllocError::InvalidAlignment);
  EXPECT_EQ(bump.used(), 0u);
}

TEST(BumpAllocator, Alignment_PaddingPushesPastEnd) {
  alignas(64) std::array<std::byte, 64> buf{};
  BumpAllocator bump(buf);

  ASSERT_TRUE(bump.allocate(1, 1));
  // 63 bytes remain but the next 32-byte boundary leaves only 32.
  auto blk = bump.allocate(40, 32);
  ASSERT_FALSE(blk);
  EXPECT_EQ(blk.error(), AllocError::OutOfMemory);
  EXPECT_EQ(bump.used(), 1u);
  EXPECT_TRUE(bump.allocate(32, 32));
}

// ---------- Disjointness ----------

TEST(BumpAllocator, Blocks_Disjoint) {
  alignas(16) std::array<std::byte, 2048> buf{};
  BumpAllocator bump(buf);

  const std::size_t sizes[]  = {1, 7, 16, 0, 33, 100, 0, 5, 250};
  const std::size_t aligns[] = {1, 8, 16, 4, 2, 16, 1, 32, 8};
  std::vector<Block> blocks;
  for (std::size_t i = 0; i < std::size(sizes); ++i) {
    auto b = bump.allocate(sizes[i], aligns[i]);
    ASSERT_TRUE(b);
    EXPECT_TRUE(bump.owns(b->data()));
    blocks.push_back(*b);
  }
  for (std::size_t i = 0; i < blocks.size(); ++i) {
    for (std::size_t j = i + 1; j < blocks.size(); ++j) {
      EXPECT_TRUE(disjoint(blocks[i], blocks[j])) << i << " vs " << j;
    }
  }
}

TEST(BumpAllocator, ZeroSize_DistinctAddresses) {
  std::array<std::byte, 8> buf{};
  BumpAllocator bump(buf);

  auto a = bump.allocate(0, 1);
  auto b = bump.allocate(0, 1);
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(a->size(), 0u);
  EXPECT_NE(a->data(), b->data());
}

TEST(BumpAllocator, ZeroSize_FailsOnFullBuffer) {
  std::array<std::byte, 16> buf{};
  BumpAllocator bump(buf);

  ASSERT_TRUE(bump.allocate(16, 1));
  EXPECT_EQ(bump.remaining(), 0u);
  auto empty = bump.allocate(0, 1);
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error(), AllocError::OutOfMemory);
  EXPECT_EQ(bump.used(), 16u);
}

TEST(BumpAllocator, Owns_BufferRangeOnly) {
  std::array<std::byte, 32> storage{};
  BumpAllocator bump(std::span<std::byte>(storage).subspan(8, 16));

  EXPECT_TRUE(bump.owns(storage.data() + 8));
  EXPECT_TRUE(bump.owns(storage.data() + 23));
  EXPECT_FALSE(bump.owns(storage.data() + 7));
  EXPECT_FALSE(bump.owns(storage.data() + 24));
  int unrelated = 0;
  EXPECT_FALSE(bump.owns(&unrelated));
}

TEST(BumpAllocator, Memory_Writable) {
  alignas(16) std::array<std::byte, 256> buf{};
  BumpAllocator bump(buf);

  auto a = bump.allocate(100, 1);
  auto b = bump.allocate(100, 1);
  ASSERT_TRUE(a && b);
  std::fill(a->begin(), a->end(), std::byte{0xAB});
  std::fill(b->begin(), b->end(), std::byte{0xCD});
  EXPECT_TRUE(std::all_of(a->begin(), a->end(), [](std::byte x) { return x == std::byte{0xAB}; }));
}

// ---------- Failure isolation ----------

TEST(BumpAllocator, Oversized_LeavesStateIntact) {
  alignas(16) std::array<std::byte, 128> buf{};
  BumpAllocator bump(buf);

  ASSERT_TRUE(bump.allocate(32, 16));
  const auto before = bump.used();
  EXPECT_FALSE(bump.allocate(SIZE_MAX, 1));
  EXPECT_FALSE(bump.allocate(97, 1));
  EXPECT_EQ(bump.used(), before);
  EXPECT_TRUE(bump.allocate(96, 1));
}

TEST(BumpAllocator, EmptyBuffer_AlwaysOutOfMemory) {
  BumpAllocator bump(std::span<std::byte>{});
  auto b = bump.allocate(0, 1);
  ASSERT_FALSE(b);
  EXPECT_EQ(b.error(), AllocError::OutOfMemory);
  EXPECT_FALSE(bump.owns(nullptr));
}

// ---------- Unsupported / no-op ----------

TEST(BumpAllocator, Resize_And_Reallocate_Unsupported) {
  alignas(16) std::array<std::byte, 128> buf{};
  BumpAllocator bump(buf);

  auto b = bump.allocate(16, 16);
  ASSERT_TRUE(b);
  auto grow = bump.resize_in_place(*b, 32);
  ASSERT_FALSE(grow);
  EXPECT_EQ(grow.error(), AllocError::UnsupportedOperation);
  auto shrink = bump.resize_in_place(*b, 8);
  ASSERT_FALSE(shrink);
  EXPECT_EQ(shrink.error(), AllocError::UnsupportedOperation);

  auto moved = bump.reallocate(*b, 64, 16);
  ASSERT_FALSE(moved);
  EXPECT_EQ(moved.error(), AllocError::UnsupportedOperation);
  EXPECT_EQ(bump.used(), 16u);
}

TEST(BumpAllocator, Free_IsSilentNoop) {
  alignas(16) std::array<std::byte, 64> buf{};
  BumpAllocator bump(buf);

  auto b = bump.allocate(16, 16);
  ASSERT_TRUE(b);
  EXPECT_TRUE(bump.free(*b));
  EXPECT_TRUE(bump.free(*b));
  EXPECT_TRUE(bump.free(Block{}));
  EXPECT_EQ(bump.used(), 16u);
}

// ---------- Reset ----------

TEST(BumpAllocator, Reset_RestartsAtBase) {
  alignas(16) std::array<std::byte, 256> buf{};
  BumpAllocator bump(buf);

  auto first = bump.allocate(40, 16);
  ASSERT_TRUE(first);
  for (int i = 0; i < 4; ++i) ASSERT_TRUE(bump.allocate(40, 16));
  EXPECT_FALSE(bump.allocate(100, 16));

  ASSERT_TRUE(bump.reset());
  EXPECT_EQ(bump.used(), 0u);
  EXPECT_EQ(bump.remaining(), 256u);

  auto again = bump.allocate(40, 16);
  ASSERT_TRUE(again);
  EXPECT_EQ(again->data(), first->data());
  EXPECT_TRUE(bump.allocate(200, 1));
}

// ---------- Move ----------

TEST(BumpAllocator, Move_TransfersBuffer) {
  alignas(16) std::array<std::byte, 64> buf{};
  BumpAllocator a(buf);
  ASSERT_TRUE(a.allocate(16, 16));

  BumpAllocator b(std::move(a));
  EXPECT_EQ(b.used(), 16u);
  EXPECT_EQ(b.capacity(), 64u);
  EXPECT_EQ(a.capacity(), 0u);
  EXPECT_FALSE(a.allocate(1, 1));
  EXPECT_TRUE(b.allocate(48, 1));
}
