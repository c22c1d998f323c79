/**
 * @file alloc_bench.cpp
 * @brief Microbenchmark for the fixed-buffer allocators (single thread).
 *
 * Measures:
 *   1) bump:  N x allocate(64) then reset()
 *   2) pool:  N x (allocate + free) on a warm pool
 *   3) arena: N x allocate(64) over a bump, reset() per batch
 *   4) locked bump: same as (1) through LockedAllocator (uncontended lock cost)
 *
 * Reports: ops/sec and ns per op.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "linmem/mem/arena_allocator.hpp"
#include "linmem/mem/bump_allocator.hpp"
#include "linmem/mem/locked_allocator.hpp"
#include "linmem/mem/pool_allocator.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;          // e.g., "bump@64"
  std::size_t N = 0;         // number of operations
  double      seconds = 0.0; // wall time
  double      ops_per_s = 0.0;
  double      ns_per_op = 0.0;
};

constexpr std::size_t kBlock     = 64;
constexpr std::size_t kBatch     = 1024;               // allocations between resets
constexpr std::size_t kBufBytes  = kBlock * kBatch * 2; // headroom for padding
constexpr std::size_t kOps       = 4'000'000;

// Keeps the optimizer from dropping the allocation result.
inline void sink(const void* p) noexcept {
  static volatile std::uintptr_t s;
  s = reinterpret_cast<std::uintptr_t>(p);
}

template <class Fn>
Result timed(std::string name, std::size_t n, Fn&& fn) {
  const auto t0 = clock::now();
  const bool ok = fn();
  const auto t1 = clock::now();
  if (!ok) {
    std::cerr << name << ": allocator failed mid-run\n";
    return Result{std::move(name), 0};
  }
  Result r;
  r.name      = std::move(name);
  r.N         = n;
  r.seconds   = std::chrono::duration_cast<ns>(t1 - t0).count() / 1e9;
  r.ops_per_s = (r.seconds > 0.0) ? (static_cast<double>(n) / r.seconds) : 0.0;
  r.ns_per_op = (n > 0) ? (1e9 * r.seconds / static_cast<double>(n)) : 0.0;
  return r;
}

// Batched allocate-then-reset loop shared by bump, arena and locked runs.
bool batched(linmem::mem::Allocator& a, std::size_t n) {
  for (std::size_t done = 0; done < n;) {
    for (std::size_t i = 0; i < kBatch && done < n; ++i, ++done) {
      auto b = a.allocate(kBlock, alignof(std::max_align_t));
      if (!b) return false;
      sink(b->data());
    }
    if (!a.reset()) return false;
  }
  return true;
}

bool churn_pool(linmem::mem::PoolAllocator& pool, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i) {
    auto b = pool.allocate(kBlock);
    if (!b) return false;
    sink(b->data());
    if (!pool.free(*b)) return false;
  }
  return true;
}

void print(const Result& r) {
  std::cout << std::left  << std::setw(16) << r.name
            << std::right << std::setw(12) << r.N
            << std::setw(16) << std::fixed << std::setprecision(0) << r.ops_per_s
            << std::setw(12) << std::setprecision(2) << r.ns_per_op
            << "\n";
}

} // namespace bench

int main() {
  using namespace bench;

  std::vector<std::byte> bump_buf(kBufBytes);
  std::vector<std::byte> arena_buf(kBufBytes);
  std::vector<std::byte> pool_buf(linmem::mem::PoolAllocator::required_bytes(kBlock, kBatch));

  linmem::mem::BumpAllocator  bump(bump_buf);
  linmem::mem::BumpAllocator  arena_inner(arena_buf);
  linmem::mem::ArenaAllocator arena(arena_inner);
  linmem::mem::LockedAllocator locked(bump);
  auto pool = linmem::mem::PoolAllocator::create(pool_buf, kBlock, kBatch);
  if (!pool) {
    std::cerr << "pool setup failed: " << linmem::mem::to_string(pool.error()) << "\n";
    return 1;
  }

  std::cout << std::left  << std::setw(16) << "allocator"
            << std::right << std::setw(12) << "ops"
            << std::setw(16) << "ops/s"
            << std::setw(12) << "ns/op" << "\n";

  print(timed("bump@64",   kOps, [&] { return batched(bump, kOps); }));
  print(timed("pool@64",   kOps, [&] { return churn_pool(*pool, kOps); }));
  print(timed("arena@64",  kOps, [&] { return batched(arena, kOps); }));
  print(timed("locked@64", kOps, [&] { return batched(locked, kOps); }));
  return 0;
}
