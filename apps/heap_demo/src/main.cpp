/**
 * @file heap_demo.cpp
 * @brief Host program: owns the raw buffers and hands allocators to client code.
 *
 * **Bootstrap**
 * - Load YAML config (argv[1], optional); set the spdlog level.
 * - Carve one host buffer per allocator; nothing else touches the system heap
 *   once the buffers exist.
 *
 * **Clients**
 * - Client functions take mem::Allocator& and never name a policy.
 * - Bump: long-lived strings and tables.
 * - Pool: fixed-size session records, freed and reused individually.
 * - Arena: per-request scratch, released with one reset() per request.
 *
 * **Observability**
 * - Each allocator is wrapped in an ObservedAllocator; counters are printed on exit.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <new>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "linmem/config/config_loader.hpp"
#include "linmem/mem/arena_allocator.hpp"
#include "linmem/mem/bump_allocator.hpp"
#include "linmem/mem/pool_allocator.hpp"
#include "linmem/obs/observability.hpp"
#include "linmem/version.hpp"

namespace {

using linmem::mem::Allocator;
using linmem::mem::Result;

/// Copy @p text into memory owned by @p alloc (not NUL-terminated).
Result<std::span<char>> copy_string(Allocator& alloc, std::string_view text) {
  auto chars = linmem::mem::allocate_array<char>(alloc, text.size());
  if (!chars) return chars;
  std::copy(text.begin(), text.end(), chars->begin());
  return chars;
}

/// Table of i*i for i in [0, n).
Result<std::span<std::int32_t>> squares(Allocator& alloc, std::size_t n) {
  auto table = linmem::mem::allocate_array<std::int32_t>(alloc, n);
  if (!table) return table;
  for (std::size_t i = 0; i < n; ++i) {
    (*table)[i] = static_cast<std::int32_t>(i * i);
  }
  return table;
}

struct Session {
  std::uint32_t id{0};
  std::uint32_t requests{0};
  char          user[24]{};
};

bool run_bump(Allocator& heap) {
  auto greeting = copy_string(heap, "hello from linear memory");
  auto table    = squares(heap, 32);
  if (!greeting || !table) {
    spdlog::error("bump: setup allocation failed");
    return false;
  }
  spdlog::info("bump: '{}' + {} squares, {} / {} bytes used",
               std::string_view(greeting->data(), greeting->size()),
               table->size(), heap.used(), heap.capacity());

  // A request the heap cannot hold fails without disturbing it.
  auto huge = heap.allocate(heap.capacity() + 1);
  if (huge) {
    spdlog::error("bump: oversized allocation unexpectedly succeeded");
    return false;
  }
  spdlog::info("bump: oversized request rejected ({})", linmem::mem::to_string(huge.error()));

  // Growing in place is not something a bump allocator does; fall back to copying.
  if (!heap.resize_in_place(std::as_writable_bytes(*table), 64 * sizeof(std::int32_t))) {
    auto bigger = squares(heap, 64);
    if (!bigger) return false;
    spdlog::info("bump: resize unsupported, rebuilt table with {} entries", bigger->size());
  }
  return static_cast<bool>(heap.free(std::as_writable_bytes(*greeting)));
}

bool run_pool(Allocator& pool, std::size_t slots) {
  std::vector<Session*> live;
  for (std::uint32_t id = 1;; ++id) {
    auto block = pool.allocate(sizeof(Session), alignof(Session));
    if (!block) {
      spdlog::info("pool: exhausted after {} sessions ({})", live.size(),
                   linmem::mem::to_string(block.error()));
      break;
    }
    auto* s = ::new (static_cast<void*>(block->data())) Session{};
    s->id = id;
    std::snprintf(s->user, sizeof(s->user), "user-%u", id);
    live.push_back(s);
  }
  if (live.size() != slots) {
    spdlog::error("pool: expected {} sessions, got {}", slots, live.size());
    return false;
  }

  // Retire every other session, then admit new ones into the freed slots.
  std::size_t retired = 0;
  for (std::size_t i = 0; i < live.size(); i += 2) {
    auto st = pool.free(std::span<std::byte>(reinterpret_cast<std::byte*>(live[i]), sizeof(Session)));
    if (!st) return false;
    ++retired;
  }
  std::size_t admitted = 0;
  while (pool.allocate(sizeof(Session), alignof(Session))) ++admitted;
  spdlog::info("pool: retired {}, re-admitted {}", retired, admitted);
  return retired == admitted && static_cast<bool>(pool.reset());
}

bool run_arena(Allocator& arena, int requests) {
  for (int r = 0; r < requests; ++r) {
    auto header = copy_string(arena, "GET /index.html");
    auto ints   = squares(arena, 10 + 10 * static_cast<std::size_t>(r));
    if (!header || !ints) {
      spdlog::error("arena: request {} ran out of scratch space", r);
      return false;
    }
    spdlog::info("arena: request {} used {} bytes", r, arena.used());
    if (!arena.reset()) return false;
  }
  return arena.used() == 0;
}

} // namespace

int main(int argc, char** argv) {
  const std::string path = (argc > 1) ? argv[1] : "";
  auto cfg = linmem::config::Loader::load_from_file(path);
  if (!cfg) {
    spdlog::error("heap_demo: cannot load config '{}': {}", path,
                  linmem::config::to_string(cfg.error()));
    return 2;
  }
  spdlog::set_level(spdlog::level::from_str(cfg->log_level));
  spdlog::info("linmem {} heap_demo: heap={}B arena={}B pool={}x{}B",
               linmem::version_string, cfg->heap_bytes, cfg->arena_bytes,
               cfg->pool_slot_count, cfg->pool_slot_size);

  // Host-owned backing memory; each buffer belongs to exactly one allocator.
  std::vector<std::byte> heap_buf, arena_buf, pool_buf;
  try {
    heap_buf.resize(cfg->heap_bytes);
    arena_buf.resize(cfg->arena_bytes);
    pool_buf.resize(linmem::mem::PoolAllocator::required_bytes(
        cfg->pool_slot_size, cfg->pool_slot_count, cfg->pool_slot_align));
  } catch (const std::bad_alloc& e) {
    spdlog::error("heap_demo: cannot reserve host buffers: {}", e.what());
    return 2;
  } catch (const std::length_error& e) {
    spdlog::error("heap_demo: host buffer size rejected: {}", e.what());
    return 2;
  }

  linmem::mem::BumpAllocator  heap(heap_buf);
  linmem::mem::BumpAllocator  scratch(arena_buf);
  linmem::mem::ArenaAllocator arena(scratch);
  auto pool = linmem::mem::PoolAllocator::create(pool_buf, cfg->pool_slot_size,
                                                 cfg->pool_slot_count, cfg->pool_slot_align);
  if (!pool) {
    spdlog::error("heap_demo: pool layout rejected: {}", linmem::mem::to_string(pool.error()));
    return 2;
  }

  auto observer = linmem::obs::make_log_observer();
  linmem::obs::ObservedAllocator obs_heap(heap, *observer, "heap");
  linmem::obs::ObservedAllocator obs_pool(*pool, *observer, "pool");
  linmem::obs::ObservedAllocator obs_arena(arena, *observer, "arena");

  bool ok = run_bump(obs_heap);
  if (sizeof(Session) <= pool->slot_size() && alignof(Session) <= pool->slot_align()) {
    ok = run_pool(obs_pool, pool->slot_count()) && ok;
  } else {
    spdlog::warn("pool: slot too small for Session ({}B), skipped", sizeof(Session));
  }
  ok = run_arena(obs_arena, 3) && ok;

  const auto c = observer->snapshot();
  spdlog::info("counters: allocations={} bytes={} frees={} resets={} failures={} "
               "unsupported={} invalid_releases={}",
               c.allocations, c.bytes_requested, c.frees, c.resets, c.failures,
               c.unsupported, c.invalid_releases);
  spdlog::info("arena generation={}", arena.generation());
  return ok ? 0 : 1;
}
