#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * Handle Table for Record Arenas
 *
 * Every record kind (branches, thoughts, checkpoints, snapshots, timelines,
 * search nodes, analyses) lives in a flat SlotTable and is referred to by an
 * opaque Id. Records never hold pointers to each other.
 *
 * Handle Design:
 * - Id = (generation << 32) | index
 * - Generation counter prevents ABA bugs on slot reuse
 * - Freelist recycles slots released by cascade deletes
 * - Slot 0 is reserved, so Id 0 is the null id
 *
 * Thread safety: External synchronization required (owning store's mutex).
 */

#include "common.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace retrace {

// ============================================================================
// Handle Type
// ============================================================================

using Id = uint64_t;

constexpr Id INVALID_ID = 0;
constexpr uint32_t GEN_SHIFT = 32;
constexpr uint64_t INDEX_MASK = 0xFFFFFFFFull;

inline uint32_t id_index(Id id) {
  return static_cast<uint32_t>(id & INDEX_MASK);
}

inline uint32_t id_generation(Id id) {
  return static_cast<uint32_t>(id >> GEN_SHIFT);
}

inline Id make_id(uint32_t index, uint32_t generation) {
  return (static_cast<uint64_t>(generation) << GEN_SHIFT) | index;
}

// ============================================================================
// Slot Table
// ============================================================================

template <typename T>
class SlotTable {
public:
  struct Slot {
    T value{};
    uint32_t generation = 0;
    bool in_use = false;
  };

  explicit SlotTable(size_t initial_capacity = 16) {
    // Slot 0 reserved + at least 1 usable
    if (initial_capacity < 2) {
      initial_capacity = 2;
    }
    slots_.resize(initial_capacity);
    slots_[0].in_use = true;
    slots_[0].generation = 0xFFFFFFFFu;  // Never valid

    // NOTE: Use i-- > 1 pattern to avoid size_t underflow
    for (size_t i = initial_capacity; i-- > 1; ) {
      freelist_.push_back(static_cast<uint32_t>(i));
    }
  }

  /**
   * Store a record in a fresh slot
   * Returns INVALID_ID only if the index space is exhausted
   */
  Id insert(T value) {
    if (freelist_.empty()) {
      size_t old_size = slots_.size();
      size_t new_size = old_size * 2;
      if (new_size > INDEX_MASK) {
        new_size = static_cast<size_t>(INDEX_MASK) + 1;
      }
      if (old_size >= new_size) {
        RETRACE_LOG_DEBUG("[SlotTable::insert] Table full, cannot allocate");
        return INVALID_ID;
      }

      slots_.resize(new_size);
      for (size_t i = new_size; i-- > old_size; ) {
        freelist_.push_back(static_cast<uint32_t>(i));
      }
    }

    uint32_t index = freelist_.back();
    freelist_.pop_back();

    Slot& slot = slots_[index];
    slot.in_use = true;
    slot.value = std::move(value);
    ++live_;
    // Generation already incremented on release, or 0 for fresh slot
    return make_id(index, slot.generation);
  }

  /**
   * Place a record at a known id (load path)
   *
   * Grows the table as needed. Call rebuild_freelist() once all persisted
   * records are placed. Returns false if the slot is already occupied.
   */
  bool place(Id id, T value) {
    uint32_t index = id_index(id);
    if (id == INVALID_ID || index == 0) return false;

    if (index >= slots_.size()) {
      slots_.resize(static_cast<size_t>(index) + 1);
    }
    Slot& slot = slots_[index];
    if (slot.in_use) return false;

    slot.in_use = true;
    slot.generation = id_generation(id);
    slot.value = std::move(value);
    ++live_;
    return true;
  }

  void rebuild_freelist() {
    freelist_.clear();
    for (size_t i = slots_.size(); i-- > 1; ) {
      if (!slots_[i].in_use) {
        freelist_.push_back(static_cast<uint32_t>(i));
      }
    }
  }

  /**
   * Free a slot, returning it to the freelist
   * Stale or double release is ignored
   */
  bool release(Id id) {
    if (id == INVALID_ID) return false;

    uint32_t index = id_index(id);
    uint32_t gen = id_generation(id);
    if (index == 0 || index >= slots_.size()) return false;

    Slot& slot = slots_[index];
    if (!slot.in_use || slot.generation != gen) {
      RETRACE_LOG_DEBUG("[SlotTable::release] Invalid id: stale or double-free");
      return false;
    }

    slot.in_use = false;
    slot.generation = slot.generation + 1;  // Prevent ABA (wrap is intentional)
    slot.value = T{};
    --live_;
    freelist_.push_back(index);
    return true;
  }

  /**
   * Get record by id (with validation)
   * Returns nullptr if the id is null, stale or out of range
   */
  T* get(Id id) {
    if (id == INVALID_ID) return nullptr;

    uint32_t index = id_index(id);
    uint32_t gen = id_generation(id);

    // Slot 0 is reserved and never valid for external use
    if (index == 0) return nullptr;
    if (index >= slots_.size()) return nullptr;

    Slot& slot = slots_[index];
    if (!slot.in_use || slot.generation != gen) {
      return nullptr;
    }
    return &slot.value;
  }

  const T* get(Id id) const {
    return const_cast<SlotTable*>(this)->get(id);
  }

  bool contains(Id id) const { return get(id) != nullptr; }

  size_t size() const { return live_; }

  /// Visit every live record in slot order: fn(Id, T&)
  template <typename Fn>
  void for_each(Fn&& fn) {
    for (size_t i = 1; i < slots_.size(); ++i) {
      if (slots_[i].in_use) {
        fn(make_id(static_cast<uint32_t>(i), slots_[i].generation), slots_[i].value);
      }
    }
  }

  template <typename Fn>
  void for_each(Fn&& fn) const {
    for (size_t i = 1; i < slots_.size(); ++i) {
      if (slots_[i].in_use) {
        fn(make_id(static_cast<uint32_t>(i), slots_[i].generation), slots_[i].value);
      }
    }
  }

  /// Collect ids of live records matching pred(const T&)
  template <typename Pred>
  std::vector<Id> select(Pred&& pred) const {
    std::vector<Id> out;
    for_each([&](Id id, const T& v) {
      if (pred(v)) out.push_back(id);
    });
    return out;
  }

  void clear() {
    size_t cap = slots_.size();
    slots_.clear();
    freelist_.clear();
    live_ = 0;
    slots_.resize(cap < 2 ? 2 : cap);
    slots_[0].in_use = true;
    slots_[0].generation = 0xFFFFFFFFu;
    for (size_t i = slots_.size(); i-- > 1; ) {
      freelist_.push_back(static_cast<uint32_t>(i));
    }
  }

private:
  std::vector<Slot> slots_;
  std::vector<uint32_t> freelist_;
  size_t live_ = 0;
};

}  // namespace retrace
