#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "fault.hpp"

namespace tapl {

// Host implementation of the `list[T]` runtime: a singly-linked chain with an
// access cache for forward indexed access.
//
// Elements live in a slot arena. `head_` and each slot's `next` are the owning
// links; `tail_` and the cache only observe slots, by handle. Freed slots go
// on a free list and are reused by later appends/inserts.
//
// With `kAccessCache == false` every get/set walks from the head; this is the
// variant the emitted runtime is compared against.
template <typename T, bool kAccessCache = true>
class ChainList {
   public:
    using Index = std::uint64_t;

    ChainList() = default;

    Index size() const { return size_; }
    bool empty() const { return size_ == 0; }

    void append(T value) {
        invalidate_cache();
        SlotId s = alloc(std::move(value), kNil);
        if (head_ == kNil) {
            head_ = s;
            tail_ = s;
        } else {
            slots_[tail_].next = s;
            tail_ = s;
        }
        size_++;
    }

    const T& get(Index index) { return *slots_[locate(index, "get")].value; }

    void set(Index index, T value) {
        slots_[locate(index, "set")].value = std::move(value);
    }

    void insert(Index index, T value) {
        invalidate_cache();
        if (index == 0) {
            SlotId s = alloc(std::move(value), head_);
            head_ = s;
            if (tail_ == kNil) tail_ = s;
            size_++;
            return;
        }

        SlotId prev = walk_from_head(index - 1);
        if (prev == kNil) bounds_fault("insert", index, size_);

        SlotId s = alloc(std::move(value), slots_[prev].next);
        slots_[prev].next = s;
        if (slots_[s].next == kNil) tail_ = s;
        size_++;
    }

    void erase(Index index) {
        invalidate_cache();
        if (index == 0) {
            if (head_ == kNil) bounds_fault("del", index, size_);
            SlotId old = head_;
            head_ = slots_[old].next;
            release(old);
            size_--;
            if (head_ == kNil) tail_ = kNil;
            return;
        }

        SlotId prev = walk_from_head(index - 1);
        if (prev == kNil || slots_[prev].next == kNil)
            bounds_fault("del", index, size_);

        SlotId victim = slots_[prev].next;
        slots_[prev].next = slots_[victim].next;
        if (victim == tail_) tail_ = prev;
        release(victim);
        size_--;
    }

    // Releases every element; the list stays usable.
    void clear() {
        slots_.clear();
        free_.clear();
        head_ = kNil;
        tail_ = kNil;
        size_ = 0;
        invalidate_cache();
    }

    const T* back() const {
        return tail_ == kNil ? nullptr : &*slots_[tail_].value;
    }

    // Visits the chain from the head, without touching the cache.
    template <typename F>
    void for_each(F&& f) const {
        for (SlotId s = head_; s != kNil; s = slots_[s].next) f(*slots_[s].value);
    }

    // Successor links followed by get/set so far.
    std::uint64_t links_walked() const { return links_walked_; }

    // Arena slots currently allocated, live or free.
    std::size_t slot_capacity() const { return slots_.size(); }

   private:
    using SlotId = std::uint32_t;
    static constexpr SlotId kNil = std::numeric_limits<SlotId>::max();

    struct Slot {
        std::optional<T> value{};
        SlotId next = kNil;
    };

    struct AccessCache {
        bool valid = false;
        Index index = 0;
        SlotId slot = kNil;
    };

    std::vector<Slot> slots_{};
    std::vector<SlotId> free_{};
    SlotId head_ = kNil;
    SlotId tail_ = kNil;
    Index size_ = 0;
    AccessCache cache_{};
    std::uint64_t links_walked_ = 0;

    void invalidate_cache() { cache_.valid = false; }

    SlotId alloc(T value, SlotId next) {
        if (!free_.empty()) {
            SlotId s = free_.back();
            free_.pop_back();
            slots_[s].value = std::move(value);
            slots_[s].next = next;
            return s;
        }
        slots_.push_back(Slot{.value = std::move(value), .next = next});
        return static_cast<SlotId>(slots_.size() - 1);
    }

    void release(SlotId s) {
        slots_[s].value.reset();
        slots_[s].next = kNil;
        free_.push_back(s);
    }

    // Slot at `index`, or kNil when the chain is shorter.
    SlotId walk_from_head(Index index) const {
        SlotId cursor = head_;
        while (cursor != kNil && index > 0) {
            cursor = slots_[cursor].next;
            index--;
        }
        return index > 0 ? kNil : cursor;
    }

    SlotId locate(Index index, const char* op) {
        SlotId cursor = head_;
        Index remaining = index;
        if constexpr (kAccessCache) {
            // Forward-only: the cache can only shorten walks that continue
            // past the last resolved index.
            if (cache_.valid && index >= cache_.index) {
                cursor = cache_.slot;
                remaining = index - cache_.index;
            }
        }

        while (cursor != kNil && remaining > 0) {
            cursor = slots_[cursor].next;
            remaining--;
            links_walked_++;
        }
        if (remaining > 0 || cursor == kNil) bounds_fault(op, index, size_);

        if constexpr (kAccessCache) {
            cache_.valid = true;
            cache_.index = index;
            cache_.slot = cursor;
        }
        return cursor;
    }
};

}  // namespace tapl
