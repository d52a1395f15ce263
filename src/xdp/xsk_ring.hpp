// src/xdp/xsk_ring.hpp
// Single-producer single-consumer descriptor ring shared with the kernel
//
// The same ring type serves the four AF_XDP queues:
//   FillRing        user produces empty frame offsets, kernel consumes
//   CompletionRing  kernel produces sent frame offsets, user consumes
//   RxRing          kernel produces received descriptors, user consumes
//   TxRing          user produces descriptors to send, kernel consumes
//
// The ring memory (producer index, consumer index, flags word, descriptor
// array) is mapped from the socket; a Ring only holds pointers into it plus
// cached copies of the indices. Indices are free-running u32 counters that
// wrap; a slot is addressed as index & (capacity - 1). The invariant
// producer - consumer <= capacity holds in unsigned arithmetic.
//
// Ordering: descriptors are written before the producer index is published
// with a release store, and the consumer reads the producer index with an
// acquire load before reading descriptors (and symmetrically for the
// consumer index). No locks are taken.
//
// Caller obligation: exactly one producer context and one consumer context
// per ring. Driving the same side from several threads needs external
// synchronization.
//
// Producer side:                     Consumer side:
//   uint32_t idx;                      uint32_t idx;
//   n = ring.reserve(batch, &idx);     n = ring.peek(batch, &idx);
//   for (i < n) ring.write(idx++, d);  for (i < n) use(ring.read(idx++));
//   ring.submit(n);                    ring.release(n);

#pragma once

#include <cstdint>
#include <string>
#include <linux/if_xdp.h>

#include "core/xsk_error.hpp"
#include "xdp/xsk_config.hpp"
#include "xdp/xsk_desc.hpp"

namespace afxdp::xdp {

/**
 * Location of one ring's shared state, computed from the base of its mapping
 * and the offsets the kernel reports through XDP_MMAP_OFFSETS
 */
struct RingLayout {
    uint32_t* producer = nullptr;
    uint32_t* consumer = nullptr;
    uint32_t* flags = nullptr;
    void* descs = nullptr;
    uint32_t size = 0;

    static RingLayout from_offsets(void* map, const struct xdp_ring_offset& off, uint32_t size) {
        uint8_t* base = static_cast<uint8_t*>(map);
        RingLayout layout;
        layout.producer = reinterpret_cast<uint32_t*>(base + off.producer);
        layout.consumer = reinterpret_cast<uint32_t*>(base + off.consumer);
        layout.flags = reinterpret_cast<uint32_t*>(base + off.flags);
        layout.descs = base + off.desc;
        layout.size = size;
        return layout;
    }
};

// Which side of the ring this process drives
enum class RingRole {
    PRODUCER,
    CONSUMER,
};

template<typename Desc>
class Ring {
public:
    Ring() = default;

    /**
     * @throws XskError(INVALID_RING_SIZE) if layout.size is not a power of 2
     */
    Ring(const RingLayout& layout, RingRole role) {
        attach(layout, role);
    }

    void attach(const RingLayout& layout, RingRole role) {
        if (!is_power_of_two(layout.size)) {
            throw XskError(ErrorKind::INVALID_RING_SIZE,
                           "Ring size " + std::to_string(layout.size) + " must be a power of 2");
        }
        if (layout.producer == nullptr || layout.consumer == nullptr || layout.descs == nullptr) {
            throw XskError(ErrorKind::INVALID_STATE, "Ring layout is not mapped");
        }
        producer_ = layout.producer;
        consumer_ = layout.consumer;
        flags_ = layout.flags;
        descs_ = static_cast<Desc*>(layout.descs);
        size_ = layout.size;
        mask_ = layout.size - 1;
        role_ = role;

        cached_prod_ = load_acquire(producer_);
        cached_cons_ = load_acquire(consumer_);
        if (role == RingRole::PRODUCER) {
            // Producer tracks the index where it would run into the consumer
            cached_cons_ += size_;
        }
    }

    void detach() {
        producer_ = nullptr;
        consumer_ = nullptr;
        flags_ = nullptr;
        descs_ = nullptr;
        size_ = 0;
        mask_ = 0;
        cached_prod_ = 0;
        cached_cons_ = 0;
    }

    bool valid() const { return producer_ != nullptr; }
    uint32_t capacity() const { return size_; }
    RingRole role() const { return role_; }

    // ========================================================================
    // Producer side
    // ========================================================================

    /**
     * Claim up to n slots starting at *idx
     * @return Number of slots claimed (0 when full, never blocks)
     */
    uint32_t reserve(uint32_t n, uint32_t* idx) {
        if (producer_ == nullptr) {
            return 0;
        }
        uint32_t free = cached_cons_ - cached_prod_;
        if (free < n) {
            cached_cons_ = load_acquire(consumer_) + size_;
            free = cached_cons_ - cached_prod_;
        }
        if (n > free) {
            n = free;
        }
        if (n == 0) {
            return 0;
        }
        *idx = cached_prod_;
        cached_prod_ += n;
        return n;
    }

    Desc& slot(uint32_t idx) {
        return descs_[idx & mask_];
    }

    void write(uint32_t idx, const Desc& desc) {
        descs_[idx & mask_] = desc;
    }

    /**
     * Publish n reserved slots to the consumer
     */
    void submit(uint32_t n) {
        store_release(producer_, *producer_ + n);
    }

    // ========================================================================
    // Consumer side
    // ========================================================================

    /**
     * Take a view of up to n published entries starting at *idx
     * @return Number of entries available (0 when empty)
     */
    uint32_t peek(uint32_t n, uint32_t* idx) {
        if (consumer_ == nullptr) {
            return 0;
        }
        uint32_t entries = cached_prod_ - cached_cons_;
        if (entries == 0) {
            cached_prod_ = load_acquire(producer_);
            entries = cached_prod_ - cached_cons_;
        }
        if (entries > n) {
            entries = n;
        }
        if (entries > 0) {
            *idx = cached_cons_;
            cached_cons_ += entries;
        }
        return entries;
    }

    const Desc& read(uint32_t idx) const {
        return descs_[idx & mask_];
    }

    /**
     * Hand n consumed slots back to the producer
     */
    void release(uint32_t n) {
        store_release(consumer_, *consumer_ + n);
    }

    /**
     * Undo the last n peeked entries that were not released
     */
    void cancel(uint32_t n) {
        cached_cons_ -= n;
    }

    // ========================================================================
    // Single-entry helpers
    // ========================================================================

    bool push(const Desc& desc) {
        uint32_t idx;
        if (reserve(1, &idx) != 1) {
            return false;
        }
        write(idx, desc);
        submit(1);
        return true;
    }

    bool pop(Desc& out) {
        uint32_t idx;
        if (peek(1, &idx) != 1) {
            return false;
        }
        out = read(idx);
        release(1);
        return true;
    }

    // ========================================================================
    // State
    // ========================================================================

    /**
     * Entries published and not yet released, as seen from the shared indices
     */
    uint32_t filled_entries() const {
        if (producer_ == nullptr) {
            return 0;
        }
        return load_acquire(producer_) - load_acquire(consumer_);
    }

    uint32_t free_entries() const {
        return size_ - filled_entries();
    }

    bool is_empty() const { return filled_entries() == 0; }
    bool is_full() const { return valid() && filled_entries() == size_; }

    uint32_t flags() const {
        return flags_ ? __atomic_load_n(flags_, __ATOMIC_RELAXED) : 0;
    }

    /**
     * True when the kernel asked to be woken up (XDP_USE_NEED_WAKEUP)
     */
    bool needs_wakeup() const {
        return (flags() & XDP_RING_NEED_WAKEUP) != 0;
    }

    uint32_t producer_index() const { return producer_ ? load_acquire(producer_) : 0; }
    uint32_t consumer_index() const { return consumer_ ? load_acquire(consumer_) : 0; }

private:
    static uint32_t load_acquire(const uint32_t* p) {
        return __atomic_load_n(p, __ATOMIC_ACQUIRE);
    }

    static void store_release(uint32_t* p, uint32_t v) {
        __atomic_store_n(p, v, __ATOMIC_RELEASE);
    }

    uint32_t cached_prod_ = 0;
    uint32_t cached_cons_ = 0;
    uint32_t mask_ = 0;
    uint32_t size_ = 0;
    uint32_t* producer_ = nullptr;
    uint32_t* consumer_ = nullptr;
    uint32_t* flags_ = nullptr;
    Desc* descs_ = nullptr;
    RingRole role_ = RingRole::PRODUCER;
};

using FillRing = Ring<uint64_t>;
using CompletionRing = Ring<uint64_t>;
using RxRing = Ring<XskDesc>;
using TxRing = Ring<XskDesc>;

}  // namespace afxdp::xdp
