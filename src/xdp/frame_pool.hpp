// src/xdp/frame_pool.hpp
// UMEM frame pool: one contiguous mapping split into fixed-size frames
//
// The pool owns the memory region and the set of frames that are currently
// free (not handed out to the application or to the kernel). Frames are
// identified by their byte offset from the region base, which is what the
// kernel rings carry.
//
// Conservation: a frame is either in the free set or held elsewhere (by the
// application, in a ring, or by the kernel). release() of a frame that is
// already free, or of an address outside the region, aborts the process.
//
// The free set is a stack. A freshly created pool gives 0, frame_size,
// 2*frame_size, ...; after that the most recently released frame is handed
// out first.
//
// Thread safety is provided by the LockPolicy template argument (NullLock by
// default, see core/lock_policy.hpp).

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>
#include <sys/mman.h>

#include "core/lock_policy.hpp"
#include "core/log.hpp"
#include "core/xsk_error.hpp"
#include "xdp/xsk_config.hpp"

namespace afxdp::xdp {

template<typename LockPolicy = NullLock>
class FramePool {
public:
    static constexpr uint64_t INVALID_FRAME = UINT64_MAX;

    FramePool() = default;

    ~FramePool() {
        cleanup();
    }

    FramePool(const FramePool&) = delete;
    FramePool& operator=(const FramePool&) = delete;

    /**
     * Map the region and mark every frame free
     *
     * @param frame_size Frame (chunk) size, power of 2 and >= MIN_FRAME_SIZE
     * @param frame_count Number of frames, > 0
     * @param headroom Bytes reserved at the start of each frame for the kernel
     * @throws XskError INVALID_FRAME_SIZE, INVALID_COUNT, INVALID_STATE, SYSTEM_ERROR
     */
    void init(uint32_t frame_size, uint32_t frame_count, uint32_t headroom = 0) {
        if (area_ != nullptr) {
            throw XskError(ErrorKind::INVALID_STATE, "Frame pool already initialized");
        }
        if (!is_power_of_two(frame_size) || frame_size < MIN_FRAME_SIZE) {
            throw XskError(ErrorKind::INVALID_FRAME_SIZE,
                           "Frame size " + std::to_string(frame_size) +
                           " must be a power of 2 and at least " + std::to_string(MIN_FRAME_SIZE));
        }
        if (frame_count == 0) {
            throw XskError(ErrorKind::INVALID_COUNT, "Frame count must be positive");
        }

        size_t size = static_cast<size_t>(frame_size) * frame_count;

        // Huge pages first, regular pages as fallback
        void* area = mmap(nullptr, size, PROT_READ | PROT_WRITE,
                          MAP_PRIVATE | MAP_ANONYMOUS | MAP_HUGETLB, -1, 0);
        hugepages_ = (area != MAP_FAILED);
        if (area == MAP_FAILED) {
            area = mmap(nullptr, size, PROT_READ | PROT_WRITE,
                        MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
        }
        if (area == MAP_FAILED) {
            throw XskError(ErrorKind::SYSTEM_ERROR, "Failed to allocate UMEM region", errno);
        }

        area_ = static_cast<uint8_t*>(area);
        size_ = size;
        frame_size_ = frame_size;
        frame_count_ = frame_count;
        headroom_ = headroom;
        frame_shift_ = static_cast<uint32_t>(__builtin_ctz(frame_size));

        // Stack of free frame indices, lowest index on top initially
        free_stack_.resize(frame_count);
        for (uint32_t i = 0; i < frame_count; i++) {
            free_stack_[i] = frame_count - 1 - i;
        }
        is_free_.assign(frame_count, 1);

        AFXDP_LOG("[UMEM] Region %zu bytes (%u frames x %u, headroom %u, %s)\n",
                  size_, frame_count_, frame_size_, headroom_,
                  hugepages_ ? "huge pages" : "regular pages");
    }

    /**
     * Take one frame out of the free set
     * @return Frame offset, or INVALID_FRAME with errno = ENOBUFS when empty
     */
    uint64_t allocate() {
        std::lock_guard<LockPolicy> guard(lock_);
        if (free_stack_.empty()) {
            errno = ENOBUFS;
            return INVALID_FRAME;
        }
        uint32_t idx = free_stack_.back();
        free_stack_.pop_back();
        is_free_[idx] = 0;
        return static_cast<uint64_t>(idx) << frame_shift_;
    }

    /**
     * Take up to n frames
     * @return Number of offsets written to out (0 with errno = ENOBUFS when empty)
     */
    uint32_t allocate_batch(uint64_t* out, uint32_t n) {
        std::lock_guard<LockPolicy> guard(lock_);
        uint32_t count = 0;
        while (count < n && !free_stack_.empty()) {
            uint32_t idx = free_stack_.back();
            free_stack_.pop_back();
            is_free_[idx] = 0;
            out[count++] = static_cast<uint64_t>(idx) << frame_shift_;
        }
        if (count == 0 && n > 0) {
            errno = ENOBUFS;
        }
        return count;
    }

    /**
     * Return a frame to the free set
     *
     * addr may point anywhere inside the frame (e.g. an RX descriptor address
     * past the headroom); it is masked to the frame base.
     */
    void release(uint64_t addr) {
        std::lock_guard<LockPolicy> guard(lock_);
        release_locked(addr);
    }

    void release_batch(const uint64_t* addrs, uint32_t n) {
        std::lock_guard<LockPolicy> guard(lock_);
        for (uint32_t i = 0; i < n; i++) {
            release_locked(addrs[i]);
        }
    }

    uint32_t free_count() const {
        std::lock_guard<LockPolicy> guard(lock_);
        return static_cast<uint32_t>(free_stack_.size());
    }

    uint32_t in_use_count() const {
        std::lock_guard<LockPolicy> guard(lock_);
        return frame_count_ - static_cast<uint32_t>(free_stack_.size());
    }

    bool is_free(uint64_t addr) const {
        std::lock_guard<LockPolicy> guard(lock_);
        if (area_ == nullptr || addr >= size_) {
            return false;
        }
        return is_free_[addr >> frame_shift_] != 0;
    }

    bool contains(uint64_t addr) const {
        return area_ != nullptr && addr < size_;
    }

    uint64_t frame_base(uint64_t addr) const {
        return addr & ~static_cast<uint64_t>(frame_size_ - 1);
    }

    uint32_t frame_index(uint64_t addr) const {
        return static_cast<uint32_t>(addr >> frame_shift_);
    }

    uint64_t frame_addr(uint32_t index) const {
        return static_cast<uint64_t>(index) << frame_shift_;
    }

    /**
     * Pointer to len bytes at UMEM offset addr
     * @return nullptr if the range leaves the region or crosses a frame boundary
     */
    uint8_t* data(uint64_t addr, uint32_t len = 0) const {
        if (area_ == nullptr || addr >= size_) {
            return nullptr;
        }
        uint64_t in_frame = addr & (frame_size_ - 1);
        if (in_frame + len > frame_size_) {
            return nullptr;
        }
        return area_ + addr;
    }

    uint8_t* base() const { return area_; }
    size_t size_bytes() const { return size_; }
    uint32_t frame_size() const { return frame_size_; }
    uint32_t frame_count() const { return frame_count_; }
    uint32_t headroom() const { return headroom_; }
    bool initialized() const { return area_ != nullptr; }
    bool uses_hugepages() const { return hugepages_; }

private:
    void release_locked(uint64_t addr) {
        if (area_ == nullptr || addr >= size_) {
            AFXDP_FATAL("FramePool::release: address 0x%lx outside UMEM region (%zu bytes)",
                        static_cast<unsigned long>(addr), size_);
        }
        uint32_t idx = static_cast<uint32_t>(addr >> frame_shift_);
        if (is_free_[idx]) {
            AFXDP_FATAL("FramePool::release: frame 0x%lx released twice",
                        static_cast<unsigned long>(frame_addr(idx)));
        }
        is_free_[idx] = 1;
        free_stack_.push_back(idx);
    }

    void cleanup() {
        if (area_ != nullptr) {
            munmap(area_, size_);
            area_ = nullptr;
        }
        size_ = 0;
        free_stack_.clear();
        is_free_.clear();
    }

    uint8_t* area_ = nullptr;           // UMEM base address
    size_t size_ = 0;                   // frame_size_ * frame_count_
    bool hugepages_ = false;
    uint32_t frame_size_ = 0;
    uint32_t frame_count_ = 0;
    uint32_t headroom_ = 0;
    uint32_t frame_shift_ = 0;          // log2(frame_size_)
    std::vector<uint32_t> free_stack_;  // free frame indices, last released on top
    std::vector<uint8_t> is_free_;      // per-frame membership in free_stack_
    mutable LockPolicy lock_;
};

}  // namespace afxdp::xdp
