// src/xdp/umem.hpp
// UMEM: frame pool plus the state the kernel keeps about who uses it
//
// One Umem is registered with the kernel by exactly one socket (the owner,
// XDP_UMEM_REG). Other sockets share it with XDP_SHARED_UMEM. The kernel
// groups the sockets sharing a UMEM by device/queue pair: each pair has one
// Fill ring and one Completion ring, brought by the first socket bound there
// (the group's home). Sockets that later bind to the same pair use the home's
// rings and must not bring their own.
//
// Frame ledger: every frame handed to the kernel (Fill or TX) is recorded
// against the binding group whose rings carry it, and cleared when it comes
// back (RX or Completion). When the last socket of a group closes, the kernel
// tears the group down and every frame still recorded against it is returned
// to the free set.
//
// Usage:
//   auto umem = Umem<>::create(UmemConfig(4096, 4096));
//   XskSocket<> owner;
//   owner.register_pool(umem);
//   XskSocket<> other;
//   other.attach_pool(umem);

#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <linux/if_xdp.h>

#include "core/lock_policy.hpp"
#include "core/log.hpp"
#include "core/xsk_error.hpp"
#include "xdp/frame_pool.hpp"
#include "xdp/xsk_config.hpp"

namespace afxdp::xdp {

/**
 * Sockets bound to one device/queue pair that share a Fill/Completion pair
 */
struct BindingGroup {
    uint32_t id = 0;
    DeviceId device;
    QueueId queue;
    int home_fd = -1;           // socket whose Fill/Completion rings serve the group
    std::vector<int> members;   // bound socket fds, home first
};

template<typename LockPolicy = NullLock>
class Umem {
public:
    using Pool = FramePool<LockPolicy>;

    static constexpr uint32_t NO_GROUP = 0;

    // Only aligned chunk mode
    static constexpr uint32_t SUPPORTED_UMEM_FLAGS = 0;

    /**
     * @throws XskError INVALID_FRAME_SIZE, INVALID_COUNT, SYSTEM_ERROR,
     *         UMEM_REGISTRATION_FAILED for registration flags other than
     *         SUPPORTED_UMEM_FLAGS
     */
    static std::shared_ptr<Umem> create(const UmemConfig& config) {
        // Unaligned chunk mode moves the data offset into the high address
        // bits, which frame masking and the ledger do not understand
        if ((config.flags & ~SUPPORTED_UMEM_FLAGS) != 0) {
            throw XskError(ErrorKind::UMEM_REGISTRATION_FAILED,
                           "Unsupported UMEM flags 0x" + to_hex(config.flags), EINVAL);
        }
        std::shared_ptr<Umem> umem(new Umem(config));
        umem->pool_.init(config.frame_size, config.frame_count, config.headroom);
        umem->ledger_.assign(config.frame_count, NO_GROUP);
        return umem;
    }

    Umem(const Umem&) = delete;
    Umem& operator=(const Umem&) = delete;

    Pool& pool() { return pool_; }
    const Pool& pool() const { return pool_; }
    const UmemConfig& config() const { return config_; }

    /**
     * XDP_UMEM_REG argument describing the region
     */
    struct xdp_umem_reg registration() const {
        struct xdp_umem_reg reg;
        memset(&reg, 0, sizeof(reg));
        reg.addr = reinterpret_cast<uint64_t>(pool_.base());
        reg.len = pool_.size_bytes();
        reg.chunk_size = pool_.frame_size();
        reg.headroom = pool_.headroom();
        reg.flags = config_.flags;
        return reg;
    }

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * Record fd as the registering socket
     * @throws XskError(POOL_ALREADY_REGISTERED) if another socket owns the UMEM
     */
    void claim_owner(int fd) {
        std::lock_guard<LockPolicy> guard(lock_);
        if (owner_fd_ >= 0 || owner_closed_) {
            throw XskError(ErrorKind::POOL_ALREADY_REGISTERED,
                           owner_closed_ ? std::string("UMEM owner already closed")
                                         : "UMEM already registered by socket fd " + std::to_string(owner_fd_),
                           EBUSY);
        }
        owner_fd_ = fd;
    }

    // Undo claim_owner() after a failed XDP_UMEM_REG
    void abandon_owner(int fd) {
        std::lock_guard<LockPolicy> guard(lock_);
        if (owner_fd_ == fd) {
            owner_fd_ = -1;
        }
    }

    void owner_closed(int fd) {
        std::lock_guard<LockPolicy> guard(lock_);
        if (owner_fd_ == fd) {
            owner_closed_ = true;
        }
    }

    bool is_registered() const {
        std::lock_guard<LockPolicy> guard(lock_);
        return owner_fd_ >= 0;
    }

    int owner_fd() const {
        std::lock_guard<LockPolicy> guard(lock_);
        return owner_fd_;
    }

    // XDP_USE_NEED_WAKEUP is chosen by the owner's bind and inherited by
    // every socket sharing the UMEM
    void set_need_wakeup(bool enabled) {
        std::lock_guard<LockPolicy> guard(lock_);
        need_wakeup_ = enabled;
    }

    bool need_wakeup() const {
        std::lock_guard<LockPolicy> guard(lock_);
        return need_wakeup_;
    }

    // ========================================================================
    // Binding groups
    // ========================================================================

    /**
     * Copy of the group bound to a device/queue pair
     * @return false if no socket holding this UMEM is bound there
     */
    bool find_group(DeviceId device, QueueId queue, BindingGroup* out) const {
        std::lock_guard<LockPolicy> guard(lock_);
        const BindingGroup* g = find_locked(device, queue);
        if (g == nullptr) {
            return false;
        }
        if (out) {
            *out = *g;
        }
        return true;
    }

    /**
     * A bound socket holding this UMEM, to pass as shared_umem_fd when a new
     * group is created. The owner is preferred.
     * @return fd, or -1 if no socket holding the UMEM is bound
     */
    int share_fd() const {
        std::lock_guard<LockPolicy> guard(lock_);
        for (const BindingGroup& g : groups_) {
            for (int fd : g.members) {
                if (fd == owner_fd_) {
                    return fd;
                }
            }
        }
        for (const BindingGroup& g : groups_) {
            if (!g.members.empty()) {
                return g.members.front();
            }
        }
        return -1;
    }

    /**
     * Add a bound socket to the group for its device/queue, creating the
     * group (with fd as home) if none exists
     * @return Group id
     */
    uint32_t join_group(DeviceId device, QueueId queue, int fd) {
        std::lock_guard<LockPolicy> guard(lock_);
        BindingGroup* g = find_locked(device, queue);
        if (g == nullptr) {
            BindingGroup group;
            group.id = next_group_id_++;
            group.device = device;
            group.queue = queue;
            group.home_fd = fd;
            groups_.push_back(group);
            g = &groups_.back();
            AFXDP_LOG("[UMEM] Binding group %u created (ifindex=%u queue=%u home fd=%d)\n",
                      g->id, device.value, queue.value, fd);
        }
        g->members.push_back(fd);
        return g->id;
    }

    /**
     * Remove a closed socket from its group. When the group becomes empty the
     * kernel has torn down its Fill/Completion rings, so every frame still
     * recorded against it returns to the free set.
     *
     * @return Number of frames reclaimed
     */
    uint32_t leave_group(uint32_t group_id, int fd) {
        std::lock_guard<LockPolicy> guard(lock_);
        for (size_t i = 0; i < groups_.size(); i++) {
            BindingGroup& g = groups_[i];
            if (g.id != group_id) {
                continue;
            }
            for (size_t m = 0; m < g.members.size(); m++) {
                if (g.members[m] == fd) {
                    g.members.erase(g.members.begin() + static_cast<long>(m));
                    break;
                }
            }
            if (!g.members.empty()) {
                if (g.home_fd == fd) {
                    g.home_fd = g.members.front();
                }
                return 0;
            }

            uint32_t reclaimed = 0;
            for (uint32_t idx = 0; idx < ledger_.size(); idx++) {
                if (ledger_[idx] == group_id) {
                    ledger_[idx] = NO_GROUP;
                    pool_.release(pool_.frame_addr(idx));
                    reclaimed++;
                }
            }
            AFXDP_LOG("[UMEM] Binding group %u closed, %u frames reclaimed\n", group_id, reclaimed);
            groups_.erase(groups_.begin() + static_cast<long>(i));
            return reclaimed;
        }
        return 0;
    }

    size_t group_count() const {
        std::lock_guard<LockPolicy> guard(lock_);
        return groups_.size();
    }

    // ========================================================================
    // Frame ledger
    // ========================================================================

    /**
     * Record that addr was pushed to a ring of group_id (Fill or TX)
     */
    void mark_with_kernel(uint64_t addr, uint32_t group_id) {
        std::lock_guard<LockPolicy> guard(lock_);
        if (!pool_.contains(addr)) {
            AFXDP_FATAL("Umem: frame 0x%lx outside UMEM region", static_cast<unsigned long>(addr));
        }
        uint32_t idx = pool_.frame_index(addr);
        if (pool_.is_free(addr)) {
            AFXDP_FATAL("Umem: frame 0x%lx handed to the kernel while in the free set",
                        static_cast<unsigned long>(pool_.frame_addr(idx)));
        }
        if (ledger_[idx] != NO_GROUP) {
            AFXDP_FATAL("Umem: frame 0x%lx handed to the kernel twice (group %u)",
                        static_cast<unsigned long>(pool_.frame_addr(idx)), ledger_[idx]);
        }
        ledger_[idx] = group_id;
    }

    /**
     * Record that addr came back from the kernel (RX or Completion)
     */
    void mark_returned(uint64_t addr) {
        std::lock_guard<LockPolicy> guard(lock_);
        if (!pool_.contains(addr)) {
            AFXDP_FATAL("Umem: kernel returned address 0x%lx outside UMEM region",
                        static_cast<unsigned long>(addr));
        }
        uint32_t idx = pool_.frame_index(addr);
        if (ledger_[idx] == NO_GROUP) {
            AFXDP_FATAL("Umem: kernel returned frame 0x%lx it was never given",
                        static_cast<unsigned long>(pool_.frame_addr(idx)));
        }
        ledger_[idx] = NO_GROUP;
    }

    bool with_kernel(uint64_t addr) const {
        std::lock_guard<LockPolicy> guard(lock_);
        return pool_.contains(addr) && ledger_[pool_.frame_index(addr)] != NO_GROUP;
    }

    uint32_t frames_with_kernel(uint32_t group_id) const {
        std::lock_guard<LockPolicy> guard(lock_);
        uint32_t count = 0;
        for (uint32_t g : ledger_) {
            if (g == group_id) {
                count++;
            }
        }
        return count;
    }

private:
    explicit Umem(const UmemConfig& config) : config_(config) {}

    static std::string to_hex(uint32_t v) {
        char buf[16];
        snprintf(buf, sizeof(buf), "%x", v);
        return buf;
    }

    BindingGroup* find_locked(DeviceId device, QueueId queue) {
        for (BindingGroup& g : groups_) {
            if (g.device == device && g.queue == queue) {
                return &g;
            }
        }
        return nullptr;
    }

    const BindingGroup* find_locked(DeviceId device, QueueId queue) const {
        for (const BindingGroup& g : groups_) {
            if (g.device == device && g.queue == queue) {
                return &g;
            }
        }
        return nullptr;
    }

    UmemConfig config_;
    Pool pool_;
    int owner_fd_ = -1;                 // socket that issued XDP_UMEM_REG
    bool owner_closed_ = false;
    bool need_wakeup_ = false;
    uint32_t next_group_id_ = 1;        // 0 is NO_GROUP
    std::vector<BindingGroup> groups_;
    std::vector<uint32_t> ledger_;      // per frame: group holding it, or NO_GROUP
    mutable LockPolicy lock_;
};

}  // namespace afxdp::xdp
