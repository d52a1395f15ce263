// test/unittest/xsk_mocks.hpp
// Mock kernel and map operations for unit testing without AF_XDP privileges
//
// MockKernel implements the kernel policy used by XskSocket (see
// src/xdp/xsk_kernel.hpp). It keeps per-socket UMEM registration, ring sizes
// and ring memory, and applies the same checks xsk_bind() applies, so a bind
// the mock accepts is one the kernel would accept for the same sequence of
// calls. Tests drive "the kernel side" of each ring through kernel_view().
//
// MockMapOps implements the RedirectMap operations on a std::map with the
// BPF_ANY / BPF_NOEXIST / BPF_EXIST semantics of an XSKMAP.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <set>
#include <utility>
#include <vector>
#include <linux/bpf.h>
#include <linux/if_xdp.h>

#include "xdp/xsk_desc.hpp"
#include "xdp/xsk_kernel.hpp"
#include "xdp/xsk_ring.hpp"

namespace afxdp::test {

using xdp::RingLayout;
using xdp::XskDesc;

// Ring kinds, in the order XskSocket keeps them
enum MockRingKind { MOCK_FILL = 0, MOCK_COMPLETION = 1, MOCK_RX = 2, MOCK_TX = 3 };

// Producer, consumer and flags on separate cache lines, descriptors after
static constexpr uint64_t MOCK_OFF_PRODUCER = 0;
static constexpr uint64_t MOCK_OFF_CONSUMER = 64;
static constexpr uint64_t MOCK_OFF_FLAGS = 128;
static constexpr uint64_t MOCK_OFF_DESC = 192;

class MockKernel {
public:
    struct MockRing {
        uint32_t size = 0;
        std::vector<uint64_t> mem;      // u64 storage keeps descriptors aligned
        uint32_t map_count = 0;
    };

    struct MockSocket {
        bool open = true;
        bool umem_registered = false;
        struct xdp_umem_reg reg;
        MockRing rings[4];
        bool bound = false;
        uint32_t ifindex = 0;
        uint32_t queue_id = 0;
        uint16_t bind_flags = 0;
        uint32_t shared_umem_fd = 0;
        int umem_fd = -1;               // socket that registered the UMEM in use
        int pool_id = 0;                // kernel buffer pool (one per device/queue)
    };

    struct MockPool {
        uint32_t ifindex = 0;
        uint32_t queue_id = 0;
        int refs = 0;
        bool zero_copy = false;
    };

    MockKernel() = default;
    MockKernel(const MockKernel&) = delete;
    MockKernel& operator=(const MockKernel&) = delete;

    // ========================================================================
    // Kernel policy
    // ========================================================================

    int open_socket() {
        if (fail_socket) {
            return -EMFILE;
        }
        int fd = next_fd_++;
        sockets_[fd] = MockSocket();
        memset(&sockets_[fd].reg, 0, sizeof(sockets_[fd].reg));
        return fd;
    }

    int close_socket(int fd) {
        MockSocket* s = find_open(fd);
        if (s == nullptr) {
            return -EBADF;
        }
        s->open = false;
        if (s->pool_id != 0) {
            MockPool& pool = pools_[s->pool_id];
            if (--pool.refs == 0) {
                queue_pools_.erase(std::make_pair(pool.ifindex, pool.queue_id));
                pools_.erase(s->pool_id);
            }
            s->pool_id = 0;
        }
        s->bound = false;
        close_calls++;
        return 0;
    }

    int register_umem(int fd, const struct xdp_umem_reg& reg) {
        MockSocket* s = find_open(fd);
        if (s == nullptr) {
            return -EBADF;
        }
        if (s->umem_registered || s->bound) {
            return -EBUSY;
        }
        uint32_t chunk = reg.chunk_size;
        if (chunk < 2048 || (chunk & (chunk - 1)) != 0) {
            return -EINVAL;
        }
        if (reg.addr & 4095) {
            return -EINVAL;
        }
        if (reg.len == 0 || reg.len % chunk != 0) {
            return -EINVAL;
        }
        if (reg.headroom >= chunk - xdp::DRIVER_HEADROOM) {
            return -EINVAL;
        }
        s->umem_registered = true;
        s->reg = reg;
        s->umem_fd = fd;
        return 0;
    }

    int set_ring_size(int fd, int optname, uint32_t size) {
        MockSocket* s = find_open(fd);
        if (s == nullptr) {
            return -EBADF;
        }
        if (s->bound) {
            return -EBUSY;
        }
        int kind = kind_for_opt(optname);
        if (kind < 0) {
            return -ENOPROTOOPT;
        }
        if (fail_ring_size_at != 0 && ++ring_size_calls == fail_ring_size_at) {
            return -ENOMEM;
        }
        if (size == 0 || (size & (size - 1)) != 0) {
            return -EINVAL;
        }
        if (s->rings[kind].size != 0) {
            return -EINVAL;
        }
        s->rings[kind].size = size;
        return 0;
    }

    int mmap_offsets(int fd, struct xdp_mmap_offsets* off) {
        if (find_open(fd) == nullptr) {
            return -EBADF;
        }
        struct xdp_ring_offset ring;
        ring.producer = MOCK_OFF_PRODUCER;
        ring.consumer = MOCK_OFF_CONSUMER;
        ring.flags = MOCK_OFF_FLAGS;
        ring.desc = MOCK_OFF_DESC;
        off->rx = ring;
        off->tx = ring;
        off->fr = ring;
        off->cr = ring;
        return 0;
    }

    void* map_ring(int fd, size_t len, uint64_t pgoff) {
        MockSocket* s = find_open(fd);
        if (s == nullptr) {
            errno = EBADF;
            return nullptr;
        }
        int kind = kind_for_pgoff(pgoff);
        if (kind < 0 || s->rings[kind].size == 0) {
            errno = EINVAL;
            return nullptr;
        }
        if (fail_map_at != 0 && ++map_attempts == fail_map_at) {
            errno = ENOMEM;
            return nullptr;
        }
        MockRing& ring = s->rings[kind];
        size_t needed = MOCK_OFF_DESC + static_cast<size_t>(ring.size) * desc_size(kind);
        if (len > needed) {
            errno = EINVAL;
            return nullptr;
        }
        if (ring.mem.empty()) {
            ring.mem.assign((needed + 7) / 8, 0);
        }
        ring.map_count++;
        map_calls++;
        return ring.mem.data();
    }

    int unmap_ring(void* addr, size_t len) {
        (void)addr;
        (void)len;
        unmap_calls++;
        return 0;
    }

    // Same checks, in the same order, as xsk_bind()
    int bind(int fd, const struct sockaddr_xdp& sxdp) {
        bind_calls++;
        MockSocket* s = find_open(fd);
        if (s == nullptr) {
            return -EBADF;
        }
        if (sxdp.sxdp_family != AF_XDP) {
            return -EINVAL;
        }
        if (s->bound) {
            return -EBUSY;
        }
        if (s->rings[MOCK_RX].size == 0 && s->rings[MOCK_TX].size == 0) {
            return -EINVAL;
        }
        if (sxdp.sxdp_ifindex == 0 || missing_devices.count(sxdp.sxdp_ifindex)) {
            return -ENODEV;
        }
        if (sxdp.sxdp_queue_id >= queues_per_device) {
            return -EINVAL;
        }

        const bool has_fq = s->rings[MOCK_FILL].size != 0;
        const bool has_cq = s->rings[MOCK_COMPLETION].size != 0;
        const uint16_t flags = sxdp.sxdp_flags;
        const auto key = std::make_pair(sxdp.sxdp_ifindex, sxdp.sxdp_queue_id);
        int pool_id;

        if (flags & XDP_SHARED_UMEM) {
            if (flags & (XDP_COPY | XDP_ZEROCOPY | XDP_USE_NEED_WAKEUP)) {
                return -EINVAL;
            }
            if (s->umem_registered) {
                return -EINVAL;
            }
            MockSocket* umem_xs = find_open(static_cast<int>(sxdp.sxdp_shared_umem_fd));
            if (umem_xs == nullptr || !umem_xs->bound) {
                return -EBADF;
            }
            if (umem_xs->ifindex != sxdp.sxdp_ifindex || umem_xs->queue_id != sxdp.sxdp_queue_id) {
                // New pool for a new device/queue: needs its own Fill/Completion
                if (!has_fq || !has_cq) {
                    return -EINVAL;
                }
                if (queue_pools_.count(key)) {
                    return -EBUSY;
                }
                pool_id = new_pool(key, pools_[umem_xs->pool_id].zero_copy);
            } else {
                // Same device/queue: share the existing pool and its rings
                if (has_fq || has_cq) {
                    return -EINVAL;
                }
                pool_id = umem_xs->pool_id;
                pools_[pool_id].refs++;
            }
            s->umem_fd = umem_xs->umem_fd;
        } else {
            if (!s->umem_registered) {
                return -EINVAL;
            }
            if ((flags & XDP_COPY) && (flags & XDP_ZEROCOPY)) {
                return -EINVAL;
            }
            if ((flags & XDP_ZEROCOPY) && !zero_copy_supported) {
                return -EOPNOTSUPP;
            }
            if (!has_fq || !has_cq) {
                return -EINVAL;
            }
            if (queue_pools_.count(key)) {
                return -EBUSY;
            }
            bool zc = (flags & XDP_ZEROCOPY) || (!(flags & XDP_COPY) && zero_copy_supported);
            pool_id = new_pool(key, zc);
        }

        s->bound = true;
        s->ifindex = sxdp.sxdp_ifindex;
        s->queue_id = sxdp.sxdp_queue_id;
        s->bind_flags = flags;
        s->shared_umem_fd = sxdp.sxdp_shared_umem_fd;
        s->pool_id = pool_id;
        return 0;
    }

    int wakeup_tx(int fd) {
        if (find_open(fd) == nullptr) {
            return -EBADF;
        }
        tx_wakeups++;
        return wakeup_result;
    }

    int wakeup_rx(int fd) {
        if (find_open(fd) == nullptr) {
            return -EBADF;
        }
        rx_wakeups++;
        return wakeup_result;
    }

    int statistics(int fd, struct xdp_statistics* stats) {
        if (find_open(fd) == nullptr) {
            return -EBADF;
        }
        *stats = next_statistics;
        return 0;
    }

    int options(int fd, struct xdp_options* opts) {
        MockSocket* s = find_open(fd);
        if (s == nullptr) {
            return -EBADF;
        }
        opts->flags = 0;
        if (s->bound && pools_[s->pool_id].zero_copy) {
            opts->flags |= XDP_OPTIONS_ZEROCOPY;
        }
        return 0;
    }

    // ========================================================================
    // Test hooks
    // ========================================================================

    /**
     * Ring memory of socket fd, for driving the kernel's side of the ring
     */
    RingLayout kernel_view(int fd, MockRingKind kind) {
        MockRing& ring = sockets_.at(fd).rings[kind];
        uint8_t* base = reinterpret_cast<uint8_t*>(ring.mem.data());
        RingLayout layout;
        layout.producer = reinterpret_cast<uint32_t*>(base + MOCK_OFF_PRODUCER);
        layout.consumer = reinterpret_cast<uint32_t*>(base + MOCK_OFF_CONSUMER);
        layout.flags = reinterpret_cast<uint32_t*>(base + MOCK_OFF_FLAGS);
        layout.descs = base + MOCK_OFF_DESC;
        layout.size = ring.size;
        return layout;
    }

    void set_ring_flags(int fd, MockRingKind kind, uint32_t flags) {
        *kernel_view(fd, kind).flags = flags;
    }

    const MockSocket& socket(int fd) const { return sockets_.at(fd); }
    bool is_bound(int fd) const { return sockets_.count(fd) && sockets_.at(fd).bound; }
    size_t pool_count() const { return pools_.size(); }

    // Knobs
    bool fail_socket = false;
    bool zero_copy_supported = true;
    uint32_t queues_per_device = 8;
    int wakeup_result = 0;
    std::set<uint32_t> missing_devices;
    struct xdp_statistics next_statistics = {};
    int fail_ring_size_at = 0;      // 1-based set_ring_size call that fails with ENOMEM
    int fail_map_at = 0;            // 1-based map_ring call that fails with ENOMEM

    // Counters
    int bind_calls = 0;
    int close_calls = 0;
    int map_calls = 0;
    int unmap_calls = 0;
    int tx_wakeups = 0;
    int rx_wakeups = 0;
    int ring_size_calls = 0;
    int map_attempts = 0;

private:
    MockSocket* find_open(int fd) {
        auto it = sockets_.find(fd);
        if (it == sockets_.end() || !it->second.open) {
            return nullptr;
        }
        return &it->second;
    }

    int new_pool(const std::pair<uint32_t, uint32_t>& key, bool zero_copy) {
        int id = next_pool_id_++;
        MockPool pool;
        pool.ifindex = key.first;
        pool.queue_id = key.second;
        pool.refs = 1;
        pool.zero_copy = zero_copy;
        pools_[id] = pool;
        queue_pools_[key] = id;
        return id;
    }

    static int kind_for_opt(int optname) {
        switch (optname) {
            case XDP_UMEM_FILL_RING:       return MOCK_FILL;
            case XDP_UMEM_COMPLETION_RING: return MOCK_COMPLETION;
            case XDP_RX_RING:              return MOCK_RX;
            case XDP_TX_RING:              return MOCK_TX;
        }
        return -1;
    }

    static int kind_for_pgoff(uint64_t pgoff) {
        if (pgoff == XDP_UMEM_PGOFF_FILL_RING) return MOCK_FILL;
        if (pgoff == XDP_UMEM_PGOFF_COMPLETION_RING) return MOCK_COMPLETION;
        if (pgoff == XDP_PGOFF_RX_RING) return MOCK_RX;
        if (pgoff == XDP_PGOFF_TX_RING) return MOCK_TX;
        return -1;
    }

    static size_t desc_size(int kind) {
        return (kind == MOCK_RX || kind == MOCK_TX) ? sizeof(XskDesc) : sizeof(uint64_t);
    }

    int next_fd_ = 100;
    int next_pool_id_ = 1;
    std::map<int, MockSocket> sockets_;
    std::map<int, MockPool> pools_;
    std::map<std::pair<uint32_t, uint32_t>, int> queue_pools_;
};

/**
 * XSKMAP stand-in for RedirectMap<MockMapOps>
 */
struct MockMapOps {
    uint32_t max = 4;
    std::map<uint32_t, int> entries;
    int fail_errno = 0;             // when set, every update/remove fails with it
    int update_calls = 0;
    int remove_calls = 0;

    int update(uint32_t key, int fd, uint64_t flags) {
        update_calls++;
        if (fail_errno) {
            return -fail_errno;
        }
        bool exists = entries.count(key) != 0;
        if (flags == BPF_NOEXIST && exists) {
            return -EEXIST;
        }
        if (flags == BPF_EXIST && !exists) {
            return -ENOENT;
        }
        entries[key] = fd;
        return 0;
    }

    int remove(uint32_t key) {
        remove_calls++;
        if (fail_errno) {
            return -fail_errno;
        }
        if (entries.erase(key) == 0) {
            return -ENOENT;
        }
        return 0;
    }

    uint32_t max_entries() const { return max; }
};

}  // namespace afxdp::test
