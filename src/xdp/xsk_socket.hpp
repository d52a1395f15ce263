// src/xdp/xsk_socket.hpp
// AF_XDP socket: UMEM attachment, ring setup and the binding state machine
//
// Lifecycle:
//   CREATED ──register_pool()/attach_pool()──> POOL_ATTACHED
//           ──configure_rings()──────────────> RINGS_CONFIGURED
//           ──bind()─────────────────────────> BOUND
//           ──activate()─────────────────────> ACTIVE
//   any state ──close()──────────────────────> CLOSED
//
// Binding rules (the kernel's, checked here first so a rejected bind reports
// which rule it broke):
//   - Every socket needs an RX or a TX ring.
//   - The pool owner needs its own Fill and Completion rings.
//   - A socket sharing a pool needs the owner (or another holder) bound.
//   - Sharing on a device/queue where no socket of the pool is bound yet:
//     the socket must bring its own Fill and Completion rings. Without them
//     the kernel fails the bind with EINVAL, and nothing in the error says
//     why. configure_rings() can add them and bind() can be retried.
//   - Sharing on a device/queue where the pool is already bound: the socket
//     uses the existing Fill/Completion rings and must not have its own.
//
// Data exchange:
//   socket.refill(n);                       // pool -> Fill
//   n = socket.receive(descs, batch);       // RX -> application
//   socket.transmit(descs, n);              // application -> TX
//   socket.kick_tx();
//   socket.reclaim_completions(batch);      // Completion -> pool
//
// Ring access and exchange before bind(): ring accessors throw NOT_BOUND,
// exchange helpers return 0 with errno = ENOTCONN.
//
// close() unmaps the rings, closes the fd and then, if this was the last
// socket using its Fill/Completion rings, returns the frames those rings
// still held to the pool. Callers must stop ring operations first.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <linux/if_xdp.h>

#include "core/lock_policy.hpp"
#include "core/log.hpp"
#include "core/xsk_error.hpp"
#include "xdp/umem.hpp"
#include "xdp/xsk_config.hpp"
#include "xdp/xsk_desc.hpp"
#include "xdp/xsk_kernel.hpp"
#include "xdp/xsk_ring.hpp"

namespace afxdp::xdp {

enum class SocketState {
    CREATED,
    POOL_ATTACHED,
    RINGS_CONFIGURED,
    BOUND,
    ACTIVE,
    CLOSED,
};

inline const char* socket_state_name(SocketState state) {
    switch (state) {
        case SocketState::CREATED:          return "CREATED";
        case SocketState::POOL_ATTACHED:    return "POOL_ATTACHED";
        case SocketState::RINGS_CONFIGURED: return "RINGS_CONFIGURED";
        case SocketState::BOUND:            return "BOUND";
        case SocketState::ACTIVE:           return "ACTIVE";
        case SocketState::CLOSED:           return "CLOSED";
    }
    return "UNKNOWN";
}

/**
 * Kernel socket counters (XDP_STATISTICS)
 */
struct XskStatistics {
    uint64_t rx_dropped;                // dropped for reasons other than invalid desc
    uint64_t rx_invalid_descs;
    uint64_t tx_invalid_descs;
    uint64_t rx_ring_full;              // dropped because the RX ring was full
    uint64_t rx_fill_ring_empty_descs;  // failed to take a frame from the Fill ring
    uint64_t tx_ring_empty_descs;       // TX wakeup with nothing to send
};

template<typename Kernel = LinuxKernel, typename LockPolicy = NullLock>
class XskSocket {
public:
    using UmemType = Umem<LockPolicy>;

    static constexpr uint32_t RECLAIM_BATCH = 64;

    /**
     * Open an AF_XDP socket
     * @throws XskError(SYSTEM_ERROR) if socket() fails
     */
    explicit XskSocket(Kernel& kernel = Kernel::instance())
        : kernel_(&kernel)
    {
        int fd = kernel_->open_socket();
        if (fd < 0) {
            throw XskError(ErrorKind::SYSTEM_ERROR, "Failed to create AF_XDP socket", -fd);
        }
        fd_ = fd;
    }

    ~XskSocket() {
        close();
    }

    XskSocket(const XskSocket&) = delete;
    XskSocket& operator=(const XskSocket&) = delete;

    // ========================================================================
    // Setup
    // ========================================================================

    /**
     * Register umem with the kernel on this socket, which becomes its owner
     *
     * @throws XskError POOL_ALREADY_REGISTERED if this socket already has a
     *         pool or umem is registered by another socket,
     *         UMEM_REGISTRATION_FAILED if the kernel rejects the region
     */
    void register_pool(const std::shared_ptr<UmemType>& umem) {
        check_can_attach(umem);
        umem->claim_owner(fd_);

        struct xdp_umem_reg reg = umem->registration();
        int ret = kernel_->register_umem(fd_, reg);
        if (ret < 0) {
            umem->abandon_owner(fd_);
            throw XskError(ErrorKind::UMEM_REGISTRATION_FAILED,
                           "XDP_UMEM_REG (len=" + std::to_string(reg.len) +
                           " chunk=" + std::to_string(reg.chunk_size) +
                           " headroom=" + std::to_string(reg.headroom) + ")", -ret);
        }

        umem_ = umem;
        owner_ = true;
        state_ = SocketState::POOL_ATTACHED;
        AFXDP_LOG("[XSK] fd=%d registered UMEM (%u frames x %u)\n",
                  fd_, umem->pool().frame_count(), umem->pool().frame_size());
    }

    /**
     * Share a UMEM registered by another socket
     * @throws XskError(POOL_ALREADY_REGISTERED) if this socket already has a pool
     */
    void attach_pool(const std::shared_ptr<UmemType>& umem) {
        check_can_attach(umem);
        umem_ = umem;
        owner_ = false;
        state_ = SocketState::POOL_ATTACHED;
        DEBUG_PRINT("[XSK] fd=%d attached shared UMEM\n", fd_);
    }

    /**
     * Create and map the rings named in config (size 0 = omit). Can be
     * called again before bind() to add rings that were omitted. A ring
     * that already exists with the requested size is left alone, so after a
     * SYSTEM_ERROR the same config can be retried.
     *
     * @throws XskError INVALID_RING_SIZE, INVALID_STATE (wrong state or ring
     *         already configured with another size), SYSTEM_ERROR
     */
    void configure_rings(const RingConfig& config) {
        if (state_ != SocketState::POOL_ATTACHED && state_ != SocketState::RINGS_CONFIGURED) {
            throw XskError(ErrorKind::INVALID_STATE,
                           std::string("configure_rings() in state ") + socket_state_name(state_));
        }

        const uint32_t sizes[RING_KINDS] = {
            config.fill_size, config.completion_size, config.rx_size, config.tx_size
        };
        for (int k = 0; k < RING_KINDS; k++) {
            if (sizes[k] == 0) {
                continue;
            }
            if (!is_power_of_two(sizes[k])) {
                throw XskError(ErrorKind::INVALID_RING_SIZE,
                               std::string(RING_INFO[k].name) + " ring size " +
                               std::to_string(sizes[k]) + " must be a power of 2");
            }
            if (rings_[k].size != 0 && rings_[k].size != sizes[k]) {
                throw XskError(ErrorKind::INVALID_STATE,
                               std::string(RING_INFO[k].name) + " ring already configured with size " +
                               std::to_string(rings_[k].size));
            }
        }

        for (int k = 0; k < RING_KINDS; k++) {
            if (sizes[k] == 0 || rings_[k].size != 0) {
                continue;
            }
            int ret = kernel_->set_ring_size(fd_, RING_INFO[k].optname, sizes[k]);
            if (ret < 0) {
                throw XskError(ErrorKind::SYSTEM_ERROR,
                               std::string("Failed to size ") + RING_INFO[k].name + " ring", -ret);
            }
            rings_[k].size = sizes[k];
        }

        struct xdp_mmap_offsets off;
        memset(&off, 0, sizeof(off));
        int ret = kernel_->mmap_offsets(fd_, &off);
        if (ret < 0) {
            throw XskError(ErrorKind::SYSTEM_ERROR, "XDP_MMAP_OFFSETS", -ret);
        }

        if (map_ring(FILL, off.fr)) {
            fill_.attach(layout(FILL, off.fr), RingRole::PRODUCER);
        }
        if (map_ring(COMPLETION, off.cr)) {
            comp_.attach(layout(COMPLETION, off.cr), RingRole::CONSUMER);
        }
        if (map_ring(RX, off.rx)) {
            rx_.attach(layout(RX, off.rx), RingRole::CONSUMER);
        }
        if (map_ring(TX, off.tx)) {
            tx_.attach(layout(TX, off.tx), RingRole::PRODUCER);
        }

        state_ = SocketState::RINGS_CONFIGURED;
        DEBUG_PRINT("[XSK] fd=%d rings fill=%u comp=%u rx=%u tx=%u\n", fd_,
                    rings_[FILL].size, rings_[COMPLETION].size, rings_[RX].size, rings_[TX].size);
    }

    /**
     * Bind to a device/queue pair
     *
     * @throws XskError ALREADY_BOUND, INVALID_STATE, or BIND_REJECTED with
     *         rule() naming the binding rule (the socket stays in
     *         RINGS_CONFIGURED and bind() may be retried)
     */
    void bind(DeviceId device, QueueId queue, const BindConfig& config = BindConfig()) {
        if (state_ == SocketState::BOUND || state_ == SocketState::ACTIVE) {
            throw XskError(ErrorKind::ALREADY_BOUND,
                           "Socket already bound to ifindex " + std::to_string(device_.value) +
                           " queue " + std::to_string(queue_.value), EBUSY);
        }
        if (state_ != SocketState::RINGS_CONFIGURED) {
            throw XskError(ErrorKind::INVALID_STATE,
                           std::string("bind() in state ") + socket_state_name(state_));
        }

        const bool has_fill_comp = rings_[FILL].size != 0 && rings_[COMPLETION].size != 0;
        const bool has_any_fill_comp = rings_[FILL].size != 0 || rings_[COMPLETION].size != 0;

        if (rings_[RX].size == 0 && rings_[TX].size == 0) {
            reject(BindRule::NO_RX_OR_TX_RING, EINVAL);
        }

        struct sockaddr_xdp sxdp;
        memset(&sxdp, 0, sizeof(sxdp));
        sxdp.sxdp_family = AF_XDP;
        sxdp.sxdp_ifindex = device.value;
        sxdp.sxdp_queue_id = queue.value;

        bool need_wakeup;
        if (owner_) {
            if (!has_fill_comp) {
                reject(BindRule::OWNER_MISSING_FILL_COMPLETION, EINVAL);
            }
            sxdp.sxdp_flags = mode_flags(config.mode);
            if (config.need_wakeup) {
                sxdp.sxdp_flags |= XDP_USE_NEED_WAKEUP;
            }
            need_wakeup = config.need_wakeup;
        } else {
            int share_fd = umem_->share_fd();
            if (share_fd < 0) {
                reject(BindRule::OWNER_NOT_BOUND, EBADF);
            }
            BindingGroup group;
            if (umem_->find_group(device, queue, &group)) {
                if (has_any_fill_comp) {
                    reject(BindRule::SHARED_QUEUE_OWN_FILL_COMPLETION, EINVAL);
                }
                share_fd = group.home_fd;
            } else if (!has_fill_comp) {
                reject(BindRule::SHARED_POOL_MISSING_FILL_COMPLETION, EINVAL);
            }
            sxdp.sxdp_flags = XDP_SHARED_UMEM;
            sxdp.sxdp_shared_umem_fd = static_cast<uint32_t>(share_fd);
            need_wakeup = umem_->need_wakeup();
        }

        int ret = kernel_->bind(fd_, sxdp);
        if (ret < 0) {
            reject(BindRule::KERNEL_REJECTED, -ret);
        }

        if (owner_) {
            umem_->set_need_wakeup(need_wakeup);
        }
        need_wakeup_ = need_wakeup;
        device_ = device;
        queue_ = queue;
        group_id_ = umem_->join_group(device, queue, fd_);
        state_ = SocketState::BOUND;

        AFXDP_LOG("[XSK] ✅ fd=%d bound to ifindex=%u queue=%u (%s%s)\n",
                  fd_, device.value, queue.value,
                  owner_ ? "owner" : "shared",
                  need_wakeup_ ? ", need_wakeup" : "");
    }

    /**
     * @throws XskError(INVALID_STATE) unless BOUND (ACTIVE is a no-op)
     */
    void activate() {
        if (state_ == SocketState::ACTIVE) {
            return;
        }
        if (state_ != SocketState::BOUND) {
            throw XskError(ErrorKind::INVALID_STATE,
                           std::string("activate() in state ") + socket_state_name(state_));
        }
        state_ = SocketState::ACTIVE;
    }

    /**
     * Release the socket. Idempotent.
     */
    void close() {
        if (state_ == SocketState::CLOSED) {
            return;
        }

        fill_.detach();
        comp_.detach();
        rx_.detach();
        tx_.detach();
        for (int k = 0; k < RING_KINDS; k++) {
            if (rings_[k].map != nullptr) {
                int ret = kernel_->unmap_ring(rings_[k].map, rings_[k].len);
                if (ret < 0) {
                    AFXDP_WARN("[XSK] fd=%d munmap %s ring failed: %s\n",
                               fd_, RING_INFO[k].name, strerror(-ret));
                }
            }
            rings_[k] = MappedRing();
        }

        if (fd_ >= 0) {
            int ret = kernel_->close_socket(fd_);
            if (ret < 0) {
                AFXDP_WARN("[XSK] close(fd=%d) failed: %s\n", fd_, strerror(-ret));
            }
        }

        // The kernel has dropped this socket's rings; frames they held come
        // back once no other socket uses the same Fill/Completion pair
        uint32_t reclaimed = 0;
        if (umem_) {
            if (group_id_ != UmemType::NO_GROUP) {
                reclaimed = umem_->leave_group(group_id_, fd_);
            }
            if (owner_) {
                umem_->owner_closed(fd_);
            }
        }

        if (group_id_ != UmemType::NO_GROUP) {
            AFXDP_LOG("[XSK] fd=%d closed (%u frames reclaimed)\n", fd_, reclaimed);
        }

        group_id_ = UmemType::NO_GROUP;
        umem_.reset();
        fd_ = -1;
        state_ = SocketState::CLOSED;
    }

    // ========================================================================
    // Descriptor exchange
    // ========================================================================

    /**
     * Push frames to the Fill ring
     * @return Number pushed; the rest stay with the caller
     */
    uint32_t fill(const uint64_t* addrs, uint32_t n) {
        if (!exchange_ready() || !require(fill_)) {
            return 0;
        }
        uint32_t idx;
        uint32_t count = fill_.reserve(n, &idx);
        if (count == 0) {
            errno = EAGAIN;
            return 0;
        }
        for (uint32_t i = 0; i < count; i++) {
            umem_->mark_with_kernel(addrs[i], group_id_);
            fill_.write(idx + i, addrs[i]);
        }
        fill_.submit(count);
        return count;
    }

    /**
     * Take received packets off the RX ring. The frames now belong to the
     * caller, who must refill, transmit or release them to the pool.
     */
    uint32_t receive(XskDesc* out, uint32_t n) {
        if (!exchange_ready() || !require(rx_)) {
            return 0;
        }
        uint32_t idx;
        uint32_t count = rx_.peek(n, &idx);
        if (count == 0) {
            errno = EAGAIN;
            return 0;
        }
        for (uint32_t i = 0; i < count; i++) {
            out[i] = rx_.read(idx + i);
            umem_->mark_returned(out[i].addr);
        }
        rx_.release(count);
        return count;
    }

    /**
     * Queue descriptors on the TX ring. Call kick_tx() afterwards.
     * The batch stops before the first descriptor whose data does not fit
     * in its frame (errno = EINVAL); the kernel would drop it without a
     * completion.
     * @return Number queued; the rest stay with the caller
     */
    uint32_t transmit(const XskDesc* descs, uint32_t n) {
        if (!exchange_ready() || !require(tx_)) {
            return 0;
        }
        uint32_t valid = 0;
        while (valid < n && umem_->pool().data(descs[valid].addr, descs[valid].len) != nullptr) {
            valid++;
        }
        if (valid == 0 && n > 0) {
            errno = EINVAL;
            return 0;
        }
        uint32_t idx;
        uint32_t count = tx_.reserve(valid, &idx);
        if (count == 0) {
            errno = EAGAIN;
            return 0;
        }
        if (valid < n && count == valid) {
            errno = EINVAL;
        }
        for (uint32_t i = 0; i < count; i++) {
            umem_->mark_with_kernel(descs[i].addr, group_id_);
            tx_.write(idx + i, descs[i]);
        }
        tx_.submit(count);
        return count;
    }

    /**
     * Take sent frame offsets off the Completion ring
     */
    uint32_t complete(uint64_t* out, uint32_t n) {
        if (!exchange_ready() || !require(comp_)) {
            return 0;
        }
        uint32_t idx;
        uint32_t count = comp_.peek(n, &idx);
        if (count == 0) {
            errno = EAGAIN;
            return 0;
        }
        for (uint32_t i = 0; i < count; i++) {
            out[i] = comp_.read(idx + i);
            umem_->mark_returned(out[i]);
        }
        comp_.release(count);
        return count;
    }

    /**
     * Move up to n free frames from the pool to the Fill ring
     */
    uint32_t refill(uint32_t n) {
        if (!exchange_ready() || !require(fill_)) {
            return 0;
        }
        uint32_t total = 0;
        uint64_t addrs[RECLAIM_BATCH];
        while (total < n) {
            uint32_t want = n - total;
            if (want > RECLAIM_BATCH) {
                want = RECLAIM_BATCH;
            }
            uint32_t room = fill_.free_entries();
            if (want > room) {
                want = room;
            }
            if (want == 0) {
                break;
            }
            uint32_t got = umem_->pool().allocate_batch(addrs, want);
            if (got == 0) {
                break;
            }
            uint32_t pushed = fill(addrs, got);
            if (pushed < got) {
                umem_->pool().release_batch(addrs + pushed, got - pushed);
            }
            total += pushed;
            if (pushed < got) {
                break;
            }
        }
        return total;
    }

    /**
     * Return up to n completed TX frames to the pool
     */
    uint32_t reclaim_completions(uint32_t n) {
        uint32_t total = 0;
        uint64_t addrs[RECLAIM_BATCH];
        while (total < n) {
            uint32_t want = n - total;
            if (want > RECLAIM_BATCH) {
                want = RECLAIM_BATCH;
            }
            uint32_t got = complete(addrs, want);
            if (got == 0) {
                break;
            }
            umem_->pool().release_batch(addrs, got);
            total += got;
        }
        return total;
    }

    /**
     * Initial Fill ring population
     * @throws XskError POOL_EXHAUSTED if the pool has fewer than n free frames,
     *         NOT_BOUND / INVALID_STATE if the socket cannot fill
     */
    uint32_t prime_fill_ring(uint32_t n) {
        if (!is_bound()) {
            throw XskError(ErrorKind::NOT_BOUND, "prime_fill_ring() before bind()", ENOTCONN);
        }
        if (!fill_.valid()) {
            throw XskError(ErrorKind::INVALID_STATE, "Fill ring not configured on this socket");
        }
        uint32_t available = umem_->pool().free_count();
        if (available < n) {
            throw XskError(ErrorKind::POOL_EXHAUSTED,
                           "Cannot prime Fill ring with " + std::to_string(n) +
                           " frames, " + std::to_string(available) + " free", ENOBUFS);
        }
        uint32_t count = refill(n);
        AFXDP_LOG("[XSK] fd=%d Fill ring primed with %u frames\n", fd_, count);
        return count;
    }

    // ========================================================================
    // Wakeups
    // ========================================================================

    /**
     * Tell the kernel there is work on the TX ring, if it asked for it
     * @return 0, or -errno for errors other than transient backpressure
     */
    int kick_tx() {
        if (!exchange_ready() || !require(tx_)) {
            return -errno;
        }
        if (need_wakeup_ && !tx_.needs_wakeup()) {
            return 0;
        }
        int ret = kernel_->wakeup_tx(fd_);
        if (ret == -EAGAIN || ret == -EBUSY || ret == -ENOBUFS || ret == -ENETDOWN) {
            return 0;
        }
        return ret;
    }

    /**
     * Tell the kernel Fill ring entries are available, if it asked for it
     */
    int wakeup_rx() {
        if (!exchange_ready()) {
            return -errno;
        }
        if (need_wakeup_ && fill_.valid() && !fill_.needs_wakeup()) {
            return 0;
        }
        int ret = kernel_->wakeup_rx(fd_);
        if (ret == -EAGAIN || ret == -EBUSY || ret == -ENOBUFS || ret == -ENETDOWN) {
            return 0;
        }
        return ret;
    }

    // ========================================================================
    // Ring access (BOUND or ACTIVE only)
    // ========================================================================

    FillRing& fill_ring() { return checked(fill_, FILL); }
    CompletionRing& completion_ring() { return checked(comp_, COMPLETION); }
    RxRing& rx_ring() { return checked(rx_, RX); }
    TxRing& tx_ring() { return checked(tx_, TX); }

    bool has_fill_ring() const { return rings_[FILL].size != 0; }
    bool has_completion_ring() const { return rings_[COMPLETION].size != 0; }
    bool has_rx_ring() const { return rings_[RX].size != 0; }
    bool has_tx_ring() const { return rings_[TX].size != 0; }

    // ========================================================================
    // Introspection
    // ========================================================================

    /**
     * @throws XskError SYSTEM_ERROR
     */
    XskStatistics statistics() const {
        struct xdp_statistics raw;
        int ret = kernel_->statistics(fd_, &raw);
        if (ret < 0) {
            throw XskError(ErrorKind::SYSTEM_ERROR, "XDP_STATISTICS", -ret);
        }
        XskStatistics stats;
        stats.rx_dropped = raw.rx_dropped;
        stats.rx_invalid_descs = raw.rx_invalid_descs;
        stats.tx_invalid_descs = raw.tx_invalid_descs;
        stats.rx_ring_full = raw.rx_ring_full;
        stats.rx_fill_ring_empty_descs = raw.rx_fill_ring_empty_descs;
        stats.tx_ring_empty_descs = raw.tx_ring_empty_descs;
        return stats;
    }

    /**
     * Whether the driver bound the socket in zero-copy mode
     * @throws XskError NOT_BOUND, SYSTEM_ERROR
     */
    bool is_zero_copy() const {
        if (!is_bound()) {
            throw XskError(ErrorKind::NOT_BOUND, "is_zero_copy() before bind()", ENOTCONN);
        }
        struct xdp_options opts;
        int ret = kernel_->options(fd_, &opts);
        if (ret < 0) {
            throw XskError(ErrorKind::SYSTEM_ERROR, "XDP_OPTIONS", -ret);
        }
        return (opts.flags & XDP_OPTIONS_ZEROCOPY) != 0;
    }

    int fd() const { return fd_; }
    SocketState state() const { return state_; }
    bool is_owner() const { return owner_; }
    bool is_bound() const { return state_ == SocketState::BOUND || state_ == SocketState::ACTIVE; }
    bool uses_need_wakeup() const { return need_wakeup_; }
    DeviceId device() const { return device_; }
    QueueId queue() const { return queue_; }
    uint32_t group_id() const { return group_id_; }
    const std::shared_ptr<UmemType>& umem() const { return umem_; }

private:
    enum RingKind { FILL = 0, COMPLETION = 1, RX = 2, TX = 3 };
    static constexpr int RING_KINDS = 4;

    struct RingInfo {
        const char* name;
        int optname;
        uint64_t pgoff;
        size_t desc_size;
    };

    static constexpr RingInfo RING_INFO[RING_KINDS] = {
        {"Fill",       XDP_UMEM_FILL_RING,       XDP_UMEM_PGOFF_FILL_RING,       sizeof(uint64_t)},
        {"Completion", XDP_UMEM_COMPLETION_RING, XDP_UMEM_PGOFF_COMPLETION_RING, sizeof(uint64_t)},
        {"RX",         XDP_RX_RING,              XDP_PGOFF_RX_RING,              sizeof(XskDesc)},
        {"TX",         XDP_TX_RING,              XDP_PGOFF_TX_RING,              sizeof(XskDesc)},
    };

    // One mmap'd ring region
    struct MappedRing {
        void* map = nullptr;
        size_t len = 0;
        uint32_t size = 0;     // 0 = ring not configured
    };

    void check_can_attach(const std::shared_ptr<UmemType>& umem) const {
        if (!umem) {
            throw XskError(ErrorKind::INVALID_STATE, "Null UMEM");
        }
        if (umem_ || state_ == SocketState::POOL_ATTACHED) {
            throw XskError(ErrorKind::POOL_ALREADY_REGISTERED, "Socket already has a UMEM", EBUSY);
        }
        if (state_ != SocketState::CREATED) {
            throw XskError(ErrorKind::INVALID_STATE,
                           std::string("UMEM attach in state ") + socket_state_name(state_));
        }
    }

    // Map a configured ring that is not mapped yet
    bool map_ring(RingKind kind, const struct xdp_ring_offset& off) {
        MappedRing& ring = rings_[kind];
        if (ring.size == 0 || ring.map != nullptr) {
            return false;
        }
        size_t len = off.desc + static_cast<size_t>(ring.size) * RING_INFO[kind].desc_size;
        void* map = kernel_->map_ring(fd_, len, RING_INFO[kind].pgoff);
        if (map == nullptr) {
            throw XskError(ErrorKind::SYSTEM_ERROR,
                           std::string("Failed to mmap ") + RING_INFO[kind].name + " ring", errno);
        }
        ring.map = map;
        ring.len = len;
        return true;
    }

    RingLayout layout(RingKind kind, const struct xdp_ring_offset& off) const {
        return RingLayout::from_offsets(rings_[kind].map, off, rings_[kind].size);
    }

    [[noreturn]] void reject(BindRule rule, int err) const {
        throw XskError(ErrorKind::BIND_REJECTED, bind_rule_name(rule), err, rule);
    }

    static uint16_t mode_flags(BindMode mode) {
        switch (mode) {
            case BindMode::COPY:     return XDP_COPY;
            case BindMode::ZEROCOPY: return XDP_ZEROCOPY;
            case BindMode::AUTO:     break;
        }
        return 0;
    }

    bool exchange_ready() const {
        if (!is_bound()) {
            errno = ENOTCONN;
            return false;
        }
        return true;
    }

    template<typename R>
    static bool require(const R& ring) {
        if (!ring.valid()) {
            errno = EOPNOTSUPP;
            return false;
        }
        return true;
    }

    template<typename R>
    R& checked(R& ring, RingKind kind) {
        if (!is_bound()) {
            throw XskError(ErrorKind::NOT_BOUND,
                           std::string(RING_INFO[kind].name) + " ring access before bind()", ENOTCONN);
        }
        if (!ring.valid()) {
            throw XskError(ErrorKind::INVALID_STATE,
                           std::string(RING_INFO[kind].name) + " ring not configured on this socket");
        }
        return ring;
    }

    Kernel* kernel_;
    int fd_ = -1;
    SocketState state_ = SocketState::CREATED;
    std::shared_ptr<UmemType> umem_;
    bool owner_ = false;                    // issued XDP_UMEM_REG
    bool need_wakeup_ = false;
    DeviceId device_;
    QueueId queue_;
    uint32_t group_id_ = UmemType::NO_GROUP;

    MappedRing rings_[RING_KINDS];
    FillRing fill_;
    CompletionRing comp_;
    RxRing rx_;
    TxRing tx_;
};

}  // namespace afxdp::xdp
