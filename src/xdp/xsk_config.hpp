// xdp/xsk_config.hpp
// Configuration types for UMEM, rings and socket binding
//
// Defaults can be overridden at compile time:
//   -DAFXDP_DEFAULT_FRAME_SIZE=2048
//   -DAFXDP_DEFAULT_FRAME_COUNT=8192
//   -DAFXDP_DEFAULT_RING_SIZE=4096

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <net/if.h>

#include "core/xsk_error.hpp"

#ifndef AFXDP_DEFAULT_FRAME_SIZE
#define AFXDP_DEFAULT_FRAME_SIZE 4096
#endif

#ifndef AFXDP_DEFAULT_FRAME_COUNT
#define AFXDP_DEFAULT_FRAME_COUNT 4096
#endif

#ifndef AFXDP_DEFAULT_RING_SIZE
#define AFXDP_DEFAULT_RING_SIZE 2048
#endif

namespace afxdp::xdp {

// Headroom the kernel reserves in front of every received packet
static constexpr uint32_t DRIVER_HEADROOM = 256;

// Smallest chunk size the kernel accepts for an aligned UMEM
static constexpr uint32_t MIN_FRAME_SIZE = 2048;

static constexpr uint32_t DEFAULT_FRAME_SIZE = AFXDP_DEFAULT_FRAME_SIZE;
static constexpr uint32_t DEFAULT_FRAME_COUNT = AFXDP_DEFAULT_FRAME_COUNT;
static constexpr uint32_t DEFAULT_RING_SIZE = AFXDP_DEFAULT_RING_SIZE;

static_assert((DEFAULT_FRAME_SIZE & (DEFAULT_FRAME_SIZE - 1)) == 0,
              "AFXDP_DEFAULT_FRAME_SIZE must be a power of 2");
static_assert((DEFAULT_RING_SIZE & (DEFAULT_RING_SIZE - 1)) == 0,
              "AFXDP_DEFAULT_RING_SIZE must be a power of 2");

inline constexpr bool is_power_of_two(uint64_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

// Network interface index
struct DeviceId {
    uint32_t value = 0;

    constexpr DeviceId() = default;
    constexpr explicit DeviceId(uint32_t v) : value(v) {}

    constexpr bool operator==(const DeviceId& o) const { return value == o.value; }
    constexpr bool operator!=(const DeviceId& o) const { return value != o.value; }
};

// RX/TX queue index on a device
struct QueueId {
    uint32_t value = 0;

    constexpr QueueId() = default;
    constexpr explicit QueueId(uint32_t v) : value(v) {}

    constexpr bool operator==(const QueueId& o) const { return value == o.value; }
    constexpr bool operator!=(const QueueId& o) const { return value != o.value; }
};

/**
 * Resolve an interface name ("eth0") to its DeviceId
 * @throws XskError(SYSTEM_ERROR) if the interface does not exist
 */
inline DeviceId device_from_name(const char* ifname) {
    unsigned int ifindex = if_nametoindex(ifname);
    if (ifindex == 0) {
        throw XskError(ErrorKind::SYSTEM_ERROR,
                       std::string("Interface not found: ") + ifname, errno);
    }
    return DeviceId(ifindex);
}

/**
 * UMEM geometry
 */
struct UmemConfig {
    uint32_t frame_size;     // Chunk size, power of 2, >= MIN_FRAME_SIZE
    uint32_t frame_count;    // Number of frames in the region
    uint32_t headroom;       // Extra headroom the kernel leaves before RX data
    uint32_t flags;          // XDP_UMEM_* registration flags (aligned mode only: 0)

    UmemConfig()
        : frame_size(DEFAULT_FRAME_SIZE)
        , frame_count(DEFAULT_FRAME_COUNT)
        , headroom(0)
        , flags(0)
    {}

    UmemConfig(uint32_t size, uint32_t count, uint32_t head = 0)
        : frame_size(size)
        , frame_count(count)
        , headroom(head)
        , flags(0)
    {}
};

/**
 * Ring capacities. A zero size omits that ring.
 */
struct RingConfig {
    uint32_t fill_size;
    uint32_t completion_size;
    uint32_t rx_size;
    uint32_t tx_size;

    RingConfig()
        : fill_size(DEFAULT_RING_SIZE)
        , completion_size(DEFAULT_RING_SIZE)
        , rx_size(DEFAULT_RING_SIZE)
        , tx_size(DEFAULT_RING_SIZE)
    {}

    RingConfig(uint32_t fill, uint32_t comp, uint32_t rx, uint32_t tx)
        : fill_size(fill)
        , completion_size(comp)
        , rx_size(rx)
        , tx_size(tx)
    {}

    // RX/TX only: for a socket sharing the Fill/Completion rings of another
    // socket bound to the same device/queue
    static RingConfig rx_tx_only(uint32_t rx = DEFAULT_RING_SIZE,
                                 uint32_t tx = DEFAULT_RING_SIZE) {
        return RingConfig(0, 0, rx, tx);
    }

    static RingConfig fill_completion_only(uint32_t fill = DEFAULT_RING_SIZE,
                                           uint32_t comp = DEFAULT_RING_SIZE) {
        return RingConfig(fill, comp, 0, 0);
    }
};

enum class BindMode {
    AUTO,       // let the driver choose (zero-copy if supported, else copy)
    COPY,       // XDP_COPY
    ZEROCOPY,   // XDP_ZEROCOPY, bind fails if the driver lacks support
};

/**
 * Bind options. Only the pool owner's bind carries them; sockets sharing a
 * pool inherit the owner's mode.
 */
struct BindConfig {
    BindMode mode;
    bool need_wakeup;       // XDP_USE_NEED_WAKEUP

    BindConfig()
        : mode(BindMode::AUTO)
        , need_wakeup(true)
    {}

    BindConfig(BindMode m, bool wakeup = true)
        : mode(m)
        , need_wakeup(wakeup)
    {}
};

}  // namespace afxdp::xdp
