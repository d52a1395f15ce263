// src/xdp/xsk_desc.hpp
// RX/TX ring descriptor
//
// A descriptor names a region of the UMEM by offset and length. It is a value:
// copying a descriptor does not transfer ownership of the frame it names.

#pragma once

#include <cstddef>
#include <cstdint>
#include <linux/if_xdp.h>

// Descriptor option: packet continues in the next descriptor (multi-buffer)
#ifndef XDP_PKT_CONTD
#define XDP_PKT_CONTD (1 << 0)
#endif

namespace afxdp::xdp {

/**
 * @brief RX/TX descriptor, binary compatible with struct xdp_desc
 *
 * Layout (16 bytes):
 * ┌──────────────────────┬────────────┬────────────┐
 * │ addr (u64)           │ len (u32)  │ options    │
 * └──────────────────────┴────────────┴────────────┘
 *
 * addr is an offset from the UMEM base. For received packets it points at
 * the first byte of packet data, i.e. past the kernel headroom, so it is
 * usually not frame-aligned.
 */
struct XskDesc {
    uint64_t addr;       ///< Offset of packet data within the UMEM
    uint32_t len;        ///< Packet length in bytes
    uint32_t options;    ///< XDP_PKT_CONTD and friends

    /**
     * @brief Start of the frame containing addr
     * @param frame_size UMEM chunk size (power of 2)
     */
    uint64_t frame_base(uint32_t frame_size) const {
        return addr & ~static_cast<uint64_t>(frame_size - 1);
    }

    /**
     * @brief Offset of packet data from the start of its frame
     */
    uint32_t data_offset(uint32_t frame_size) const {
        return static_cast<uint32_t>(addr & (frame_size - 1));
    }

    /**
     * @brief Point the descriptor at frame + offset, len bytes
     * @return false (descriptor unchanged) if the data would run past the frame
     */
    bool set_addr_and_length(uint64_t frame, uint32_t offset, uint32_t length,
                             uint32_t frame_size) {
        if (static_cast<uint64_t>(offset) + length > frame_size) {
            return false;
        }
        addr = (frame & ~static_cast<uint64_t>(frame_size - 1)) + offset;
        len = length;
        return true;
    }

    bool has_more_fragments() const {
        return (options & XDP_PKT_CONTD) != 0;
    }
};

static_assert(sizeof(XskDesc) == sizeof(struct xdp_desc), "XskDesc must match xdp_desc");
static_assert(offsetof(XskDesc, addr) == offsetof(struct xdp_desc, addr), "xdp_desc.addr offset");
static_assert(offsetof(XskDesc, len) == offsetof(struct xdp_desc, len), "xdp_desc.len offset");
static_assert(offsetof(XskDesc, options) == offsetof(struct xdp_desc, options), "xdp_desc.options offset");

}  // namespace afxdp::xdp
