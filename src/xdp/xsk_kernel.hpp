// src/xdp/xsk_kernel.hpp
// Thin syscall layer for AF_XDP sockets
//
// XskSocket is templated on this policy so the binding state machine can be
// unit tested against a mock kernel (test/unittest/xsk_mocks.hpp).
// Compile-time policy, no virtual functions.
//
// Every function returns 0 (or a non-negative value) on success and -errno on
// failure. map_ring() returns nullptr with errno set.
//
// Required methods for a kernel policy:
//   int   open_socket();
//   int   close_socket(int fd);
//   int   register_umem(int fd, const xdp_umem_reg& reg);
//   int   set_ring_size(int fd, int optname, uint32_t size);
//   int   mmap_offsets(int fd, xdp_mmap_offsets* off);
//   void* map_ring(int fd, size_t len, uint64_t pgoff);
//   int   unmap_ring(void* addr, size_t len);
//   int   bind(int fd, const sockaddr_xdp& sxdp);
//   int   wakeup_tx(int fd);
//   int   wakeup_rx(int fd);
//   int   statistics(int fd, xdp_statistics* stats);
//   int   options(int fd, xdp_options* opts);

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <linux/if_xdp.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <unistd.h>

#ifndef AF_XDP
#define AF_XDP 44
#endif

#ifndef SOL_XDP
#define SOL_XDP 283
#endif

namespace afxdp::xdp {

struct LinuxKernel {
    static LinuxKernel& instance() {
        static LinuxKernel kernel;
        return kernel;
    }

    int open_socket() {
        int fd = ::socket(AF_XDP, SOCK_RAW | SOCK_CLOEXEC, 0);
        return fd < 0 ? -errno : fd;
    }

    int close_socket(int fd) {
        return ::close(fd) < 0 ? -errno : 0;
    }

    int register_umem(int fd, const struct xdp_umem_reg& reg) {
        if (setsockopt(fd, SOL_XDP, XDP_UMEM_REG, &reg, sizeof(reg)) < 0) {
            return -errno;
        }
        return 0;
    }

    // optname: XDP_UMEM_FILL_RING, XDP_UMEM_COMPLETION_RING, XDP_RX_RING, XDP_TX_RING
    int set_ring_size(int fd, int optname, uint32_t size) {
        if (setsockopt(fd, SOL_XDP, optname, &size, sizeof(size)) < 0) {
            return -errno;
        }
        return 0;
    }

    int mmap_offsets(int fd, struct xdp_mmap_offsets* off) {
        socklen_t optlen = sizeof(*off);
        if (getsockopt(fd, SOL_XDP, XDP_MMAP_OFFSETS, off, &optlen) < 0) {
            return -errno;
        }
        return 0;
    }

    void* map_ring(int fd, size_t len, uint64_t pgoff) {
        void* map = mmap(nullptr, len, PROT_READ | PROT_WRITE,
                         MAP_SHARED | MAP_POPULATE, fd, static_cast<off_t>(pgoff));
        return map == MAP_FAILED ? nullptr : map;
    }

    int unmap_ring(void* addr, size_t len) {
        return munmap(addr, len) < 0 ? -errno : 0;
    }

    int bind(int fd, const struct sockaddr_xdp& sxdp) {
        if (::bind(fd, reinterpret_cast<const struct sockaddr*>(&sxdp), sizeof(sxdp)) < 0) {
            return -errno;
        }
        return 0;
    }

    // Kick the kernel to process the TX ring
    int wakeup_tx(int fd) {
        if (sendto(fd, nullptr, 0, MSG_DONTWAIT, nullptr, 0) < 0) {
            return -errno;
        }
        return 0;
    }

    // Kick the kernel to refill from the Fill ring / deliver to RX
    int wakeup_rx(int fd) {
        if (recvfrom(fd, nullptr, 0, MSG_DONTWAIT, nullptr, nullptr) < 0) {
            return -errno;
        }
        return 0;
    }

    int statistics(int fd, struct xdp_statistics* stats) {
        socklen_t optlen = sizeof(*stats);
        memset(stats, 0, sizeof(*stats));
        if (getsockopt(fd, SOL_XDP, XDP_STATISTICS, stats, &optlen) < 0) {
            return -errno;
        }
        return 0;
    }

    int options(int fd, struct xdp_options* opts) {
        socklen_t optlen = sizeof(*opts);
        memset(opts, 0, sizeof(*opts));
        if (getsockopt(fd, SOL_XDP, XDP_OPTIONS, opts, &optlen) < 0) {
            return -errno;
        }
        return 0;
    }
};

}  // namespace afxdp::xdp
