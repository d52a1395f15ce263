// src/afxdp.hpp
// AF_XDP zero-copy core: frame pool, rings, socket binding, redirect map
//
// Header-only. Include this for the whole library, or the individual
// xdp/*.hpp headers. bpf_map_ops.hpp pulls in libbpf; the rest only needs
// the kernel uapi headers.
//
// Typical receive setup:
//   auto umem = afxdp::xdp::Umem<>::create(afxdp::xdp::UmemConfig());
//   afxdp::xdp::XskSocket<> sock;
//   sock.register_pool(umem);
//   sock.configure_rings(afxdp::xdp::RingConfig());
//   sock.bind(afxdp::xdp::device_from_name("eth0"), afxdp::xdp::QueueId(0));
//   sock.activate();
//   sock.prime_fill_ring(AFXDP_DEFAULT_RING_SIZE);

#pragma once

#include "core/lock_policy.hpp"
#include "core/log.hpp"
#include "core/xsk_error.hpp"
#include "xdp/xsk_config.hpp"
#include "xdp/xsk_desc.hpp"
#include "xdp/frame_pool.hpp"
#include "xdp/xsk_ring.hpp"
#include "xdp/xsk_kernel.hpp"
#include "xdp/umem.hpp"
#include "xdp/xsk_socket.hpp"
#include "xdp/redirect_map.hpp"
#include "xdp/bpf_map_ops.hpp"
