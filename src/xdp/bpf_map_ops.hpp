// src/xdp/bpf_map_ops.hpp
// libbpf-backed operations for RedirectMap
//
// The XSKMAP is created by whoever loads the redirect program. This class
// attaches to it by pinned path, by name in a loaded bpf_object, or by fd.
//
// Usage:
//   XskRedirectMap map(LibbpfMapOps::open_pinned("/sys/fs/bpf/xsks_map"));
//   map.insert(queue_id, socket.fd());

#pragma once

#include <bpf/bpf.h>
#include <bpf/libbpf.h>
#include <linux/bpf.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <unistd.h>

#include "core/log.hpp"
#include "core/xsk_error.hpp"
#include "xdp/redirect_map.hpp"

namespace afxdp::xdp {

class LibbpfMapOps {
public:
    /**
     * Wrap an XSKMAP file descriptor
     * @param owns_fd Close map_fd on destruction
     * @throws XskError(REDIRECT_MAP_FAILED) if map_fd is not an XSKMAP
     */
    explicit LibbpfMapOps(int map_fd, bool owns_fd = false)
        : map_fd_(map_fd)
        , owns_fd_(owns_fd)
    {
        struct bpf_map_info info;
        memset(&info, 0, sizeof(info));
        uint32_t info_len = sizeof(info);
        if (bpf_obj_get_info_by_fd(map_fd_, &info, &info_len) != 0) {
            int err = errno;
            close_fd();
            throw XskError(ErrorKind::REDIRECT_MAP_FAILED,
                           "bpf_obj_get_info_by_fd(" + std::to_string(map_fd) + ")", err);
        }
        if (info.type != BPF_MAP_TYPE_XSKMAP) {
            close_fd();
            throw XskError(ErrorKind::REDIRECT_MAP_FAILED,
                           std::string("Map '") + info.name + "' is not an XSKMAP", EINVAL);
        }
        max_entries_ = info.max_entries;
        AFXDP_LOG("[XSKMAP] Using map '%s' (id=%u fd=%d max_entries=%u)\n",
                  info.name, info.id, map_fd_, max_entries_);
    }

    ~LibbpfMapOps() {
        close_fd();
    }

    LibbpfMapOps(const LibbpfMapOps&) = delete;
    LibbpfMapOps& operator=(const LibbpfMapOps&) = delete;

    LibbpfMapOps(LibbpfMapOps&& other) noexcept
        : map_fd_(other.map_fd_)
        , owns_fd_(other.owns_fd_)
        , max_entries_(other.max_entries_)
    {
        other.map_fd_ = -1;
        other.owns_fd_ = false;
    }

    LibbpfMapOps& operator=(LibbpfMapOps&& other) noexcept {
        if (this != &other) {
            close_fd();
            map_fd_ = other.map_fd_;
            owns_fd_ = other.owns_fd_;
            max_entries_ = other.max_entries_;
            other.map_fd_ = -1;
            other.owns_fd_ = false;
        }
        return *this;
    }

    /**
     * Open a map pinned in bpffs
     */
    static LibbpfMapOps open_pinned(const char* path) {
        int fd = bpf_obj_get(path);
        if (fd < 0) {
            throw XskError(ErrorKind::REDIRECT_MAP_FAILED,
                           std::string("bpf_obj_get(") + path + ")", errno);
        }
        return LibbpfMapOps(fd, true);
    }

    /**
     * Find a map by name in a loaded object (the object keeps the fd)
     */
    static LibbpfMapOps from_object(struct bpf_object* obj, const char* name = "xsks_map") {
        int fd = bpf_object__find_map_fd_by_name(obj, name);
        if (fd < 0) {
            throw XskError(ErrorKind::REDIRECT_MAP_FAILED,
                           std::string("Map '") + name + "' not found in BPF object", -fd);
        }
        return LibbpfMapOps(fd, false);
    }

    int update(uint32_t key, int socket_fd, uint64_t flags) {
        int value = socket_fd;
        if (bpf_map_update_elem(map_fd_, &key, &value, flags) != 0) {
            return -errno;
        }
        return 0;
    }

    int remove(uint32_t key) {
        if (bpf_map_delete_elem(map_fd_, &key) != 0) {
            return -errno;
        }
        return 0;
    }

    uint32_t max_entries() const { return max_entries_; }
    int fd() const { return map_fd_; }

private:
    void close_fd() {
        if (owns_fd_ && map_fd_ >= 0) {
            ::close(map_fd_);
        }
        map_fd_ = -1;
        owns_fd_ = false;
    }

    int map_fd_ = -1;
    bool owns_fd_ = false;
    uint32_t max_entries_ = 0;
};

using XskRedirectMap = RedirectMap<LibbpfMapOps>;
using XskRedirectMapEntry = RedirectMapEntry<LibbpfMapOps>;

}  // namespace afxdp::xdp
