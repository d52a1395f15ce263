// src/xdp/redirect_map.hpp
// Queue index -> AF_XDP socket redirect map (XSKMAP)
//
// The in-kernel redirect program looks up the receive queue index in this map
// and redirects the packet to the socket stored there. Loading and attaching
// that program is outside this library; it only inserts and removes entries.
//
// Ordering with respect to bind() is the caller's choice: inserting a socket
// that is not bound yet is accepted, packets redirected to it before it binds
// are dropped by the kernel.
//
// RedirectMap is templated on the map operations (compile-time policy):
//   int      update(uint32_t key, int fd, uint64_t flags);  // 0 or -errno
//   int      remove(uint32_t key);                          // 0 or -errno
//   uint32_t max_entries() const;
// LibbpfMapOps (bpf_map_ops.hpp) implements them on a real map.

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <linux/bpf.h>

#include "core/log.hpp"
#include "core/xsk_error.hpp"

namespace afxdp::xdp {

template<typename MapOps>
class RedirectMap {
public:
    explicit RedirectMap(MapOps ops) : ops_(std::move(ops)) {}

    RedirectMap(const RedirectMap&) = delete;
    RedirectMap& operator=(const RedirectMap&) = delete;
    // Not movable: RedirectMapEntry keeps a pointer to the map
    RedirectMap(RedirectMap&&) = delete;
    RedirectMap& operator=(RedirectMap&&) = delete;

    /**
     * Map queue_index to socket_fd, replacing any previous entry. Idempotent.
     * @throws XskError(REDIRECT_MAP_FAILED)
     */
    void insert(uint32_t queue_index, int socket_fd) {
        check("insert", queue_index, socket_fd);
        int ret = ops_.update(queue_index, socket_fd, BPF_ANY);
        if (ret < 0) {
            fail("insert", queue_index, -ret);
        }
        DEBUG_PRINT("[XSKMAP] queue %u -> fd %d\n", queue_index, socket_fd);
    }

    /**
     * Insert only if queue_index has no entry
     * @return false if an entry already exists
     * @throws XskError(REDIRECT_MAP_FAILED) on other errors
     */
    bool insert_new(uint32_t queue_index, int socket_fd) {
        check("insert_new", queue_index, socket_fd);
        int ret = ops_.update(queue_index, socket_fd, BPF_NOEXIST);
        if (ret == -EEXIST) {
            return false;
        }
        if (ret < 0) {
            fail("insert_new", queue_index, -ret);
        }
        return true;
    }

    /**
     * Replace an existing entry
     * @return false if queue_index has no entry
     */
    bool replace(uint32_t queue_index, int socket_fd) {
        check("replace", queue_index, socket_fd);
        int ret = ops_.update(queue_index, socket_fd, BPF_EXIST);
        if (ret == -ENOENT) {
            return false;
        }
        if (ret < 0) {
            fail("replace", queue_index, -ret);
        }
        return true;
    }

    /**
     * Remove the entry for queue_index. A missing entry is not an error.
     * @throws XskError(REDIRECT_MAP_FAILED)
     */
    void remove(uint32_t queue_index) {
        if (queue_index >= ops_.max_entries()) {
            fail("remove", queue_index, E2BIG);
        }
        int ret = ops_.remove(queue_index);
        if (ret < 0 && ret != -ENOENT) {
            fail("remove", queue_index, -ret);
        }
        DEBUG_PRINT("[XSKMAP] queue %u removed\n", queue_index);
    }

    uint32_t max_entries() const { return ops_.max_entries(); }

    MapOps& ops() { return ops_; }
    const MapOps& ops() const { return ops_; }

private:
    void check(const char* op, uint32_t queue_index, int socket_fd) const {
        if (queue_index >= ops_.max_entries()) {
            fail(op, queue_index, E2BIG);
        }
        if (socket_fd < 0) {
            fail(op, queue_index, EBADF);
        }
    }

    [[noreturn]] void fail(const char* op, uint32_t queue_index, int err) const {
        throw XskError(ErrorKind::REDIRECT_MAP_FAILED,
                       std::string("Redirect map ") + op + " queue " + std::to_string(queue_index) +
                       " (max_entries " + std::to_string(ops_.max_entries()) + ")", err);
    }

    MapOps ops_;
};

/**
 * Scoped redirect map entry: inserted on construction, removed on destruction
 */
template<typename MapOps>
class RedirectMapEntry {
public:
    RedirectMapEntry(RedirectMap<MapOps>& map, uint32_t queue_index, int socket_fd)
        : map_(&map)
        , queue_index_(queue_index)
    {
        map_->insert(queue_index, socket_fd);
    }

    ~RedirectMapEntry() {
        reset();
    }

    RedirectMapEntry(const RedirectMapEntry&) = delete;
    RedirectMapEntry& operator=(const RedirectMapEntry&) = delete;

    RedirectMapEntry(RedirectMapEntry&& other) noexcept
        : map_(other.map_)
        , queue_index_(other.queue_index_)
    {
        other.map_ = nullptr;
    }

    /**
     * Remove the entry now
     */
    void reset() {
        if (map_ == nullptr) {
            return;
        }
        RedirectMap<MapOps>* map = map_;
        map_ = nullptr;
        try {
            map->remove(queue_index_);
        } catch (const XskError& e) {
            AFXDP_WARN("[XSKMAP] Failed to remove queue %u: %s\n", queue_index_, e.what());
        }
    }

    uint32_t queue_index() const { return queue_index_; }
    bool active() const { return map_ != nullptr; }

private:
    RedirectMap<MapOps>* map_;
    uint32_t queue_index_;
};

}  // namespace afxdp::xdp
