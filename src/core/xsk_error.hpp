// core/xsk_error.hpp
// Error reporting for the AF_XDP core
//
// Setup and configuration failures throw XskError (a std::runtime_error that
// also carries an ErrorKind, the errno the kernel returned and, for rejected
// binds, the binding rule that was violated).
//
// Hot-path conditions (pool exhausted, ring full/empty, socket not bound) are
// NOT exceptions: they are reported as short counts or sentinel values with
// errno set, the same way the transport layer reports them.
//
// Frame conservation violations (a frame released twice, a frame handed to
// the kernel twice) are programming errors and terminate the process via
// AFXDP_FATAL.

#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace afxdp {

enum class ErrorKind {
    INVALID_FRAME_SIZE,          // frame size not a power of two or below the minimum
    INVALID_COUNT,               // zero frame count
    POOL_EXHAUSTED,              // not enough free frames for a setup request
    POOL_ALREADY_REGISTERED,     // socket already has a pool, or pool has an owner
    INVALID_RING_SIZE,           // ring capacity not a power of two
    BIND_REJECTED,               // see BindRule
    ALREADY_BOUND,
    UMEM_REGISTRATION_FAILED,    // kernel refused XDP_UMEM_REG
    INVALID_STATE,               // operation not valid in the socket's current state
    NOT_BOUND,                   // ring access before bind
    SYSTEM_ERROR,                // socket(), mmap() or getsockopt() failure
    REDIRECT_MAP_FAILED,
};

// Which kernel binding rule a rejected bind violated
enum class BindRule {
    NONE,
    NO_RX_OR_TX_RING,                      // socket has neither RX nor TX
    OWNER_MISSING_FILL_COMPLETION,         // pool owner without its own Fill/Completion
    SHARED_POOL_MISSING_FILL_COMPLETION,   // shared pool on a new device/queue without Fill/Completion
    SHARED_QUEUE_OWN_FILL_COMPLETION,      // shared pool on an existing device/queue with its own Fill/Completion
    OWNER_NOT_BOUND,                       // pool owner not bound (or closed)
    KERNEL_REJECTED,                       // kernel refused for another reason, see sys_errno()
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_FRAME_SIZE:       return "InvalidFrameSize";
        case ErrorKind::INVALID_COUNT:            return "InvalidCount";
        case ErrorKind::POOL_EXHAUSTED:           return "PoolExhausted";
        case ErrorKind::POOL_ALREADY_REGISTERED:  return "PoolAlreadyRegistered";
        case ErrorKind::INVALID_RING_SIZE:        return "InvalidRingSize";
        case ErrorKind::BIND_REJECTED:            return "BindRejected";
        case ErrorKind::ALREADY_BOUND:            return "AlreadyBound";
        case ErrorKind::UMEM_REGISTRATION_FAILED: return "UmemRegistrationFailed";
        case ErrorKind::INVALID_STATE:            return "InvalidState";
        case ErrorKind::NOT_BOUND:                return "NotBound";
        case ErrorKind::SYSTEM_ERROR:             return "SystemError";
        case ErrorKind::REDIRECT_MAP_FAILED:      return "RedirectMapFailed";
    }
    return "Unknown";
}

inline const char* bind_rule_name(BindRule rule) {
    switch (rule) {
        case BindRule::NONE:                                return "none";
        case BindRule::NO_RX_OR_TX_RING:                    return "socket needs an RX or TX ring";
        case BindRule::OWNER_MISSING_FILL_COMPLETION:       return "pool owner needs Fill and Completion rings";
        case BindRule::SHARED_POOL_MISSING_FILL_COMPLETION: return "shared pool on a different device/queue needs its own Fill and Completion rings";
        case BindRule::SHARED_QUEUE_OWN_FILL_COMPLETION:    return "shared pool on the same device/queue must not have its own Fill or Completion ring";
        case BindRule::OWNER_NOT_BOUND:                     return "pool owner is not bound";
        case BindRule::KERNEL_REJECTED:                     return "kernel rejected bind";
    }
    return "unknown";
}

class XskError : public std::runtime_error {
public:
    XskError(ErrorKind kind, const std::string& what, int sys_errno = 0,
             BindRule rule = BindRule::NONE)
        : std::runtime_error(format(kind, what, sys_errno))
        , kind_(kind)
        , errno_(sys_errno)
        , rule_(rule)
    {}

    ErrorKind kind() const noexcept { return kind_; }
    int sys_errno() const noexcept { return errno_; }
    BindRule rule() const noexcept { return rule_; }

private:
    static std::string format(ErrorKind kind, const std::string& what, int sys_errno) {
        std::string msg = std::string(error_kind_name(kind)) + ": " + what;
        if (sys_errno != 0) {
            msg += " (";
            msg += strerror(sys_errno);
            msg += ")";
        }
        return msg;
    }

    ErrorKind kind_;
    int errno_;
    BindRule rule_;
};

}  // namespace afxdp

// Unrecoverable invariant violation: report and abort
#define AFXDP_FATAL(...)                                                    \
    do {                                                                    \
        fprintf(stderr, "[FATAL] %s:%d: ", __FILE__, __LINE__);             \
        fprintf(stderr, __VA_ARGS__);                                       \
        fprintf(stderr, "\n");                                              \
        fflush(stderr);                                                     \
        std::abort();                                                       \
    } while (0)
