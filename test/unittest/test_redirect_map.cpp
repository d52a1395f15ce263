// test/unittest/test_redirect_map.cpp
// Unit tests for RedirectMap / RedirectMapEntry over MockMapOps

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <type_traits>
#include <utility>

#include "xdp/redirect_map.hpp"
#include "xdp/xsk_socket.hpp"
#include "xsk_mocks.hpp"

using namespace afxdp;
using namespace afxdp::xdp;
using namespace afxdp::test;

using Map = RedirectMap<MockMapOps>;
using Entry = RedirectMapEntry<MockMapOps>;
using Socket = XskSocket<MockKernel>;

// Entries point at their map
static_assert(!std::is_move_constructible<Map>::value, "RedirectMap must stay in place");
static_assert(!std::is_move_assignable<Map>::value, "RedirectMap must stay in place");

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name) \
    void name(); \
    static void run_##name() { \
        tests_run++; \
        printf("Running %s...", #name); \
        fflush(stdout); \
        name(); \
        tests_passed++; \
        printf(" ✓\n"); \
    } \
    void name()

#define ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            printf("\n  FAIL: %s (line %d)\n", message, __LINE__); \
            exit(1); \
        } \
    } while(0)

template<typename F>
static int map_errno(F fn) {
    try {
        fn();
    } catch (const XskError& e) {
        return e.kind() == ErrorKind::REDIRECT_MAP_FAILED ? e.sys_errno() : -1;
    }
    return 0;
}

// ============================================================================
// Insert / remove
// ============================================================================

TEST(test_insert_and_remove) {
    Map map{MockMapOps()};
    map.insert(0, 42);
    ASSERT(map.ops().entries.at(0) == 42, "Entry stored");

    map.remove(0);
    ASSERT(map.ops().entries.empty(), "Entry removed");
}

TEST(test_insert_idempotent) {
    Map map{MockMapOps()};
    map.insert(1, 42);
    map.insert(1, 42);
    ASSERT(map.ops().entries.size() == 1, "Inserting twice leaves one entry");
    ASSERT(map.ops().entries.at(1) == 42, "Same value");

    map.insert(1, 43);
    ASSERT(map.ops().entries.at(1) == 43, "insert replaces the socket");
}

TEST(test_remove_idempotent) {
    Map map{MockMapOps()};
    map.remove(2);
    map.insert(2, 42);
    map.remove(2);
    map.remove(2);
    ASSERT(map.ops().entries.empty(), "Removing a missing entry is not an error");
}

TEST(test_insert_new_and_replace) {
    Map map{MockMapOps()};
    ASSERT(!map.replace(0, 42), "replace needs an existing entry");
    ASSERT(map.insert_new(0, 42), "insert_new on an empty slot");
    ASSERT(!map.insert_new(0, 43), "insert_new on a used slot");
    ASSERT(map.ops().entries.at(0) == 42, "Original kept");
    ASSERT(map.replace(0, 43), "replace an existing entry");
    ASSERT(map.ops().entries.at(0) == 43, "Replaced");
}

TEST(test_index_out_of_range) {
    MockMapOps ops;
    ops.max = 2;
    Map map{ops};

    ASSERT(map.max_entries() == 2, "max_entries from the map");
    ASSERT(map_errno([&] { map.insert(2, 42); }) == E2BIG, "Index beyond max_entries");
    ASSERT(map_errno([&] { map.remove(5); }) == E2BIG, "Remove beyond max_entries");
    ASSERT(map.ops().update_calls == 0, "Rejected before reaching the map");
}

TEST(test_invalid_socket_fd) {
    Map map{MockMapOps()};
    ASSERT(map_errno([&] { map.insert(0, -1); }) == EBADF, "Negative fd rejected");
}

TEST(test_error_names_operation) {
    Map map{MockMapOps()};
    try {
        map.insert_new(9, 42);
        ASSERT(false, "insert_new beyond max_entries must throw");
    } catch (const XskError& e) {
        ASSERT(strstr(e.what(), "insert_new") != nullptr, "Message names insert_new");
    }
    try {
        map.replace(0, -1);
        ASSERT(false, "replace with a bad fd must throw");
    } catch (const XskError& e) {
        ASSERT(strstr(e.what(), "replace") != nullptr, "Message names replace");
        ASSERT(e.sys_errno() == EBADF, "EBADF for a bad fd");
    }
}

TEST(test_map_errors_propagate) {
    Map map{MockMapOps()};
    map.ops().fail_errno = EPERM;
    ASSERT(map_errno([&] { map.insert(0, 42); }) == EPERM, "Insert failure reported with errno");
    ASSERT(map_errno([&] { map.remove(0); }) == EPERM, "Remove failure reported with errno");
}

// ============================================================================
// Scoped entry
// ============================================================================

TEST(test_scoped_entry) {
    Map map{MockMapOps()};
    {
        Entry entry(map, 3, 42);
        ASSERT(entry.active(), "Entry active");
        ASSERT(map.ops().entries.at(3) == 42, "Inserted on construction");

        Entry moved(std::move(entry));
        ASSERT(!entry.active(), "Moved-from entry inactive");
        ASSERT(moved.queue_index() == 3, "Index carried over");
    }
    ASSERT(map.ops().entries.empty(), "Removed on destruction");
    ASSERT(map.ops().remove_calls == 1, "Removed exactly once");
}

TEST(test_scoped_entry_remove_failure) {
    Map map{MockMapOps()};
    {
        Entry entry(map, 0, 42);
        map.ops().fail_errno = EPERM;
    }
    ASSERT(map.ops().remove_calls == 1, "Destructor tried once and did not throw");
}

// ============================================================================
// Kernel headers
// ============================================================================

TEST(test_headroom_matches_kernel_header) {
    // linux/bpf.h (pulled in by the map) and the library config coexist
    ASSERT(DRIVER_HEADROOM == XDP_PACKET_HEADROOM, "Driver headroom matches the uapi value");
}

// ============================================================================
// Ordering relative to bind
// ============================================================================

TEST(test_insert_before_bind) {
    MockKernel kernel;
    Map map{MockMapOps()};
    auto umem = Socket::UmemType::create(UmemConfig(2048, 64));

    Socket s(kernel);
    map.insert(1, s.fd());
    ASSERT(map.ops().entries.at(1) == s.fd(), "Unbound socket accepted");

    s.register_pool(umem);
    s.configure_rings(RingConfig(64, 64, 64, 64));
    s.bind(DeviceId(1), QueueId(1));
    ASSERT(s.is_bound(), "Bind unaffected by the map entry");
    ASSERT(map.ops().entries.at(1) == s.fd(), "Entry still present");
}

TEST(test_insert_after_bind) {
    MockKernel kernel;
    Map map{MockMapOps()};
    auto umem = Socket::UmemType::create(UmemConfig(2048, 64));

    Socket s(kernel);
    s.register_pool(umem);
    s.configure_rings(RingConfig(64, 64, 64, 64));
    s.bind(DeviceId(1), QueueId(1));
    s.activate();

    Entry entry(map, s.queue().value, s.fd());
    ASSERT(map.ops().entries.at(1) == s.fd(), "Bound socket inserted at its queue");
}

int main() {
    printf("╔════════════════════════════════════════════════════════════════════╗\n");
    printf("║                    Redirect Map Tests                              ║\n");
    printf("╚════════════════════════════════════════════════════════════════════╝\n\n");

    printf("Insert / remove:\n");
    run_test_insert_and_remove();
    run_test_insert_idempotent();
    run_test_remove_idempotent();
    run_test_insert_new_and_replace();
    run_test_index_out_of_range();
    run_test_invalid_socket_fd();
    run_test_error_names_operation();
    run_test_map_errors_propagate();
    printf("\n");

    printf("Scoped entry:\n");
    run_test_scoped_entry();
    run_test_scoped_entry_remove_failure();
    printf("\n");

    printf("Kernel headers:\n");
    run_test_headroom_matches_kernel_header();
    printf("\n");

    printf("Ordering relative to bind:\n");
    run_test_insert_before_bind();
    run_test_insert_after_bind();
    printf("\n");

    printf("╔════════════════════════════════════════════════════════════════════╗\n");
    printf("║                      ALL TESTS PASSED ✅                           ║\n");
    printf("║                                                                    ║\n");
    printf("║  Total: %2d/%2d tests passed                                       ║\n", tests_passed, tests_run);
    printf("╚════════════════════════════════════════════════════════════════════╝\n");

    return 0;
}
