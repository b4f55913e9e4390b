// Tests for interop Send/Sync markers in a default build
#include <interop/interop.hpp>
#include <interop/thread.hpp>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

using namespace interop;

namespace {

struct Plain {
    int value;
};

struct Shared {
    int value;
};

struct Sink {
    template<typename A>
    void operator()(A) const {}
};

// Detects whether thread::spawn accepts Arg
template<typename Arg, typename = void>
struct spawnable : std::false_type {};

template<typename Arg>
struct spawnable<Arg, std::void_t<decltype(thread::spawn(Sink{}, std::declval<Arg>()))>>
    : std::true_type {};

}  // namespace

INTEROP_MARK_SEND(Shared)
INTEROP_MARK_SYNC(Shared)

// Primitives
static_assert(Send<int> && Sync<int>, "int should be Send + Sync");
static_assert(Send<double> && Sync<double>, "double should be Send + Sync");

// References
static_assert(Send<int&>, "int& should be Send");
static_assert(!Sync<int&>, "int& should NOT be Sync");
static_assert(Send<const int&> && Sync<const int&>, "const int& should be Send + Sync");

// Raw pointers
static_assert(!Send<int*> && !Sync<int*>, "int* should NOT be Send or Sync");
static_assert(!Send<const int*>, "const int* should NOT be Send");

// Unmarked user types
static_assert(!Send<Plain> && !Sync<Plain>, "Plain should NOT be Send or Sync");

// Marked user types
static_assert(ThreadSafe<Shared>, "Shared should be Send + Sync once marked");

#if !INTEROP_SEND_SYNC_ENABLED

static_assert(!send_sync_enabled, "default build should not assert thread safety");

// Handles never inherit thread safety from T in a default build
static_assert(!Send<Handle<int>> && !Sync<Handle<int>>, "Handle<int> should NOT be Send or Sync");
static_assert(!Send<Handle<Shared>> && !Sync<Handle<Shared>>, "Handle<Shared> should NOT be Send or Sync");
static_assert(!Send<RCHandle<int>> && !Sync<RCHandle<int>>, "RCHandle<int> should NOT be Send or Sync");
static_assert(!Send<RCHandle<Shared>>, "RCHandle<Shared> should NOT be Send");

static_assert(!spawnable<Handle<int>>::value, "spawn should reject Handle<int>");
static_assert(!spawnable<RCHandle<int>>::value, "spawn should reject RCHandle<int>");

#endif

static_assert(spawnable<int>::value, "spawn should accept int");
static_assert(!spawnable<Plain>::value, "spawn should reject Plain");

void test_spawn_send_arguments() {
    printf("test_spawn_send_arguments: ");
    auto handle = thread::spawn([](int a, int b) { return a + b; }, 20, 22);
    assert(handle.join() == 42);
    printf("PASS\n");
}

void test_spawn_marked_type() {
    printf("test_spawn_marked_type: ");
    auto handle = thread::spawn([](Shared s) { return s.value * 2; }, Shared{21});
    assert(handle.join() == 42);
    printf("PASS\n");
}

void test_join_twice_throws() {
    printf("test_join_twice_throws: ");
    auto handle = thread::spawn([](int) {}, 0);
    handle.join();
    assert(!handle.joinable());

    bool threw = false;
    try {
        handle.join();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    printf("PASS\n");
}

void test_is_finished_before_and_after_join() {
    printf("test_is_finished_before_and_after_join: ");
    std::atomic<bool> release{false};
    auto handle = thread::spawn(
        [&release](int x) {
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            return x;
        },
        7
    );

    assert(!handle.is_finished());
    release.store(true);
    assert(handle.join() == 7);

    // The result has been taken; the handle still reports completion
    assert(handle.is_finished());
    assert(handle.is_finished());
    printf("PASS\n");
}

void test_detach() {
    printf("test_detach: ");
    std::atomic<bool> release{false};
    auto handle = thread::spawn(
        [&release](int) {
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        },
        0
    );

    handle.detach();
    assert(!handle.joinable());
    assert(!handle.is_finished());

    release.store(true);
    while (!handle.is_finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    bool threw = false;
    try {
        handle.join();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    printf("PASS\n");
}

void test_detach_after_join_throws() {
    printf("test_detach_after_join_throws: ");
    auto handle = thread::spawn([](int x) { return x; }, 1);
    assert(handle.join() == 1);

    bool threw = false;
    try {
        handle.detach();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    printf("PASS\n");
}

int main() {
    printf("Running Send/Sync marker tests...\n");
    printf("=================================\n");

    test_spawn_send_arguments();
    test_spawn_marked_type();
    test_join_twice_throws();
    test_is_finished_before_and_after_join();
    test_detach();
    test_detach_after_join_throws();

    printf("\nAll Send/Sync marker tests passed!\n");
    return 0;
}
