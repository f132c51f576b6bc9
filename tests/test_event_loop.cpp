#include <catch2/catch_test_macros.hpp>
#include "event_loop.hpp"
#include <thread>
#include <unistd.h>

using namespace shellhost;
using namespace std::chrono_literals;

// ── Posted tasks ────────────────────────────────────────────────

TEST_CASE("EventLoop: posted task runs on next iteration", "[event_loop]") {
    EventLoop loop;
    bool ran = false;
    loop.post([&]() { ran = true; });
    REQUIRE_FALSE(ran);
    REQUIRE(loop.run_until([&]() { return ran; }, 1000ms));
}

TEST_CASE("EventLoop: tasks posted from another thread run in order", "[event_loop]") {
    EventLoop loop;
    std::vector<int> order;

    std::thread worker([&]() {
        for (int i = 0; i < 5; i++) loop.post([&order, i]() { order.push_back(i); });
    });
    worker.join();

    REQUIRE(loop.run_until([&]() { return order.size() == 5; }, 1000ms));
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
}

// ── Timers ──────────────────────────────────────────────────────

TEST_CASE("EventLoop: timer fires after its delay", "[event_loop]") {
    EventLoop loop;
    bool fired = false;
    auto start = std::chrono::steady_clock::now();
    loop.add_timer(30ms, [&]() { fired = true; });
    REQUIRE(loop.pending_timers() == 1);

    REQUIRE(loop.run_until([&]() { return fired; }, 1000ms));
    REQUIRE(std::chrono::steady_clock::now() - start >= 30ms);
    REQUIRE(loop.pending_timers() == 0);
}

TEST_CASE("EventLoop: cancelled timer never fires", "[event_loop]") {
    EventLoop loop;
    bool fired = false;
    auto id = loop.add_timer(10ms, [&]() { fired = true; });
    REQUIRE(loop.cancel_timer(id));
    REQUIRE_FALSE(loop.cancel_timer(id));

    loop.run_until([]() { return false; }, 60ms);
    REQUIRE_FALSE(fired);
}

TEST_CASE("EventLoop: timer may cancel another due timer", "[event_loop]") {
    EventLoop loop;
    bool second_fired = false;
    EventLoop::TimerId second = 0;
    loop.add_timer(0ms, [&]() { loop.cancel_timer(second); });
    second = loop.add_timer(0ms, [&]() { second_fired = true; });

    loop.run_until([]() { return false; }, 40ms);
    REQUIRE_FALSE(second_fired);
}

// ── File descriptors ────────────────────────────────────────────

TEST_CASE("EventLoop: watched fd reports readability", "[event_loop]") {
    EventLoop loop;
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    std::string received;
    REQUIRE(loop.watch_fd(fds[0], [&](uint32_t) {
        char buf[64];
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) received.append(buf, static_cast<size_t>(n));
    }));

    REQUIRE(write(fds[1], "ping", 4) == 4);
    REQUIRE(loop.run_until([&]() { return received == "ping"; }, 1000ms));

    loop.unwatch_fd(fds[0]);
    close(fds[0]);
    close(fds[1]);
}

TEST_CASE("EventLoop: handler may unwatch its own fd", "[event_loop]") {
    EventLoop loop;
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    int calls = 0;
    loop.watch_fd(fds[0], [&](uint32_t) {
        calls++;
        loop.unwatch_fd(fds[0]);
    });

    REQUIRE(write(fds[1], "x", 1) == 1);
    loop.run_until([]() { return false; }, 50ms);
    REQUIRE(calls == 1);

    close(fds[0]);
    close(fds[1]);
}

// ── run / stop ──────────────────────────────────────────────────

TEST_CASE("EventLoop: stop posted from another thread ends run()", "[event_loop]") {
    EventLoop loop;
    std::thread stopper([&]() {
        std::this_thread::sleep_for(20ms);
        loop.post([&loop]() { loop.stop(); });
    });
    loop.run();
    stopper.join();
    SUCCEED();
}

TEST_CASE("EventLoop: run_until times out when predicate never holds", "[event_loop]") {
    EventLoop loop;
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(loop.run_until([]() { return false; }, 50ms));
    REQUIRE(std::chrono::steady_clock::now() - start >= 50ms);
}
