#include <catch2/catch_test_macros.hpp>
#include "headless_window.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "tab_registry.hpp"

using namespace shellhost;
using namespace std::chrono_literals;

namespace {

void drain(EventLoop& loop) {
    loop.run_until([]() { return false; }, 20ms);
}

} // namespace

// ── HeadlessSurface ─────────────────────────────────────────────

TEST_CASE("HeadlessSurface: load reports navigation on a later iteration", "[headless]") {
    EventLoop loop;
    HeadlessSurface surface(loop);
    std::vector<std::string> seen;

    SurfaceEvents events;
    events.navigated = [&](const std::string& url) { seen.push_back("nav:" + url); };
    events.title_changed = [&](const std::string& title) { seen.push_back("title:" + title); };
    events.load_finished = [&]() { seen.push_back("finished"); };
    surface.set_events(events);

    surface.load_url("https://example.com");
    REQUIRE(surface.url() == "https://example.com");
    REQUIRE(seen.empty());

    drain(loop);
    REQUIRE(seen == std::vector<std::string>{
        "nav:https://example.com", "title:https://example.com", "finished"});
}

TEST_CASE("HeadlessSurface: history", "[headless]") {
    EventLoop loop;
    HeadlessSurface surface(loop);
    REQUIRE_FALSE(surface.can_go_back());

    surface.load_url("https://a.test");
    surface.load_url("https://b.test");
    REQUIRE(surface.can_go_back());
    REQUIRE_FALSE(surface.can_go_forward());

    surface.go_back();
    REQUIRE(surface.url() == "https://a.test");
    REQUIRE(surface.can_go_forward());

    surface.load_url("https://c.test"); // drops the forward entry
    REQUIRE_FALSE(surface.can_go_forward());
    surface.go_back();
    REQUIRE(surface.url() == "https://a.test");
}

TEST_CASE("HeadlessSurface: nothing fires after close or destruction", "[headless]") {
    EventLoop loop;
    int fired = 0;
    SurfaceEvents events;
    events.load_finished = [&]() { fired++; };

    {
        HeadlessSurface closed(loop);
        closed.set_events(events);
        closed.load_url("https://a.test");
        closed.close();
        REQUIRE(closed.closed());
        closed.load_url("https://b.test");
        REQUIRE(closed.url() == "https://a.test");
        drain(loop);
    }

    {
        auto doomed = std::make_unique<HeadlessSurface>(loop);
        doomed->set_events(events);
        doomed->load_url("https://a.test");
        doomed.reset();
    }
    drain(loop);
    REQUIRE(fired == 0);
}

TEST_CASE("HeadlessSurface: captures are unavailable", "[headless]") {
    EventLoop loop;
    HeadlessSurface surface(loop);
    REQUIRE_FALSE(surface.capture_document().has_value());
    REQUIRE_FALSE(surface.capture_png().has_value());
    REQUIRE(surface.cookies("https://a.test")->empty());
}

// ── HeadlessWindow ──────────────────────────────────────────────

TEST_CASE("HeadlessWindow: attach bookkeeping", "[headless]") {
    EventLoop loop;
    HeadlessWindow window(loop, Size{800, 600});
    auto surface = window.create_surface();
    REQUIRE(surface != nullptr);

    REQUIRE_FALSE(window.is_attached(*surface));
    window.attach(*surface);
    REQUIRE(window.is_attached(*surface));
    window.detach(*surface);
    REQUIRE_FALSE(window.is_attached(*surface));

    window.resize(Size{1024, 768});
    REQUIRE(window.content_size().width == 1024);
}

TEST_CASE("HeadlessWindow: drives a tab registry end to end", "[headless]") {
    EventLoop loop;
    EventBus bus;
    HeadlessWindow window(loop, Size{1400, 900});
    TabRegistry tabs(window, bus);
    std::vector<std::string> completed;
    subscribe<NavigationCompleteEvent>(bus, [&](const NavigationCompleteEvent& ev) {
        completed.push_back(ev.url);
    });

    tabs.create(std::string("t1"), "example.com");
    drain(loop);

    REQUIRE(completed == std::vector<std::string>{"https://example.com"});
    const Tab* tab = tabs.find("t1");
    REQUIRE(tab->title == "https://example.com");
    REQUIRE(window.is_attached(*tab->surface));

    tabs.navigate_active("other.test");
    drain(loop);
    REQUIRE(tabs.can_go_back());
    REQUIRE(tabs.go_back());
    drain(loop);
    REQUIRE(tabs.active_url() == "https://example.com");
}
