#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "host_bridge.hpp"
#include "http.hpp"
#include "process_supervisor.hpp"
#include "stream_relay.hpp"
#include "surface.hpp"
#include "tab_registry.hpp"
#include <memory>

namespace shellhost {

// Owns every component for one host window. The loop, the window's engine
// and the sink belong to the caller and must outlive the host. Members are
// declared in dependency order, so destruction tears down the bridge first.
class Host {
public:
    Host(EventLoop& loop, const Config& config, std::unique_ptr<Window> window,
         std::unique_ptr<HttpClient> http, NotificationSink& sink);
    ~Host();

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    // Opens the home tab if no tab exists yet.
    void open_home_tab();

    // Abort every stream and kill the agent. Safe to call more than once.
    void shutdown();
    bool is_shut_down() const { return shut_down_; }

    EventLoop& loop() { return loop_; }
    EventBus& bus() { return bus_; }
    Window& window() { return *window_; }
    TabRegistry& tabs() { return tabs_; }
    ProcessSupervisor& agent() { return agent_; }
    StreamRelay& streams() { return streams_; }
    HostBridge& bridge() { return bridge_; }

    static TabRegistryOptions tab_options(const Config& config);
    static SupervisorOptions supervisor_options(const Config& config);
    static StartArgs agent_start_args(const Config& config);

private:
    Config config_;
    EventLoop& loop_;
    EventBus bus_;
    std::unique_ptr<Window> window_;
    std::unique_ptr<HttpClient> http_;
    TabRegistry tabs_;
    ProcessSupervisor agent_;
    StreamRelay streams_;
    HostBridge bridge_;
    bool shut_down_ = false;
};

} // namespace shellhost
