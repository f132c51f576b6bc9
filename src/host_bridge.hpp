#pragma once
#include "event_bus.hpp"
#include "process_supervisor.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace shellhost {

class TabRegistry;
class StreamRelay;

// Receives every push notification for the UI process.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const std::string& topic, const nlohmann::json& payload) = 0;
};

// Maps named request channels onto the components and forwards bus events
// to the sink as (topic, payload) pairs.
class HostBridge {
public:
    using Reply = std::function<void(const nlohmann::json& result)>;

    // `agent_defaults` supplies program, args and working directory for
    // voiceAgent.start; the request only contributes the credential.
    HostBridge(TabRegistry& tabs, ProcessSupervisor& agent, StreamRelay& streams,
               EventBus& bus, NotificationSink& sink, StartArgs agent_defaults);

    HostBridge(const HostBridge&) = delete;
    HostBridge& operator=(const HostBridge&) = delete;

    // `reply` runs exactly once, immediately for every channel except
    // agent.startStream, which replies when the stream ends.
    void handle(const std::string& channel, const nlohmann::json& args, Reply reply);

    bool has_channel(const std::string& channel) const;

    // Legacy names resolve to their current channel; others pass through.
    static std::string canonical_channel(const std::string& channel);

private:
    using Handler = std::function<void(const nlohmann::json& args, Reply& reply)>;

    void register_channels();
    void forward_events();

    template<typename E>
    void forward(std::function<void(const E&)> handler) {
        subscriptions_.emplace_back(bus_, subscribe<E>(bus_, std::move(handler)));
    }

    TabRegistry& tabs_;
    ProcessSupervisor& agent_;
    StreamRelay& streams_;
    EventBus& bus_;
    NotificationSink& sink_;
    StartArgs agent_defaults_;

    std::unordered_map<std::string, Handler> handlers_;
    std::vector<ScopedSubscription> subscriptions_;
};

// JSON shapes shared with the UI process.
nlohmann::json tab_summary_to_json(const TabSummary& tab);
nlohmann::json tab_context_to_json(const TabContext& ctx);

} // namespace shellhost
