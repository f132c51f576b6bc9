#pragma once
#include "tab.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace shellhost {

// Tag-based event dispatch, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* TabsUpdated        = "TabsUpdated";
    constexpr const char* UrlChanged         = "UrlChanged";
    constexpr const char* NavigationComplete = "NavigationComplete";
    constexpr const char* NavigationError    = "NavigationError";
    constexpr const char* ExternalMode       = "ExternalMode";
    constexpr const char* AskAssistant       = "AskAssistant";
    constexpr const char* AgentStarted       = "AgentStarted";
    constexpr const char* AgentEvent         = "AgentEvent";
    constexpr const char* AgentOutput        = "AgentOutput";
    constexpr const char* AgentError         = "AgentError";
    constexpr const char* AgentStopped       = "AgentStopped";
    constexpr const char* StreamConnected    = "StreamConnected";
    constexpr const char* StreamData         = "StreamData";
    constexpr const char* StreamComplete     = "StreamComplete";
    constexpr const char* StreamError        = "StreamError";
    constexpr const char* StreamAborted      = "StreamAborted";
} // namespace event_tags

// ── Tab registry ────────────────────────────────────────────────

struct TabsUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::TabsUpdated;
    std::vector<TabSummary> tabs;

    TabsUpdatedEvent() { type_tag = TAG; }
};

struct UrlChangedEvent : Event {
    static constexpr const char* TAG = event_tags::UrlChanged;
    std::string url;

    UrlChangedEvent() { type_tag = TAG; }
};

struct NavigationCompleteEvent : Event {
    static constexpr const char* TAG = event_tags::NavigationComplete;
    std::string url;

    NavigationCompleteEvent() { type_tag = TAG; }
};

struct NavigationErrorEvent : Event {
    static constexpr const char* TAG = event_tags::NavigationError;
    int error_code = 0;
    std::string error_description;
    std::string url;

    NavigationErrorEvent() { type_tag = TAG; }
};

struct ExternalModeEvent : Event {
    static constexpr const char* TAG = event_tags::ExternalMode;
    bool enabled = false;

    ExternalModeEvent() { type_tag = TAG; }
};

struct AskAssistantEvent : Event {
    static constexpr const char* TAG = event_tags::AskAssistant;
    std::string selection_text;
    std::string source_url;

    AskAssistantEvent() { type_tag = TAG; }
};

// ── Agent process ───────────────────────────────────────────────

struct AgentStartedEvent : Event {
    static constexpr const char* TAG = event_tags::AgentStarted;
    int pid = 0;
    bool restarted = false;

    AgentStartedEvent() { type_tag = TAG; }
};

struct AgentEventEvent : Event {
    static constexpr const char* TAG = event_tags::AgentEvent;
    nlohmann::json event;

    AgentEventEvent() { type_tag = TAG; }
};

struct AgentOutputEvent : Event {
    static constexpr const char* TAG = event_tags::AgentOutput;
    std::string line;

    AgentOutputEvent() { type_tag = TAG; }
};

struct AgentErrorEvent : Event {
    static constexpr const char* TAG = event_tags::AgentError;
    std::string text;

    AgentErrorEvent() { type_tag = TAG; }
};

struct AgentStoppedEvent : Event {
    static constexpr const char* TAG = event_tags::AgentStopped;
    std::optional<int> exit_code;
    std::optional<int> signal;

    AgentStoppedEvent() { type_tag = TAG; }
};

// ── Stream relay ────────────────────────────────────────────────

struct StreamConnectedEvent : Event {
    static constexpr const char* TAG = event_tags::StreamConnected;
    std::string stream_id;

    StreamConnectedEvent() { type_tag = TAG; }
};

struct StreamDataEvent : Event {
    static constexpr const char* TAG = event_tags::StreamData;
    std::string stream_id;
    nlohmann::json data;

    StreamDataEvent() { type_tag = TAG; }
};

struct StreamCompleteEvent : Event {
    static constexpr const char* TAG = event_tags::StreamComplete;
    std::string stream_id;

    StreamCompleteEvent() { type_tag = TAG; }
};

struct StreamErrorEvent : Event {
    static constexpr const char* TAG = event_tags::StreamError;
    std::string stream_id;
    std::string code;
    std::string message;
    long status = 0;

    StreamErrorEvent() { type_tag = TAG; }
};

struct StreamAbortedEvent : Event {
    static constexpr const char* TAG = event_tags::StreamAborted;
    std::string stream_id;

    StreamAbortedEvent() { type_tag = TAG; }
};

} // namespace shellhost
