#include "host_bridge.hpp"
#include "event.hpp"
#include "stream_relay.hpp"
#include "tab_registry.hpp"
#include <csignal>
#include <iostream>
#include <memory>

namespace shellhost {

namespace {

using json = nlohmann::json;

// Channel arguments arrive either as an object or positionally
// (a bare value for the first argument, or an array).
std::optional<json> arg(const json& args, const char* key, size_t index) {
    if (args.is_object()) {
        auto it = args.find(key);
        if (it != args.end() && !it->is_null()) return *it;
        return std::nullopt;
    }
    if (args.is_array()) {
        if (index < args.size() && !args[index].is_null()) return args[index];
        return std::nullopt;
    }
    if (index == 0 && !args.is_null()) return args;
    return std::nullopt;
}

std::optional<std::string> string_arg(const json& args, const char* key, size_t index = 0) {
    auto value = arg(args, key, index);
    if (!value || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

json failure(const std::string& error) {
    return json{{"success", false}, {"error", error}};
}

json success() {
    return json{{"success", true}};
}

std::string signal_name(int sig) {
    switch (sig) {
        case SIGTERM: return "SIGTERM";
        case SIGKILL: return "SIGKILL";
        case SIGINT:  return "SIGINT";
        case SIGHUP:  return "SIGHUP";
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        default:      return "SIG" + std::to_string(sig);
    }
}

HttpRequest parse_stream_request(const json& j) {
    HttpRequest request;
    request.url = j.value("url", "");
    request.method = j.value("method", "POST");
    if (j.contains("headers") && j["headers"].is_object()) {
        for (auto it = j["headers"].begin(); it != j["headers"].end(); ++it) {
            if (it.value().is_string()) {
                request.headers.emplace_back(it.key(), it.value().get<std::string>());
            }
        }
    }
    if (j.contains("body") && !j["body"].is_null()) {
        request.body = j["body"].is_string() ? j["body"].get<std::string>() : j["body"].dump();
    }
    return request;
}

} // namespace

json tab_summary_to_json(const TabSummary& tab) {
    json j = {{"id", tab.id}, {"url", tab.url}, {"title", tab.title},
              {"isActive", tab.is_active}};
    if (tab.favicon) j["favicon"] = *tab.favicon;
    return j;
}

json tab_context_to_json(const TabContext& ctx) {
    json j = {{"id", ctx.id}, {"url", ctx.url}, {"title", ctx.title},
              {"isExternal", ctx.is_external}};
    if (ctx.favicon) j["favicon"] = *ctx.favicon;

    if (ctx.dom) {
        json metas = json::array();
        for (const auto& meta : ctx.dom->metas) {
            metas.push_back({{"name", meta.name}, {"content", meta.content}});
        }
        j["dom"] = {{"html", ctx.dom->html},
                    {"text", ctx.dom->text},
                    {"metas", metas},
                    {"localStorage", ctx.dom->local_storage},
                    {"sessionStorage", ctx.dom->session_storage}};
    }

    if (ctx.cookies) {
        json cookies = json::array();
        for (const auto& c : *ctx.cookies) {
            cookies.push_back({{"name", c.name}, {"value", c.value},
                               {"domain", c.domain}, {"path", c.path},
                               {"secure", c.secure}, {"httpOnly", c.http_only}});
        }
        j["cookies"] = cookies;
    }

    if (ctx.screenshot) j["screenshot"] = *ctx.screenshot;
    return j;
}

HostBridge::HostBridge(TabRegistry& tabs, ProcessSupervisor& agent, StreamRelay& streams,
                       EventBus& bus, NotificationSink& sink, StartArgs agent_defaults)
    : tabs_(tabs), agent_(agent), streams_(streams), bus_(bus), sink_(sink),
      agent_defaults_(std::move(agent_defaults))
{
    register_channels();
    forward_events();
}

std::string HostBridge::canonical_channel(const std::string& channel) {
    static const std::unordered_map<std::string, std::string> legacy = {
        {"create-tab",  "tabs.create"},
        {"close-tab",   "tabs.close"},
        {"switch-tab",  "tabs.switch"},
        {"navigate",    "browser.navigate"},
        {"go-back",     "browser.goBack"},
        {"go-forward",  "browser.goForward"},
        {"reload",      "browser.reload"},
    };
    auto it = legacy.find(channel);
    return it != legacy.end() ? it->second : channel;
}

bool HostBridge::has_channel(const std::string& channel) const {
    return handlers_.count(canonical_channel(channel)) > 0;
}

void HostBridge::handle(const std::string& channel, const json& args, Reply reply) {
    // Guard so a handler that throws after replying cannot reply twice.
    auto replied = std::make_shared<bool>(false);
    Reply once = [replied, reply = std::move(reply)](const json& result) {
        if (*replied) return;
        *replied = true;
        if (reply) reply(result);
    };

    auto it = handlers_.find(canonical_channel(channel));
    if (it == handlers_.end()) {
        std::cerr << "[bridge] Unknown channel: " << channel << "\n";
        once(failure("Unknown channel: " + channel));
        return;
    }

    try {
        it->second(args, once);
    } catch (const std::exception& e) {
        std::cerr << "[bridge] " << channel << " failed: " << e.what() << "\n";
        once(failure(e.what()));
    }
}

// ── Request channels ────────────────────────────────────────────

void HostBridge::register_channels() {
    // Tabs

    handlers_["tabs.create"] = [this](const json& args, Reply& reply) {
        std::string url = string_arg(args, "url", 0).value_or("");
        auto client_id = string_arg(args, "clientId", 1);
        const Tab& tab = tabs_.create(client_id, url);
        reply(json{{"tabId", tab.id}, {"url", tab.url}});
    };

    handlers_["tabs.close"] = [this](const json& args, Reply& reply) {
        auto id = string_arg(args, "tabId");
        reply(json{{"success", id && tabs_.close(*id)}});
    };

    handlers_["tabs.switch"] = [this](const json& args, Reply& reply) {
        auto id = string_arg(args, "tabId");
        reply(json{{"success", id && tabs_.switch_to(*id)}});
    };

    handlers_["tabs.list"] = [this](const json&, Reply& reply) {
        json out = json::array();
        for (const auto& tab : tabs_.list()) out.push_back(tab_summary_to_json(tab));
        reply(out);
    };

    handlers_["tabs.getContext"] = [this](const json& args, Reply& reply) {
        auto id = string_arg(args, "tabId");
        auto ctx = id ? tabs_.get_context(*id) : std::nullopt;
        if (!ctx) {
            reply(failure("Tab not found"));
            return;
        }
        reply(json{{"success", true}, {"context", tab_context_to_json(*ctx)}});
    };

    // Browser

    handlers_["browser.navigate"] = [this](const json& args, Reply& reply) {
        auto url = string_arg(args, "url");
        if (!url) {
            reply(failure("Missing url"));
            return;
        }
        NavigateResult r = tabs_.navigate_active(*url);
        reply(json{{"success", r.success}, {"isExternal", r.is_external}, {"url", r.url}});
    };

    handlers_["browser.search"] = [this](const json& args, Reply& reply) {
        std::string query = string_arg(args, "query").value_or("");
        NavigateResult r = tabs_.search(query);
        if (!r.success) {
            reply(failure("Empty search query"));
            return;
        }
        reply(json{{"success", true}, {"url", r.url}, {"isExternal", false}});
    };

    handlers_["browser.goBack"] = [this](const json&, Reply& reply) {
        reply(tabs_.go_back() ? success() : failure("Cannot go back"));
    };

    handlers_["browser.goForward"] = [this](const json&, Reply& reply) {
        reply(tabs_.go_forward() ? success() : failure("Cannot go forward"));
    };

    handlers_["browser.reload"] = [this](const json&, Reply& reply) {
        reply(tabs_.reload() ? success() : failure("Reload failed"));
    };

    handlers_["browser.getUrl"] = [this](const json&, Reply& reply) {
        reply(json(tabs_.active_url()));
    };

    handlers_["browser.canGoBack"] = [this](const json&, Reply& reply) {
        reply(json(tabs_.can_go_back()));
    };

    handlers_["browser.canGoForward"] = [this](const json&, Reply& reply) {
        reply(json(tabs_.can_go_forward()));
    };

    handlers_["browser.setPanelOpen"] = [this](const json& args, Reply& reply) {
        auto open = arg(args, "isOpen", 0);
        tabs_.set_panel_open(open && open->is_boolean() && open->get<bool>());
        reply(success());
    };

    handlers_["window.resized"] = [this](const json&, Reply& reply) {
        tabs_.on_window_resized();
        reply(success());
    };

    // Voice agent

    handlers_["voiceAgent.start"] = [this](const json& args, Reply& reply) {
        StartArgs start = agent_defaults_;
        auto credential = string_arg(args, "credential");
        if (credential && !credential->empty()) start.credential = *credential;

        StartResult r = agent_.start(start);
        if (!r.success) {
            reply(failure(r.error));
            return;
        }
        json out = success();
        if (r.pid) out["pid"] = *r.pid;
        reply(out);
    };

    handlers_["voiceAgent.stop"] = [this](const json&, Reply& reply) {
        Reply deferred = reply;
        agent_.stop([deferred](bool stopped) {
            deferred(stopped ? success() : failure("No active voice agent process"));
        });
    };

    // Streams

    handlers_["agent.startStream"] = [this](const json& args, Reply& reply) {
        auto stream_id = string_arg(args, "streamId", 0);
        auto request = arg(args, "request", 1);
        if (!stream_id || !request || !request->is_object()) {
            reply(failure("Missing streamId or request"));
            return;
        }
        HttpRequest http_request = parse_stream_request(*request);
        if (http_request.url.empty()) {
            reply(failure("Missing request url"));
            return;
        }
        Reply deferred = reply;
        streams_.open(*stream_id, std::move(http_request), [deferred](bool ok) {
            deferred(json{{"success", ok}});
        });
    };

    handlers_["agent.abortStream"] = [this](const json& args, Reply& reply) {
        auto stream_id = string_arg(args, "streamId");
        reply(stream_id && streams_.abort(*stream_id) ? success()
                                                       : failure("Stream not found"));
    };

    handlers_["agent.abortAllStreams"] = [this](const json&, Reply& reply) {
        streams_.abort_all();
        reply(success());
    };
}

// ── Push notifications ──────────────────────────────────────────

void HostBridge::forward_events() {
    forward<TabsUpdatedEvent>([this](const TabsUpdatedEvent& ev) {
        json tabs = json::array();
        for (const auto& tab : ev.tabs) tabs.push_back(tab_summary_to_json(tab));
        sink_.notify("tabs.updated", tabs);
    });

    forward<UrlChangedEvent>([this](const UrlChangedEvent& ev) {
        sink_.notify("browser.urlChanged", ev.url);
    });

    forward<NavigationCompleteEvent>([this](const NavigationCompleteEvent& ev) {
        sink_.notify("browser.navigationComplete", ev.url);
    });

    forward<NavigationErrorEvent>([this](const NavigationErrorEvent& ev) {
        sink_.notify("browser.navigationError",
                     json{{"errorCode", ev.error_code},
                          {"errorDescription", ev.error_description},
                          {"url", ev.url}});
    });

    forward<ExternalModeEvent>([this](const ExternalModeEvent& ev) {
        sink_.notify("browser.externalMode", ev.enabled);
    });

    forward<AskAssistantEvent>([this](const AskAssistantEvent& ev) {
        sink_.notify("agent.askAssistant",
                     json{{"selectionText", ev.selection_text}, {"sourceUrl", ev.source_url}});
    });

    forward<AgentStartedEvent>([this](const AgentStartedEvent& ev) {
        sink_.notify("voiceAgent.started", json{{"pid", ev.pid}, {"restarted", ev.restarted}});
    });

    forward<AgentEventEvent>([this](const AgentEventEvent& ev) {
        sink_.notify("voiceAgent.event", ev.event);
    });

    forward<AgentOutputEvent>([this](const AgentOutputEvent& ev) {
        sink_.notify("voiceAgent.output", ev.line);
    });

    forward<AgentErrorEvent>([this](const AgentErrorEvent& ev) {
        sink_.notify("voiceAgent.error", ev.text);
    });

    forward<AgentStoppedEvent>([this](const AgentStoppedEvent& ev) {
        json payload = {{"code", nullptr}, {"signal", nullptr}};
        if (ev.exit_code) payload["code"] = *ev.exit_code;
        if (ev.signal) payload["signal"] = signal_name(*ev.signal);
        sink_.notify("voiceAgent.stopped", payload);
    });

    forward<StreamConnectedEvent>([this](const StreamConnectedEvent& ev) {
        sink_.notify("agent.streamConnected", json{{"streamId", ev.stream_id}});
    });

    forward<StreamDataEvent>([this](const StreamDataEvent& ev) {
        sink_.notify("agent.streamEvent", json{{"streamId", ev.stream_id}, {"data", ev.data}});
    });

    forward<StreamCompleteEvent>([this](const StreamCompleteEvent& ev) {
        sink_.notify("agent.streamComplete", json{{"streamId", ev.stream_id}});
    });

    forward<StreamErrorEvent>([this](const StreamErrorEvent& ev) {
        sink_.notify("agent.streamError",
                     json{{"streamId", ev.stream_id},
                          {"error", {{"code", ev.code},
                                     {"message", ev.message},
                                     {"status", ev.status}}}});
    });

    forward<StreamAbortedEvent>([this](const StreamAbortedEvent& ev) {
        sink_.notify("agent.streamAborted", json{{"streamId", ev.stream_id}});
    });
}

} // namespace shellhost
