#include "host.hpp"
#include <iostream>

namespace shellhost {

TabRegistryOptions Host::tab_options(const Config& config) {
    TabRegistryOptions options;
    options.chrome_height = config.window.chrome_height;
    options.panel_width = config.window.panel_width;
    options.internal_scheme = config.tabs.internal_scheme;
    options.home_url = config.tabs.home_url;
    return options;
}

SupervisorOptions Host::supervisor_options(const Config& config) {
    const auto& va = config.voice_agent;
    SupervisorOptions options;
    options.restart_delay = std::chrono::milliseconds(va.restart_delay_ms);
    options.stop_timeout = std::chrono::milliseconds(va.stop_timeout_ms);
    options.reap_interval = std::chrono::milliseconds(va.reap_interval_ms);
    options.max_restart_attempts = va.max_restart_attempts;
    options.stable_uptime = std::chrono::milliseconds(va.stable_uptime_ms);
    options.credential_env = va.credential_env;
    return options;
}

StartArgs Host::agent_start_args(const Config& config) {
    StartArgs args;
    args.program = config.voice_agent.program;
    args.args = config.voice_agent_args();
    args.working_dir = config.voice_agent.working_dir;
    return args;
}

Host::Host(EventLoop& loop, const Config& config, std::unique_ptr<Window> window,
           std::unique_ptr<HttpClient> http, NotificationSink& sink)
    : config_(config),
      loop_(loop),
      window_(std::move(window)),
      http_(std::move(http)),
      tabs_(*window_, bus_, tab_options(config_)),
      agent_(loop_, bus_, supervisor_options(config_)),
      streams_(loop_, bus_, *http_, config_.stream.timeout_seconds),
      bridge_(tabs_, agent_, streams_, bus_, sink, agent_start_args(config_))
{}

Host::~Host() {
    shutdown();
}

void Host::open_home_tab() {
    if (tabs_.size() == 0) tabs_.create(std::nullopt, config_.tabs.home_url);
}

void Host::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;
    if (config_.verbose) {
        std::cerr << "[shellhost] Shutting down: " << streams_.active_count()
                  << " stream(s), agent " << agent_state_name(agent_.state()) << "\n";
    }
    streams_.abort_all();
    agent_.shutdown();
}

} // namespace shellhost
