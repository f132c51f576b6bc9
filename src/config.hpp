#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace shellhost {

struct WindowConfig {
    int width = 1400;
    int height = 900;
    int chrome_height = 108; // toolbar + tab strip
    int panel_width = 420;   // assistant side panel
};

struct TabsConfig {
    std::string internal_scheme = "shell://";
    std::string home_url = "shell://home";
};

struct VoiceAgentConfig {
    std::string program = "python3";
    std::string script;            // empty = run program without a script argument
    std::string working_dir;       // empty = inherit
    uint32_t restart_delay_ms = 1000;
    uint32_t stop_timeout_ms = 1200;
    uint32_t max_restart_attempts = 5; // consecutive; 0 = unlimited
    uint32_t stable_uptime_ms = 10000; // a run this long resets the restart count
    uint32_t reap_interval_ms = 100;
    std::vector<std::string> credential_env = {
        "GOOGLE_API_KEY", "GEMINI_API_KEY", "GOOGLE_AI_API_KEY"};
};

struct StreamConfig {
    long timeout_seconds = 300;
};

struct Config {
    WindowConfig window;
    TabsConfig tabs;
    VoiceAgentConfig voice_agent;
    StreamConfig stream;
    bool verbose = false;

    // Load from ~/.shellhost/config.json + env vars. Never writes the file.
    static Config load();

    // Build from an already-parsed document (missing keys keep defaults).
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Program arguments for the voice agent (script path if configured)
    std::vector<std::string> voice_agent_args() const;
};

} // namespace shellhost
