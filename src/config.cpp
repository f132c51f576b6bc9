#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace shellhost {

nlohmann::json Config::defaults_json() {
    return {
        {"window", {
            {"width", 1400},
            {"height", 900},
            {"chrome_height", 108},
            {"panel_width", 420}
        }},
        {"tabs", {
            {"internal_scheme", "shell://"},
            {"home_url", "shell://home"}
        }},
        {"voice_agent", {
            {"program", "python3"},
            {"script", ""},
            {"working_dir", ""},
            {"restart_delay_ms", 1000},
            {"stop_timeout_ms", 1200},
            {"max_restart_attempts", 5},
            {"stable_uptime_ms", 10000},
            {"reap_interval_ms", 100},
            {"credential_env", {"GOOGLE_API_KEY", "GEMINI_API_KEY", "GOOGLE_AI_API_KEY"}}
        }},
        {"stream", {
            {"timeout_seconds", 300}
        }},
        {"verbose", false}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_int(const nlohmann::json& obj, const char* key, int& out) {
    if (obj.contains(key) && obj[key].is_number_integer())
        out = obj[key].get<int>();
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("window") && j["window"].is_object()) {
        auto& w = j["window"];
        read_int(w, "width", cfg.window.width);
        read_int(w, "height", cfg.window.height);
        read_int(w, "chrome_height", cfg.window.chrome_height);
        read_int(w, "panel_width", cfg.window.panel_width);
    }

    if (j.contains("tabs") && j["tabs"].is_object()) {
        auto& t = j["tabs"];
        read_string(t, "internal_scheme", cfg.tabs.internal_scheme);
        read_string(t, "home_url", cfg.tabs.home_url);
    }

    if (j.contains("voice_agent") && j["voice_agent"].is_object()) {
        auto& v = j["voice_agent"];
        read_string(v, "program", cfg.voice_agent.program);
        read_string(v, "script", cfg.voice_agent.script);
        read_string(v, "working_dir", cfg.voice_agent.working_dir);
        read_uint(v, "restart_delay_ms", cfg.voice_agent.restart_delay_ms);
        read_uint(v, "stop_timeout_ms", cfg.voice_agent.stop_timeout_ms);
        read_uint(v, "max_restart_attempts", cfg.voice_agent.max_restart_attempts);
        read_uint(v, "stable_uptime_ms", cfg.voice_agent.stable_uptime_ms);
        read_uint(v, "reap_interval_ms", cfg.voice_agent.reap_interval_ms);
        if (v.contains("credential_env") && v["credential_env"].is_array()) {
            cfg.voice_agent.credential_env.clear();
            for (const auto& name : v["credential_env"]) {
                if (name.is_string())
                    cfg.voice_agent.credential_env.push_back(name.get<std::string>());
            }
        }
    }

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        if (s.contains("timeout_seconds") && s["timeout_seconds"].is_number_unsigned())
            cfg.stream.timeout_seconds = s["timeout_seconds"].get<long>();
    }

    if (j.contains("verbose") && j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.shellhost/config.json");
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("SHELLHOST_AGENT_PROGRAM"))
        cfg.voice_agent.program = v;
    if (const char* v = std::getenv("SHELLHOST_AGENT_SCRIPT"))
        cfg.voice_agent.script = v;
    if (const char* v = std::getenv("SHELLHOST_AGENT_CWD"))
        cfg.voice_agent.working_dir = v;
    if (const char* v = std::getenv("SHELLHOST_VERBOSE"))
        cfg.verbose = std::string(v) == "1" || std::string(v) == "true";

    return cfg;
}

std::vector<std::string> Config::voice_agent_args() const {
    if (voice_agent.script.empty()) return {};
    return {voice_agent.script};
}

} // namespace shellhost
