#include <catch2/catch_test_macros.hpp>
#include "process_supervisor.hpp"
#include "event_bus.hpp"
#include <csignal>
#include <sys/types.h>

using namespace shellhost;
using namespace std::chrono_literals;

namespace {

struct AgentRecorder {
    std::vector<AgentStartedEvent> started;
    std::vector<nlohmann::json> events;
    std::vector<std::string> output;
    std::vector<std::string> errors;
    std::vector<AgentStoppedEvent> stopped;
    std::vector<ScopedSubscription> subs;

    explicit AgentRecorder(EventBus& bus) {
        subs.emplace_back(bus, subscribe<AgentStartedEvent>(bus,
            [this](const AgentStartedEvent& e) { started.push_back(e); }));
        subs.emplace_back(bus, subscribe<AgentEventEvent>(bus,
            [this](const AgentEventEvent& e) { events.push_back(e.event); }));
        subs.emplace_back(bus, subscribe<AgentOutputEvent>(bus,
            [this](const AgentOutputEvent& e) { output.push_back(e.line); }));
        subs.emplace_back(bus, subscribe<AgentErrorEvent>(bus,
            [this](const AgentErrorEvent& e) { errors.push_back(e.text); }));
        subs.emplace_back(bus, subscribe<AgentStoppedEvent>(bus,
            [this](const AgentStoppedEvent& e) { stopped.push_back(e); }));
    }

    bool saw_error(const std::string& needle) const {
        for (const auto& e : errors) {
            if (e.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

SupervisorOptions fast_options() {
    SupervisorOptions options;
    options.restart_delay = 50ms;
    options.stop_timeout = 500ms;
    options.reap_interval = 10ms;
    return options;
}

StartArgs shell(const std::string& script) {
    StartArgs args;
    args.program = "/bin/sh";
    args.args = {"-c", script};
    return args;
}

struct Fixture {
    EventLoop loop;
    EventBus bus;
    AgentRecorder rec{bus};
    ProcessSupervisor agent;

    explicit Fixture(SupervisorOptions options = fast_options())
        : agent(loop, bus, std::move(options)) {}

    bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 3000ms) {
        return loop.run_until(pred, timeout);
    }

    void idle(std::chrono::milliseconds d) {
        loop.run_until([]() { return false; }, d);
    }
};

} // namespace

// ── start ───────────────────────────────────────────────────────

TEST_CASE("ProcessSupervisor: start spawns and reports the pid", "[supervisor]") {
    Fixture f;
    auto result = f.agent.start(shell("exec sleep 5"));

    REQUIRE(result.success);
    REQUIRE(result.pid.has_value());
    REQUIRE(f.agent.running());
    REQUIRE(f.agent.pid() == result.pid);
    REQUIRE(f.agent.state() == AgentState::Running);
    REQUIRE(f.rec.started.size() == 1);
    REQUIRE(f.rec.started[0].pid == *result.pid);
    REQUIRE_FALSE(f.rec.started[0].restarted);
}

TEST_CASE("ProcessSupervisor: start while live is idempotent", "[supervisor]") {
    Fixture f;
    auto first = f.agent.start(shell("exec sleep 5"));
    auto second = f.agent.start(shell("exec sleep 5"));

    REQUIRE(second.success);
    REQUIRE(second.pid == first.pid);
    REQUIRE(f.agent.spawn_count() == 1);
    REQUIRE(f.rec.started.size() == 1);
}

TEST_CASE("ProcessSupervisor: missing program fails to start", "[supervisor]") {
    Fixture f;
    StartArgs args;
    args.program = "/nonexistent/voice-agent";
    auto result = f.agent.start(args);

    REQUIRE_FALSE(result.success);
    REQUIRE_FALSE(result.pid.has_value());
    REQUIRE(result.error.find("/nonexistent/voice-agent") != std::string::npos);
    REQUIRE_FALSE(f.agent.running());
    REQUIRE(f.agent.spawn_count() == 0);
    REQUIRE_FALSE(f.agent.restart_pending());
}

TEST_CASE("ProcessSupervisor: bad working directory fails to start", "[supervisor]") {
    Fixture f;
    auto args = shell("exit 0");
    args.working_dir = "/nonexistent/dir";
    auto result = f.agent.start(args);
    REQUIRE_FALSE(result.success);
    REQUIRE_FALSE(f.agent.running());
}

// ── Output framing ──────────────────────────────────────────────

TEST_CASE("ProcessSupervisor: JSON lines become events, others output", "[supervisor]") {
    Fixture f;
    f.agent.start(shell(
        "echo '{\"type\":\"ready\",\"n\":1}'; echo 'plain log'; echo '[1,2]'; "
        "echo '\"listening\"'; echo '   '; echo '{broken'; exec sleep 5"));

    REQUIRE(f.wait_for([&]() { return f.rec.output.size() >= 2; }));
    REQUIRE(f.rec.events.size() == 3);
    REQUIRE(f.rec.events[0]["type"] == "ready");
    REQUIRE(f.rec.events[0]["n"] == 1);
    REQUIRE(f.rec.events[1] == nlohmann::json::array({1, 2}));
    REQUIRE(f.rec.events[2] == "listening");
    REQUIRE(f.rec.output == std::vector<std::string>{"plain log", "{broken"});
}

TEST_CASE("ProcessSupervisor: stderr is forwarded verbatim", "[supervisor]") {
    Fixture f;
    f.agent.start(shell("echo 'model load failed' >&2; exec sleep 5"));

    REQUIRE(f.wait_for([&]() { return f.rec.saw_error("model load failed"); }));
    REQUIRE(f.rec.events.empty());
}

TEST_CASE("ProcessSupervisor: output written just before exit is delivered", "[supervisor]") {
    Fixture f;
    f.agent.start(shell("echo '{\"type\":\"bye\"}'; printf 'no newline'; exit 0"));

    REQUIRE(f.wait_for([&]() { return !f.rec.stopped.empty(); }));
    REQUIRE(f.rec.events.size() == 1);
    REQUIRE(f.rec.events[0]["type"] == "bye");
    REQUIRE(f.rec.stopped[0].exit_code == std::optional<int>(0));
}

TEST_CASE("ProcessSupervisor: credential exported under every alias", "[supervisor]") {
    Fixture f;
    auto args = shell("echo \"$GOOGLE_API_KEY|$GEMINI_API_KEY|$GOOGLE_AI_API_KEY\"; exec sleep 5");
    args.credential = "key-123";
    f.agent.start(args);

    REQUIRE(f.wait_for([&]() { return !f.rec.output.empty(); }));
    REQUIRE(f.rec.output[0] == "key-123|key-123|key-123");
}

TEST_CASE("ProcessSupervisor: working directory is applied", "[supervisor]") {
    Fixture f;
    auto args = shell("cd -P . && pwd; exec sleep 5");
    args.working_dir = "/";
    f.agent.start(args);

    REQUIRE(f.wait_for([&]() { return !f.rec.output.empty(); }));
    REQUIRE(f.rec.output[0] == "/");
}

// ── Restart policy ──────────────────────────────────────────────

TEST_CASE("ProcessSupervisor: crash triggers exactly one restart", "[supervisor]") {
    Fixture f;
    auto first = f.agent.start(shell("exec sleep 5"));
    REQUIRE(first.success);

    // Out-of-band kill simulates a crash
    REQUIRE(kill(static_cast<pid_t>(*first.pid), SIGKILL) == 0);

    REQUIRE(f.wait_for([&]() { return f.agent.spawn_count() == 2; }));
    REQUIRE(f.rec.stopped.size() == 1);
    REQUIRE(f.rec.stopped[0].signal == std::optional<int>(SIGKILL));
    REQUIRE(f.rec.started.size() == 2);
    REQUIRE(f.rec.started[1].restarted);
    REQUIRE(f.agent.pid() != first.pid);
    REQUIRE(f.agent.restart_attempts() == 1);

    f.idle(300ms);
    REQUIRE(f.agent.spawn_count() == 2);
    REQUIRE(f.agent.state() == AgentState::Running);
}

TEST_CASE("ProcessSupervisor: explicit stop suppresses restart", "[supervisor]") {
    Fixture f;
    f.agent.start(shell("exec sleep 5"));

    std::optional<bool> stopped;
    f.agent.stop([&](bool ok) { stopped = ok; });
    REQUIRE(f.agent.state() == AgentState::Stopping);

    REQUIRE(f.wait_for([&]() { return stopped.has_value(); }));
    REQUIRE(*stopped);
    REQUIRE_FALSE(f.agent.running());
    REQUIRE(f.agent.state() == AgentState::Stopped);
    REQUIRE(f.rec.stopped.size() == 1);
    REQUIRE(f.rec.stopped[0].signal == std::optional<int>(SIGTERM));

    f.idle(300ms);
    REQUIRE(f.agent.spawn_count() == 1);
    REQUIRE_FALSE(f.agent.restart_pending());
}

TEST_CASE("ProcessSupervisor: stop escalates to SIGKILL after the timeout", "[supervisor]") {
    auto options = fast_options();
    options.stop_timeout = 150ms;
    Fixture f(options);
    f.agent.start(shell("trap '' TERM; echo armed; while :; do sleep 0.05; done"));
    REQUIRE(f.wait_for([&]() { return !f.rec.output.empty(); }));

    auto begin = std::chrono::steady_clock::now();
    std::optional<bool> stopped;
    f.agent.stop([&](bool ok) { stopped = ok; });

    REQUIRE(f.wait_for([&]() { return stopped.has_value(); }));
    REQUIRE(*stopped);
    REQUIRE(std::chrono::steady_clock::now() - begin >= 150ms);
    REQUIRE(f.rec.stopped.back().signal == std::optional<int>(SIGKILL));
    REQUIRE(f.agent.spawn_count() == 1);
}

TEST_CASE("ProcessSupervisor: stop with nothing running reports false", "[supervisor]") {
    Fixture f;
    std::optional<bool> stopped;
    f.agent.stop([&](bool ok) { stopped = ok; });
    REQUIRE(stopped == std::optional<bool>(false));
}

TEST_CASE("ProcessSupervisor: concurrent stops all resolve once", "[supervisor]") {
    Fixture f;
    f.agent.start(shell("exec sleep 5"));

    int first = 0;
    int second = 0;
    f.agent.stop([&](bool ok) { if (ok) first++; });
    f.agent.stop([&](bool ok) { if (ok) second++; });

    REQUIRE(f.wait_for([&]() { return first + second == 2; }));
    f.idle(50ms);
    REQUIRE(first == 1);
    REQUIRE(second == 1);
}

TEST_CASE("ProcessSupervisor: stop during the restart delay cancels it", "[supervisor]") {
    auto options = fast_options();
    options.restart_delay = 300ms;
    Fixture f(options);
    f.agent.start(shell("exit 1"));

    REQUIRE(f.wait_for([&]() { return f.agent.restart_pending(); }));
    REQUIRE(f.rec.stopped[0].exit_code == std::optional<int>(1));
    REQUIRE(f.agent.state() == AgentState::Restarting);

    std::optional<bool> stopped;
    f.agent.stop([&](bool ok) { stopped = ok; });
    REQUIRE(stopped == std::optional<bool>(false));
    REQUIRE_FALSE(f.agent.restart_pending());

    f.idle(450ms);
    REQUIRE(f.agent.spawn_count() == 1);
}

TEST_CASE("ProcessSupervisor: restarts stop at the configured cap", "[supervisor]") {
    auto options = fast_options();
    options.restart_delay = 20ms;
    options.max_restart_attempts = 2;
    Fixture f(options);
    f.agent.start(shell("exit 3"));

    REQUIRE(f.wait_for([&]() { return f.rec.saw_error("restart limit"); }));
    REQUIRE(f.agent.spawn_count() == 3);
    REQUIRE(f.rec.stopped.size() == 3);
    REQUIRE(f.agent.state() == AgentState::Crashed);
    REQUIRE_FALSE(f.agent.restart_pending());

    // An explicit start resets the budget
    auto again = f.agent.start(shell("exec sleep 5"));
    REQUIRE(again.success);
    REQUIRE(f.agent.restart_attempts() == 0);
}

TEST_CASE("ProcessSupervisor: a healthy run resets the restart count", "[supervisor]") {
    auto options = fast_options();
    options.restart_delay = 20ms;
    options.max_restart_attempts = 2;
    options.stable_uptime = 200ms;
    Fixture f(options);
    REQUIRE(f.agent.start(shell("exec sleep 30")).success);

    for (uint32_t crash = 1; crash <= 3; ++crash) {
        f.idle(400ms);
        auto pid = f.agent.pid();
        REQUIRE(pid.has_value());
        REQUIRE(kill(static_cast<pid_t>(*pid), SIGKILL) == 0);
        REQUIRE(f.wait_for([&]() { return f.agent.spawn_count() == crash + 1; }));
        REQUIRE(f.agent.running());
        REQUIRE(f.agent.restart_attempts() == 1);
    }

    REQUIRE_FALSE(f.rec.saw_error("restart limit"));
    REQUIRE(f.agent.state() == AgentState::Running);
}

// ── shutdown ────────────────────────────────────────────────────

TEST_CASE("ProcessSupervisor: shutdown kills synchronously and blocks restarts", "[supervisor]") {
    Fixture f;
    f.agent.start(shell("exec sleep 5"));

    f.agent.shutdown();
    REQUIRE_FALSE(f.agent.running());
    REQUIRE(f.agent.state() == AgentState::Stopped);
    REQUIRE(f.rec.stopped.size() == 1);

    auto result = f.agent.start(shell("exec sleep 5"));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == "Host is shutting down");

    f.idle(200ms);
    REQUIRE(f.agent.spawn_count() == 1);
}

TEST_CASE("agent_state_name: names every state", "[supervisor]") {
    REQUIRE(std::string(agent_state_name(AgentState::Idle)) == "idle");
    REQUIRE(std::string(agent_state_name(AgentState::Running)) == "running");
    REQUIRE(std::string(agent_state_name(AgentState::Crashed)) == "crashed");
    REQUIRE(std::string(agent_state_name(AgentState::Restarting)) == "restarting");
}
