#pragma once
#include "event_loop.hpp"
#include "line_buffer.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace shellhost {

class EventBus;

struct StartArgs {
    std::string program;
    std::vector<std::string> args;
    std::string working_dir;               // empty = inherit
    std::optional<std::string> credential; // exported under every alias
};

struct StartResult {
    bool success = false;
    std::optional<int> pid;
    std::string error;
};

enum class AgentState { Idle, Starting, Running, Stopping, Stopped, Crashed, Restarting };

const char* agent_state_name(AgentState state);

struct SupervisorOptions {
    std::chrono::milliseconds restart_delay{1000};
    std::chrono::milliseconds stop_timeout{1200};
    std::chrono::milliseconds reap_interval{100};
    uint32_t max_restart_attempts = 5; // consecutive automatic restarts; 0 = unlimited
    // A process that ran at least this long before exiting starts a new
    // run of consecutive restarts.
    std::chrono::milliseconds stable_uptime{10000};
    std::vector<std::string> credential_env = {
        "GOOGLE_API_KEY", "GEMINI_API_KEY", "GOOGLE_AI_API_KEY"};
};

// Owns the single external agent process: spawns it, frames its stdout into
// AgentEvent/AgentOutput events, forwards stderr as AgentError, and restarts
// it after an unexpected exit. An explicit stop() or shutdown() is the only
// thing that suppresses the restart.
class ProcessSupervisor {
public:
    using StopCallback = std::function<void(bool stopped)>;

    ProcessSupervisor(EventLoop& loop, EventBus& bus, SupervisorOptions options = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Idempotent while a process is live: returns the existing pid.
    StartResult start(const StartArgs& args);

    // SIGTERM, then SIGKILL once the timeout expires. `done` runs exactly
    // once: false immediately when nothing is live, true once the process
    // is gone.
    void stop(StopCallback done);
    void stop(std::chrono::milliseconds timeout, StopCallback done);

    // Host exit: kill and reap synchronously, never restart again.
    void shutdown();

    bool running() const { return handle_.has_value(); }
    std::optional<int> pid() const;
    AgentState state() const { return state_; }
    bool restart_pending() const { return restart_timer_.has_value(); }
    uint32_t spawn_count() const { return spawn_count_; }
    uint32_t restart_attempts() const { return restart_attempts_; }

private:
    struct Handle {
        pid_t pid = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
        std::chrono::steady_clock::time_point started_at;
    };

    StartResult spawn(const StartArgs& args, bool restarted);
    std::vector<std::string> build_environment(const StartArgs& args) const;

    void read_stdout();
    void read_stderr();
    void handle_stdout_line(const std::string& line);

    void arm_reap_timer();
    void check_exit();
    void force_kill();
    void kill_and_reap();
    void on_exited(int status);
    void release_handle();

    void schedule_restart();
    void cancel_timer(std::optional<EventLoop::TimerId>& timer);

    EventLoop& loop_;
    EventBus& bus_;
    SupervisorOptions options_;

    std::optional<Handle> handle_;
    LineBuffer stdout_buffer_;
    bool stop_requested_ = false;
    bool shutting_down_ = false;
    std::optional<StartArgs> last_start_args_;
    AgentState state_ = AgentState::Idle;

    uint32_t restart_attempts_ = 0;
    uint32_t spawn_count_ = 0;

    std::optional<EventLoop::TimerId> reap_timer_;
    std::optional<EventLoop::TimerId> restart_timer_;
    std::optional<EventLoop::TimerId> kill_timer_;
    std::vector<StopCallback> pending_stops_;
};

} // namespace shellhost
