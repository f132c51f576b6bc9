#include "process_supervisor.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace shellhost {

const char* agent_state_name(AgentState state) {
    switch (state) {
        case AgentState::Idle:       return "idle";
        case AgentState::Starting:   return "starting";
        case AgentState::Running:    return "running";
        case AgentState::Stopping:   return "stopping";
        case AgentState::Stopped:    return "stopped";
        case AgentState::Crashed:    return "crashed";
        case AgentState::Restarting: return "restarting";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(EventLoop& loop, EventBus& bus, SupervisorOptions options)
    : loop_(loop), bus_(bus), options_(std::move(options))
{}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

std::optional<int> ProcessSupervisor::pid() const {
    if (!handle_) return std::nullopt;
    return static_cast<int>(handle_->pid);
}

StartResult ProcessSupervisor::start(const StartArgs& args) {
    if (handle_) {
        return StartResult{true, static_cast<int>(handle_->pid), {}};
    }
    if (shutting_down_) {
        return StartResult{false, std::nullopt, "Host is shutting down"};
    }

    stop_requested_ = false;
    restart_attempts_ = 0;
    cancel_timer(restart_timer_);
    last_start_args_ = args;
    return spawn(args, false);
}

std::vector<std::string> ProcessSupervisor::build_environment(const StartArgs& args) const {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        if (args.credential) {
            std::string key = entry.substr(0, entry.find('='));
            bool aliased = false;
            for (const auto& alias : options_.credential_env) {
                if (key == alias) { aliased = true; break; }
            }
            if (aliased) continue;
        }
        env.push_back(std::move(entry));
    }
    if (args.credential) {
        for (const auto& alias : options_.credential_env) {
            env.push_back(alias + "=" + *args.credential);
        }
    }
    return env;
}

StartResult ProcessSupervisor::spawn(const StartArgs& args, bool restarted) {
    state_ = AgentState::Starting;

    // Everything the child needs is built before fork(): the host has
    // worker threads, so the child may only make async-signal-safe calls.
    std::vector<std::string> argv_store;
    argv_store.push_back(args.program);
    argv_store.insert(argv_store.end(), args.args.begin(), args.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_store) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    std::vector<std::string> env_store = build_environment(args);
    std::vector<char*> envp;
    for (auto& e : env_store) envp.push_back(&e[0]);
    envp.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    int status_pipe[2]; // reports exec failure; closed by a successful exec

    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        state_ = AgentState::Crashed;
        return StartResult{false, std::nullopt, "Failed to create pipes"};
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        state_ = AgentState::Crashed;
        return StartResult{false, std::nullopt, "Failed to create pipes"};
    }
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        state_ = AgentState::Crashed;
        return StartResult{false, std::nullopt, "Failed to create pipes"};
    }

    pid_t pid = fork();
    if (pid < 0) {
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1],
                       status_pipe[0], status_pipe[1]}) {
            close(fd);
        }
        state_ = AgentState::Crashed;
        return StartResult{false, std::nullopt, "Failed to fork process"};
    }

    if (pid == 0) {
        // Child: detach from the controlling terminal
        setsid();
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        if (!args.working_dir.empty() && chdir(args.working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t n = write(status_pipe[1], &err, sizeof(err));
            (void)n;
            _exit(127);
        }
        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t n = write(status_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        state_ = AgentState::Crashed;
        std::string error = "Failed to start " + args.program + ": " + std::strerror(child_errno);
        std::cerr << "[voice-agent] " << error << "\n";
        return StartResult{false, std::nullopt, error};
    }

    fcntl(stdout_pipe[0], F_SETFL, fcntl(stdout_pipe[0], F_GETFL) | O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, fcntl(stderr_pipe[0], F_GETFL) | O_NONBLOCK);

    handle_ = Handle{pid, stdout_pipe[0], stderr_pipe[0], std::chrono::steady_clock::now()};
    stdout_buffer_.clear();
    ++spawn_count_;
    state_ = AgentState::Running;

    loop_.watch_fd(stdout_pipe[0], [this](uint32_t) { read_stdout(); });
    loop_.watch_fd(stderr_pipe[0], [this](uint32_t) { read_stderr(); });
    arm_reap_timer();

    std::cerr << "[voice-agent] Started " << args.program << " (pid " << pid << ")"
              << (restarted ? " after unexpected exit" : "") << "\n";

    AgentStartedEvent ev;
    ev.pid = static_cast<int>(pid);
    ev.restarted = restarted;
    bus_.publish(ev);

    return StartResult{true, static_cast<int>(pid), {}};
}

// ── Output framing ──────────────────────────────────────────────

void ProcessSupervisor::read_stdout() {
    if (!handle_ || handle_->stdout_fd < 0) return;
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = read(handle_->stdout_fd, buffer.data(), buffer.size());
        if (n > 0) {
            stdout_buffer_.append(buffer.data(), static_cast<size_t>(n),
                [this](const std::string& line) {
                    handle_stdout_line(line);
                    return true;
                });
            // A handler may have torn the handle down.
            if (!handle_) return;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) {
            // EOF: stop watching; the reap check notices the exit.
            loop_.unwatch_fd(handle_->stdout_fd);
        }
        return;
    }
}

void ProcessSupervisor::read_stderr() {
    if (!handle_ || handle_->stderr_fd < 0) return;
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = read(handle_->stderr_fd, buffer.data(), buffer.size());
        if (n > 0) {
            std::string text(buffer.data(), static_cast<size_t>(n));
            std::cerr << "[voice-agent] stderr: " << text;
            if (text.back() != '\n') std::cerr << "\n";
            AgentErrorEvent ev;
            ev.text = std::move(text);
            bus_.publish(ev);
            if (!handle_) return;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) {
            loop_.unwatch_fd(handle_->stderr_fd);
        }
        return;
    }
}

void ProcessSupervisor::handle_stdout_line(const std::string& raw_line) {
    std::string line = trim(raw_line);
    if (line.empty()) return;

    try {
        AgentEventEvent ev;
        ev.event = nlohmann::json::parse(line);
        bus_.publish(ev);
        return;
    } catch (const nlohmann::json::exception&) {
        // Plain log output
    }

    AgentOutputEvent ev;
    ev.line = raw_line;
    bus_.publish(ev);
}

// ── Exit handling ───────────────────────────────────────────────

void ProcessSupervisor::arm_reap_timer() {
    reap_timer_ = loop_.add_timer(options_.reap_interval, [this]() {
        reap_timer_.reset();
        check_exit();
    });
}

void ProcessSupervisor::check_exit() {
    if (!handle_) return;
    int status = 0;
    pid_t result = waitpid(handle_->pid, &status, WNOHANG);
    if (result == 0) {
        arm_reap_timer();
        return;
    }
    if (result < 0) {
        // ECHILD: somebody else reaped it; treat as a signal-less exit.
        status = 0;
    }
    on_exited(status);
}

void ProcessSupervisor::stop(StopCallback done) {
    stop(options_.stop_timeout, std::move(done));
}

void ProcessSupervisor::stop(std::chrono::milliseconds timeout, StopCallback done) {
    // No restart may follow an explicit stop, even one that lands between
    // a crash and its scheduled restart.
    stop_requested_ = true;
    cancel_timer(restart_timer_);

    if (!handle_) {
        if (done) done(false);
        return;
    }

    if (done) pending_stops_.push_back(std::move(done));
    if (state_ == AgentState::Stopping) return; // already racing SIGTERM vs. timeout

    state_ = AgentState::Stopping;
    if (kill(handle_->pid, SIGTERM) != 0) {
        std::cerr << "[voice-agent] SIGTERM failed: " << std::strerror(errno) << "\n";
    }
    kill_timer_ = loop_.add_timer(timeout, [this]() {
        kill_timer_.reset();
        force_kill();
    });
}

void ProcessSupervisor::force_kill() {
    if (!handle_) return;
    std::cerr << "[voice-agent] pid " << handle_->pid << " ignored SIGTERM, sending SIGKILL\n";
    kill_and_reap();
}

void ProcessSupervisor::shutdown() {
    shutting_down_ = true;
    cancel_timer(restart_timer_);
    if (handle_) kill_and_reap();
}

void ProcessSupervisor::kill_and_reap() {
    pid_t pid = handle_->pid;
    kill(pid, SIGKILL);
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    on_exited(result == pid ? status : 0);
}

void ProcessSupervisor::release_handle() {
    if (!handle_) return;
    cancel_timer(reap_timer_);
    cancel_timer(kill_timer_);
    loop_.unwatch_fd(handle_->stdout_fd);
    loop_.unwatch_fd(handle_->stderr_fd);
    close(handle_->stdout_fd);
    close(handle_->stderr_fd);
    handle_.reset();
    stdout_buffer_.clear();
}

void ProcessSupervisor::on_exited(int status) {
    if (!handle_) return;

    // Flush whatever the process wrote before it died.
    read_stdout();
    read_stderr();
    if (!handle_) return;

    auto uptime = std::chrono::steady_clock::now() - handle_->started_at;

    AgentStoppedEvent ev;
    if (WIFEXITED(status)) ev.exit_code = WEXITSTATUS(status);
    if (WIFSIGNALED(status)) ev.signal = WTERMSIG(status);

    std::cerr << "[voice-agent] Process exited with code "
              << (ev.exit_code ? std::to_string(*ev.exit_code) : "null")
              << ", signal " << (ev.signal ? std::to_string(*ev.signal) : "null") << "\n";

    release_handle();

    bool intentional = stop_requested_ || shutting_down_;
    state_ = intentional ? AgentState::Stopped : AgentState::Crashed;

    bus_.publish(ev);

    auto stops = std::move(pending_stops_);
    pending_stops_.clear();
    for (auto& done : stops) done(true);

    if (intentional) return;
    if (uptime >= options_.stable_uptime && restart_attempts_ > 0) {
        std::cerr << "[voice-agent] Ran "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(uptime).count()
                  << " ms before exiting; restart count reset\n";
        restart_attempts_ = 0;
    }
    schedule_restart();
}

void ProcessSupervisor::schedule_restart() {
    if (!last_start_args_ || shutting_down_ || stop_requested_) return;

    if (options_.max_restart_attempts > 0 &&
        restart_attempts_ >= options_.max_restart_attempts) {
        std::cerr << "[voice-agent] Giving up after " << restart_attempts_
                  << " restart attempts\n";
        AgentErrorEvent ev;
        ev.text = "Agent restart limit reached";
        bus_.publish(ev);
        return;
    }

    ++restart_attempts_;
    state_ = AgentState::Restarting;
    std::cerr << "[voice-agent] Restarting in " << options_.restart_delay.count()
              << " ms (attempt " << restart_attempts_ << ")\n";

    restart_timer_ = loop_.add_timer(options_.restart_delay, [this]() {
        restart_timer_.reset();
        if (handle_ || shutting_down_ || stop_requested_ || !last_start_args_) return;
        StartResult result = spawn(*last_start_args_, true);
        if (!result.success) {
            AgentErrorEvent ev;
            ev.text = result.error;
            bus_.publish(ev);
            schedule_restart();
        }
    });
}

void ProcessSupervisor::cancel_timer(std::optional<EventLoop::TimerId>& timer) {
    if (!timer) return;
    loop_.cancel_timer(*timer);
    timer.reset();
}

} // namespace shellhost
