#include "config.hpp"
#include "headless_window.hpp"
#include "host.hpp"
#include "http.hpp"
#include "stdio_channel.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<shellhost::EventLoop*> g_loop{nullptr};

static void signal_handler(int /*sig*/) {
    // EventLoop::stop() only stores a flag and writes the eventfd.
    if (auto* loop = g_loop.load()) loop->stop();
}

static void print_usage() {
    std::cerr << "Usage: shellhost [options]\n"
              << "\n"
              << "Runs the browser-shell host core. Requests are read from stdin and\n"
              << "responses and events are written to stdout, one JSON object per line.\n"
              << "\n"
              << "Options:\n"
              << "  --agent-script PATH  Voice agent script passed to the agent program\n"
              << "  --agent-program EXE  Voice agent interpreter (default: python3)\n"
              << "  --no-home-tab        Do not open the home tab at startup\n"
              << "  -v, --verbose        Verbose logging on stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Configuration: ~/.shellhost/config.json\n"
              << "\n"
              << "Environment variables:\n"
              << "  SHELLHOST_AGENT_PROGRAM  Overrides voice_agent.program\n"
              << "  SHELLHOST_AGENT_SCRIPT   Overrides voice_agent.script\n"
              << "  SHELLHOST_AGENT_CWD      Overrides voice_agent.working_dir\n"
              << "  SHELLHOST_VERBOSE        Set to 1 for verbose logging\n";
}

int main(int argc, char* argv[]) try {
    std::string agent_script;
    std::string agent_program;
    bool open_home = true;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--agent-script") == 0 && i + 1 < argc) {
            agent_script = argv[++i];
        } else if (std::strcmp(argv[i], "--agent-program") == 0 && i + 1 < argc) {
            agent_program = argv[++i];
        } else if (std::strcmp(argv[i], "--no-home-tab") == 0) {
            open_home = false;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    shellhost::http_init();
    auto config = shellhost::Config::load();

    // Override config with CLI args
    if (!agent_script.empty()) config.voice_agent.script = agent_script;
    if (!agent_program.empty()) config.voice_agent.program = agent_program;
    if (verbose) config.verbose = true;

    // A dead UI pipe must surface as a write error, not kill the host.
    std::signal(SIGPIPE, SIG_IGN);

    int rc = 0;
    {
        shellhost::EventLoop loop;
        shellhost::StdioChannel channel(loop, std::cout);
        auto window = std::make_unique<shellhost::HeadlessWindow>(
            loop, shellhost::Size{config.window.width, config.window.height});
        shellhost::Host host(loop, config, std::move(window),
                             std::make_unique<shellhost::CurlHttpClient>(), channel);

        if (!channel.serve(host.bridge(), [&loop]() { loop.stop(); })) {
            std::cerr << "[shellhost] stdin must be a pipe or terminal\n";
            rc = 1;
        } else {
            if (open_home) host.open_home_tab();

            g_loop.store(&loop);
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);

            std::cerr << "[shellhost] Ready.\n";
            loop.run();

            std::signal(SIGINT, SIG_DFL);
            std::signal(SIGTERM, SIG_DFL);
            g_loop.store(nullptr);
        }

        host.shutdown();
        std::cerr << "[shellhost] Shutting down.\n";
    }

    shellhost::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
