#include "stdio_channel.hpp"
#include "event_loop.hpp"
#include "util.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

namespace shellhost {

StdioChannel::StdioChannel(EventLoop& loop, std::ostream& out, int in_fd)
    : loop_(loop), out_(out), in_fd_(in_fd)
{}

StdioChannel::~StdioChannel() {
    if (watching_) loop_.unwatch_fd(in_fd_);
}

void StdioChannel::notify(const std::string& topic, const nlohmann::json& payload) {
    write(nlohmann::json{{"type", "event"}, {"topic", topic}, {"payload", payload}});
}

bool StdioChannel::serve(HostBridge& bridge, std::function<void()> on_eof) {
    bridge_ = &bridge;
    on_eof_ = std::move(on_eof);

    int flags = fcntl(in_fd_, F_GETFL, 0);
    if (flags < 0 || fcntl(in_fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
        std::cerr << "[stdio] Cannot make input non-blocking: " << std::strerror(errno) << "\n";
        return false;
    }
    watching_ = loop_.watch_fd(in_fd_, [this](uint32_t) { read_input(); });
    return watching_;
}

void StdioChannel::read_input() {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(in_fd_, buf, sizeof(buf));
        if (n > 0) {
            input_.append(buf, static_cast<size_t>(n), [this](const std::string& line) {
                handle_line(line);
                return true;
            });
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;

        // EOF or hard error: the UI process is gone.
        if (n < 0) std::cerr << "[stdio] Read failed: " << std::strerror(errno) << "\n";
        std::string tail = input_.take_remainder();
        if (!trim(tail).empty()) handle_line(tail);
        loop_.unwatch_fd(in_fd_);
        watching_ = false;
        if (on_eof_) on_eof_();
        return;
    }
}

void StdioChannel::handle_line(const std::string& line) {
    if (trim(line).empty()) return;

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[stdio] Malformed request: " << e.what() << "\n";
        write(nlohmann::json{{"type", "response"}, {"id", nullptr},
                             {"result", {{"success", false}, {"error", "Malformed request"}}}});
        return;
    }

    nlohmann::json id = request.is_object() && request.contains("id") ? request["id"] : nullptr;
    if (!request.is_object() || !request.contains("channel") || !request["channel"].is_string()) {
        write(nlohmann::json{{"type", "response"}, {"id", id},
                             {"result", {{"success", false}, {"error", "Missing channel"}}}});
        return;
    }
    if (!bridge_) {
        write(nlohmann::json{{"type", "response"}, {"id", id},
                             {"result", {{"success", false}, {"error", "Host not ready"}}}});
        return;
    }

    nlohmann::json args = request.contains("args") ? request["args"] : nlohmann::json::object();
    bridge_->handle(request["channel"].get<std::string>(), args,
                    [this, id](const nlohmann::json& result) {
                        write(nlohmann::json{{"type", "response"}, {"id", id}, {"result", result}});
                    });
}

void StdioChannel::write(const nlohmann::json& message) {
    // Invalid UTF-8 from a page or the agent is replaced, not fatal.
    out_ << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    out_.flush();
}

} // namespace shellhost
