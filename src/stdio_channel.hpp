#pragma once
#include "host_bridge.hpp"
#include "line_buffer.hpp"
#include <functional>
#include <ostream>
#include <string>

namespace shellhost {

class EventLoop;

// Newline-delimited JSON transport for the UI process.
//
//   in:  {"id": 7, "channel": "tabs.create", "args": {...}}
//   out: {"type": "response", "id": 7, "result": ...}
//        {"type": "event", "topic": "tabs.updated", "payload": ...}
class StdioChannel : public NotificationSink {
public:
    StdioChannel(EventLoop& loop, std::ostream& out, int in_fd = 0);
    ~StdioChannel() override;

    StdioChannel(const StdioChannel&) = delete;
    StdioChannel& operator=(const StdioChannel&) = delete;

    void notify(const std::string& topic, const nlohmann::json& payload) override;

    // Start reading requests. `on_eof` runs once the input is closed.
    bool serve(HostBridge& bridge, std::function<void()> on_eof);

    // Dispatch one request line (exposed for tests).
    void handle_line(const std::string& line);

private:
    void read_input();
    void write(const nlohmann::json& message);

    EventLoop& loop_;
    std::ostream& out_;
    int in_fd_;
    bool watching_ = false;
    HostBridge* bridge_ = nullptr;
    std::function<void()> on_eof_;
    LineBuffer input_;
};

} // namespace shellhost
