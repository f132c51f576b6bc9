#include "sse.hpp"
#include "util.hpp"

namespace shellhost {

static constexpr const char* kDoneMarker = "[DONE]";

std::optional<std::string> SSEParser::parse_line(const std::string& line) {
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == ':') return std::nullopt;
    if (!starts_with(trimmed, "data:")) return std::nullopt;

    std::string payload = trim(trimmed.substr(5));
    if (payload == kDoneMarker) return std::nullopt;
    return payload;
}

void SSEParser::feed(const char* data, size_t len, const FrameCallback& callback) {
    lines_.append(data, len, [&](const std::string& line) {
        auto payload = parse_line(line);
        if (!payload) return true;
        return callback(*payload);
    });
}

void SSEParser::flush(const FrameCallback& callback) {
    std::string rest = lines_.take_remainder();
    if (trim(rest).empty()) return;
    auto payload = parse_line(rest);
    if (payload) callback(*payload);
}

void SSEParser::reset() {
    lines_.clear();
}

} // namespace shellhost
