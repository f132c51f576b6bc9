#pragma once
#include <functional>
#include <string>

namespace shellhost {

// Accumulates byte chunks and hands out complete '\n'-terminated lines.
// Chunk boundaries never need to align with line boundaries; the trailing
// partial line is kept until more data (or take_remainder) arrives.
class LineBuffer {
public:
    // Append a chunk and call on_line for each complete line (without the
    // '\n'; a trailing '\r' is stripped). Stops early if on_line returns false.
    void append(const char* data, size_t len,
                const std::function<bool(const std::string& line)>& on_line) {
        buffer_.append(data, len);
        size_t pos = 0;
        size_t newline;
        while ((newline = buffer_.find('\n', pos)) != std::string::npos) {
            std::string line = buffer_.substr(pos, newline - pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            pos = newline + 1;
            if (!on_line(line)) break;
        }
        buffer_.erase(0, pos);
    }

    void append(const std::string& chunk,
                const std::function<bool(const std::string& line)>& on_line) {
        append(chunk.data(), chunk.size(), on_line);
    }

    // Hand back the unterminated tail and clear the buffer.
    std::string take_remainder() {
        std::string rest;
        rest.swap(buffer_);
        return rest;
    }

    const std::string& pending() const { return buffer_; }
    void clear() { buffer_.clear(); }

private:
    std::string buffer_;
};

} // namespace shellhost
