#pragma once
#include "line_buffer.hpp"
#include <functional>
#include <optional>
#include <string>

namespace shellhost {

// Payload callback: receives the text after "data:" for each frame.
// Return false to stop parsing the current chunk.
using FrameCallback = std::function<bool(const std::string& payload)>;

// Newline-framed event stream parser.
//
// Every line is handled on its own (no multi-line event assembly): blank
// lines and ":" comments are skipped, "data:" lines yield their payload,
// the "[DONE]" end marker is swallowed, anything else is ignored.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for each complete frame
    void feed(const char* data, size_t len, const FrameCallback& callback);
    void feed(const std::string& chunk, const FrameCallback& callback) {
        feed(chunk.data(), chunk.size(), callback);
    }

    // End of stream: process a non-blank unterminated last line.
    void flush(const FrameCallback& callback);

    // Reset parser state
    void reset();

    // Payload of a single line, or nullopt if the line carries no frame.
    static std::optional<std::string> parse_line(const std::string& line);

private:
    LineBuffer lines_;
};

} // namespace shellhost
