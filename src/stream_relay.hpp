#pragma once
#include "cancellation.hpp"
#include "http.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

namespace shellhost {

class EventBus;
class EventLoop;

// Proxies newline-framed event streams from remote HTTP endpoints onto the
// event bus, one cancellable session per caller-supplied stream id.
//
// The transfer itself runs on a worker thread; every notification and every
// change to the session table happens on the loop thread. A session is
// removed from the table in all terminal cases, so a late abort() for it is
// simply "not found".
class StreamRelay {
public:
    // Invoked once on the loop thread when the stream ends:
    // true after StreamComplete, false after an error or abort.
    using DoneCallback = std::function<void(bool success)>;

    StreamRelay(EventLoop& loop, EventBus& bus, HttpClient& http,
                long timeout_seconds = 300);
    ~StreamRelay();

    StreamRelay(const StreamRelay&) = delete;
    StreamRelay& operator=(const StreamRelay&) = delete;

    // Start a stream. Reusing a live id replaces its table entry; the older
    // transfer keeps running but can no longer be aborted by id.
    void open(const std::string& stream_id, HttpRequest request, DoneCallback done = {});

    // Cancel one session. False if the id is unknown or already finished.
    bool abort(const std::string& stream_id);

    // Cancel every live session (host shutdown).
    void abort_all();

    bool is_active(const std::string& stream_id) const;
    size_t active_count() const { return sessions_.size(); }

private:
    enum class Outcome { Complete, HttpError, NoBody, TransportError, Aborted };

    struct Session {
        uint64_t serial = 0;
        CancellationTokenPtr token;
    };

    struct Result {
        Outcome outcome = Outcome::Complete;
        long status = 0;
        std::string message;
    };

    void run_transfer(uint64_t serial, std::string stream_id, HttpRequest request,
                      CancellationTokenPtr token, DoneCallback done);
    void finish(uint64_t serial, const std::string& stream_id,
                const CancellationTokenPtr& token, const Result& result,
                const DoneCallback& done);

    EventLoop& loop_;
    EventBus& bus_;
    HttpClient& http_;
    long timeout_seconds_;

    std::unordered_map<std::string, Session> sessions_;
    std::unordered_map<uint64_t, std::thread> workers_;
    uint64_t next_serial_ = 1;

    // Posted tasks check this so none runs after the relay is gone.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace shellhost
