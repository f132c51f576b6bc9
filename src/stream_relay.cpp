#include "stream_relay.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "sse.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

namespace shellhost {

StreamRelay::StreamRelay(EventLoop& loop, EventBus& bus, HttpClient& http,
                         long timeout_seconds)
    : loop_(loop), bus_(bus), http_(http), timeout_seconds_(timeout_seconds)
{}

StreamRelay::~StreamRelay() {
    abort_all();
    for (auto& [serial, worker] : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void StreamRelay::open(const std::string& stream_id, HttpRequest request, DoneCallback done) {
    auto token = std::make_shared<CancellationToken>();
    uint64_t serial = next_serial_++;

    auto existing = sessions_.find(stream_id);
    if (existing != sessions_.end()) {
        std::cerr << "[stream] Replacing live session for id " << stream_id << "\n";
    }
    sessions_[stream_id] = Session{serial, token};

    workers_[serial] = std::thread(&StreamRelay::run_transfer, this, serial, stream_id,
                                   std::move(request), token, std::move(done));
}

bool StreamRelay::abort(const std::string& stream_id) {
    auto it = sessions_.find(stream_id);
    if (it == sessions_.end()) return false;
    it->second.token->cancel();
    sessions_.erase(it);
    return true;
}

void StreamRelay::abort_all() {
    for (auto& [id, session] : sessions_) {
        session.token->cancel();
    }
    sessions_.clear();
}

bool StreamRelay::is_active(const std::string& stream_id) const {
    return sessions_.count(stream_id) > 0;
}

// Worker thread. Touches only its own parser and token; everything else is
// posted to the loop.
void StreamRelay::run_transfer(uint64_t serial, std::string stream_id, HttpRequest request,
                               CancellationTokenPtr token, DoneCallback done) {
    std::weak_ptr<bool> alive = alive_;
    bool connected = false;

    auto post_connected = [&]() {
        if (connected) return;
        connected = true;
        loop_.post([this, alive, stream_id, token]() {
            if (alive.expired() || token->cancelled()) return;
            StreamConnectedEvent ev;
            ev.stream_id = stream_id;
            bus_.publish(ev);
        });
    };

    auto deliver = [&](const std::string& payload) {
        nlohmann::json data;
        try {
            data = nlohmann::json::parse(payload);
        } catch (const nlohmann::json::exception&) {
            data = nlohmann::json{{"data", payload}};
        }
        loop_.post([this, alive, stream_id, token, data = std::move(data)]() {
            if (alive.expired() || token->cancelled()) return;
            StreamDataEvent ev;
            ev.stream_id = stream_id;
            ev.data = data;
            bus_.publish(ev);
        });
        return !token->cancelled();
    };

    SSEParser parser;
    HttpResponse response = http_.stream(
        request,
        [&](long /*status*/) { post_connected(); },
        [&](const char* data, size_t len) {
            post_connected();
            parser.feed(data, len, deliver);
            return !token->cancelled();
        },
        *token, timeout_seconds_);

    Result result;
    if (response.cancelled || token->cancelled()) {
        result.outcome = Outcome::Aborted;
    } else if (!response.error.empty()) {
        result.outcome = Outcome::TransportError;
        result.message = response.error;
    } else if (!response.ok()) {
        result.outcome = Outcome::HttpError;
        result.status = response.status_code;
        result.message = response.status_text;
        try {
            auto body = nlohmann::json::parse(response.body);
            if (body.is_object() && body.contains("message") && body["message"].is_string())
                result.message = body["message"].get<std::string>();
        } catch (const nlohmann::json::exception&) {
            // Non-JSON error body: keep the reason phrase
        }
    } else if (response.no_body) {
        result.outcome = Outcome::NoBody;
    } else {
        post_connected();
        parser.flush(deliver);
        result.outcome = Outcome::Complete;
    }

    loop_.post([this, alive, serial, stream_id, token, result, done]() {
        if (alive.expired()) return;
        finish(serial, stream_id, token, result, done);
    });
}

void StreamRelay::finish(uint64_t serial, const std::string& stream_id,
                         const CancellationTokenPtr& token, const Result& result,
                         const DoneCallback& done) {
    // Cancellation observed here wins over whatever the worker saw last.
    Outcome outcome = token->cancelled() ? Outcome::Aborted : result.outcome;
    bool success = false;

    switch (outcome) {
        case Outcome::Complete: {
            StreamCompleteEvent ev;
            ev.stream_id = stream_id;
            bus_.publish(ev);
            success = true;
            break;
        }
        case Outcome::Aborted: {
            StreamAbortedEvent ev;
            ev.stream_id = stream_id;
            bus_.publish(ev);
            break;
        }
        case Outcome::HttpError: {
            StreamErrorEvent ev;
            ev.stream_id = stream_id;
            ev.code = "HTTP_" + std::to_string(result.status);
            ev.message = result.message;
            ev.status = result.status;
            bus_.publish(ev);
            break;
        }
        case Outcome::NoBody: {
            StreamErrorEvent ev;
            ev.stream_id = stream_id;
            ev.code = "NO_BODY";
            ev.message = "Response body is null";
            bus_.publish(ev);
            break;
        }
        case Outcome::TransportError: {
            std::cerr << "[stream] " << stream_id << " failed: " << result.message << "\n";
            StreamErrorEvent ev;
            ev.stream_id = stream_id;
            ev.code = "STREAM_ERROR";
            ev.message = result.message.empty() ? "Stream failed" : result.message;
            bus_.publish(ev);
            break;
        }
    }

    auto it = sessions_.find(stream_id);
    if (it != sessions_.end() && it->second.serial == serial) {
        sessions_.erase(it);
    }

    // This task is the worker's last act, so the join is immediate.
    auto w = workers_.find(serial);
    if (w != workers_.end()) {
        if (w->second.joinable()) w->second.join();
        workers_.erase(w);
    }

    if (done) done(success);
}

} // namespace shellhost
