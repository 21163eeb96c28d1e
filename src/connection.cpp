#include "ferry/connection.hpp"
#include "ferry/log.hpp"
#include <algorithm>
#include <exception>

namespace ferry {

namespace {

// Idle waits are sliced so a stopping server is noticed quickly.
constexpr std::chrono::milliseconds kIdleSlice{100};

void write_error(ByteStream& stream, int status_code) {
    HttpResponse resp = make_http_error(status_code);
    resp.headers.set("Connection", "close");
    frame_response(resp);
    if (auto ec = encode_response(resp, stream)) {
        log_debug("connection") << "error response " << status_code << " not written: " << ec.message();
    }
}

}  // namespace

std::string_view to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Handshaking: return "handshaking";
        case ConnectionState::Idle: return "idle";
        case ConnectionState::Reading: return "reading";
        case ConnectionState::Dispatched: return "dispatched";
        case ConnectionState::Closing: return "closing";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(std::unique_ptr<ByteStream> stream, std::shared_ptr<const Router> router,
                                           ConnectionOptions options, const std::atomic<bool>* stopping,
                                           std::string peer)
    : stream_(std::move(stream)),
      router_(std::move(router)),
      options_(options),
      stopping_(stopping),
      peer_(std::move(peer)) {}

void ConnectionSupervisor::run() {
    while (state_ != ConnectionState::Closed) {
        switch (state_) {
            case ConnectionState::Handshaking: state_ = on_handshake(); break;
            case ConnectionState::Idle: state_ = on_idle(); break;
            case ConnectionState::Reading: state_ = on_request(); break;
            case ConnectionState::Dispatched:
                // on_request() runs the exchange to completion
                state_ = ConnectionState::Closing;
                break;
            case ConnectionState::Closing:
                close();
                state_ = ConnectionState::Closed;
                break;
            case ConnectionState::Closed: break;
        }
    }
}

ConnectionState ConnectionSupervisor::on_handshake() {
    stream_->set_read_timeout(options_.read_timeout);
    if (auto ec = stream_->handshake()) {
        log_debug("connection") << peer_ << ": handshake failed: " << ec.message();
        return ConnectionState::Closing;
    }
    return ConnectionState::Idle;
}

ConnectionState ConnectionSupervisor::on_idle() {
    if (!buffer_.empty()) return ConnectionState::Reading;  // pipelined bytes already buffered

    auto waited = std::chrono::milliseconds::zero();
    for (;;) {
        if (stopping()) return ConnectionState::Closing;
        const bool unbounded = options_.read_timeout.count() <= 0;
        auto slice = unbounded ? kIdleSlice : std::min(kIdleSlice, options_.read_timeout - waited);
        stream_->set_read_timeout(slice);
        IoResult r = buffer_.fill(*stream_);
        if (r.ok()) break;
        if (r.status != IoStatus::Timeout) return ConnectionState::Closing;
        waited += slice;
        if (!unbounded && waited >= options_.read_timeout) {
            log_debug("connection") << peer_ << ": idle timeout";
            return ConnectionState::Closing;
        }
    }
    stream_->set_read_timeout(options_.read_timeout);
    return ConnectionState::Reading;
}

ConnectionState ConnectionSupervisor::on_request() {
    HttpParseResult parsed = decode_request(*stream_, buffer_, options_.limits);
    if (!parsed.ok) {
        int status = status_for(parsed.error);
        log_debug("connection") << peer_ << ": bad request: " << to_string(parsed.error)
                                << (parsed.detail.empty() ? "" : " (") << parsed.detail
                                << (parsed.detail.empty() ? "" : ")");
        if (status != 0) write_error(*stream_, status);
        return ConnectionState::Closing;
    }

    state_ = ConnectionState::Dispatched;
    HttpRequest& request = parsed.request;
    const bool head = request.method == HttpMethod::Head;
    HttpResponse response = dispatch(request);
    ++requests_served_;

    if (!frame_response(response)) {
        log_error("connection") << peer_ << ": handler for " << request.target
                                << " set both Content-Length and chunked";
        response = make_http_error(500);
        frame_response(response);
    }

    bool keep_alive = request.keep_alive() && !response.headers.has_token("Connection", "close") && !stopping();
    if (options_.max_keep_alive_requests != 0 && requests_served_ >= options_.max_keep_alive_requests) {
        keep_alive = false;
    }
    if (!keep_alive) {
        if (!response.headers.has_token("Connection", "close")) response.headers.add("Connection", "close");
    } else if (request.version.minor == 0 && !response.headers.contains("Connection")) {
        response.headers.add("Connection", "keep-alive");
    }

    if (options_.access_log) {
        std::string_view phrase = response.status_phrase;
        if (phrase.empty()) phrase = reason_phrase(response.status_code);
        log_info("access") << peer_ << ' ' << to_string(request.method) << ' ' << request.target << ' '
                           << response.status_code << ' ' << phrase;
    }

    // A body producer runs during the write; once the head is out the only recovery is to drop the connection.
    try {
        if (auto ec = encode_response(response, *stream_, !head)) {
            log_debug("connection") << peer_ << ": write failed: " << ec.message();
            return ConnectionState::Closing;
        }
    } catch (const std::exception& e) {
        log_error("connection") << peer_ << ": body producer for " << request.target << " threw: " << e.what();
        return ConnectionState::Closing;
    } catch (...) {
        log_error("connection") << peer_ << ": body producer for " << request.target
                                << " threw a non-standard exception";
        return ConnectionState::Closing;
    }
    return keep_alive ? ConnectionState::Idle : ConnectionState::Closing;
}

HttpResponse ConnectionSupervisor::dispatch(HttpRequest& request) const {
    RouteMatch match = router_->resolve(request.method, request.raw_path());
    switch (match.status) {
        case RouteStatus::NoMatch:
            return make_http_error(404);
        case RouteStatus::MethodNotAllowed: {
            HttpResponse resp = make_http_error(405);
            resp.headers.add("Allow", format_allow(match.allowed));
            return resp;
        }
        case RouteStatus::Matched:
            break;
    }
    request.path_params = std::move(match.params);
    try {
        return (*match.handler)(request);
    } catch (const std::exception& e) {
        log_error("connection") << peer_ << ": handler for " << request.target << " threw: " << e.what();
    } catch (...) {
        log_error("connection") << peer_ << ": handler for " << request.target << " threw a non-standard exception";
    }
    return make_http_error(500);
}

void ConnectionSupervisor::close() {
    stream_->shutdown();
    stream_.reset();
}

}  // namespace ferry
