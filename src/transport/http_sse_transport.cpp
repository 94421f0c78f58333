#include "mcpsrv/transport/http_sse_transport.hpp"

#include "mcpsrv/log/logger.hpp"
#include "mcpsrv/protocol/json_rpc.hpp"
#include "mcpsrv/transport/sse_event.hpp"

#include <array>
#include <chrono>
#include <exception>
#include <format>
#include <optional>
#include <system_error>
#include <utility>

#include <asio/buffer.hpp>
#include <asio/completion_condition.hpp>
#include <asio/detached.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/write.hpp>

namespace mcpsrv {

using asio::ip::tcp;

namespace {

constexpr std::string_view kHeadTerminator = "\r\n\r\n";
constexpr std::string_view kToolsPrefix = "/tools/";

// ─────────────────────────────────────────────────────────────────────────────
// Request Reading
// ─────────────────────────────────────────────────────────────────────────────

/// Why no request could be read. With `response` set the client gets that
/// error before the connection closes; without it the peer is already gone.
struct ReadFailure {
    std::optional<HttpError> response;
    std::string reason;
};

using ReadResult = tl::expected<HttpRequest, ReadFailure>;

/// Read one request from `socket`. `buffer` carries bytes read past the
/// end of the previous request (pipelining) and keeps any surplus.
asio::awaitable<ReadResult> read_request(tcp::socket& socket,
                                         std::string& buffer,
                                         const HttpServerConfig& config) {
    std::size_t head_size = 0;
    try {
        head_size = co_await asio::async_read_until(
            socket,
            asio::dynamic_buffer(buffer, config.max_header_size),
            kHeadTerminator,
            asio::use_awaitable);
    } catch (const std::system_error& e) {
        if (e.code() == asio::error::not_found) {
            co_return tl::unexpected(ReadFailure{
                HttpError::bad_request("Request header too large"), "header limit exceeded"});
        }
        co_return tl::unexpected(ReadFailure{std::nullopt, e.code().message()});
    }

    auto request = parse_request_head(std::string_view(buffer).substr(0, head_size));
    buffer.erase(0, head_size);
    if (!request) {
        co_return tl::unexpected(ReadFailure{request.error(), request.error().message});
    }

    auto body_length = request_body_length(*request, config.max_body_size);
    if (!body_length) {
        co_return tl::unexpected(ReadFailure{body_length.error(), body_length.error().message});
    }

    if (buffer.size() < *body_length) {
        try {
            co_await asio::async_read(
                socket,
                asio::dynamic_buffer(buffer),
                asio::transfer_exactly(*body_length - buffer.size()),
                asio::use_awaitable);
        } catch (const std::system_error& e) {
            co_return tl::unexpected(ReadFailure{std::nullopt, e.code().message()});
        }
    }

    request->body = buffer.substr(0, *body_length);
    buffer.erase(0, *body_length);
    co_return std::move(*request);
}

asio::awaitable<bool> write_all(tcp::socket& socket, std::string data) {
    try {
        co_await asio::async_write(socket, asio::buffer(data), asio::use_awaitable);
    } catch (const std::system_error& e) {
        MCPSRV_LOG_DEBUG("Write failed: {}", e.code().message());
        co_return false;
    }
    co_return true;
}

void close_socket(tcp::socket& socket) {
    asio::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
}

// ─────────────────────────────────────────────────────────────────────────────
// SSE Helpers
// ─────────────────────────────────────────────────────────────────────────────

bool is_sse_request(const HttpRequest& request) {
    return (request.path == "/sse") && (request.method == HttpMethod::Get);
}

/// (Re)arm the idle timer. On expiry the session queue receives a tick,
/// which the stream turns into a keepalive comment.
void arm_keepalive(asio::steady_timer& timer,
                   std::chrono::milliseconds interval,
                   const std::shared_ptr<Session>& session) {
    timer.expires_after(interval);
    timer.async_wait([weak = std::weak_ptr<Session>(session)](asio::error_code ec) {
        if (ec) {
            return;  // Re-armed or cancelled
        }
        if (auto locked = weak.lock()) {
            locked->notify_idle();
        }
    });
}

/// Close the connection unless a request completes before `timeout`.
void arm_idle_timeout(asio::steady_timer& timer,
                      std::chrono::milliseconds timeout,
                      const std::shared_ptr<tcp::socket>& socket) {
    timer.expires_after(timeout);
    timer.async_wait([weak = std::weak_ptr<tcp::socket>(socket)](asio::error_code ec) {
        if (ec) {
            return;  // Request arrived in time
        }
        if (auto locked = weak.lock()) {
            MCPSRV_LOG_DEBUG("Closing idle connection");
            close_socket(*locked);
        }
    });
}

/// The client never sends on an SSE stream; a completed read means it hung
/// up. Closing the session queue wakes the stream loop.
asio::awaitable<void> watch_disconnect(std::shared_ptr<tcp::socket> socket,
                                       std::weak_ptr<Session> session) {
    std::array<char, 512> scratch{};
    std::error_code reason;
    try {
        for (;;) {
            co_await socket->async_read_some(asio::buffer(scratch), asio::use_awaitable);
        }
    } catch (const std::system_error& e) {
        reason = e.code();
    }

    if (auto locked = session.lock()) {
        MCPSRV_LOG_DEBUG("SSE client for session {} disconnected ({})", locked->id(), reason.message());
        locked->close();
    }
}

std::string utc_timestamp() {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}

std::string allowed_methods(std::string_view path) {
    if ((path == "/messages") || path.starts_with(kToolsPrefix)) {
        return "POST";
    }
    return "GET";
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

HttpSseTransport::HttpSseTransport(HttpServerConfig config, const IToolRegistry& registry, ServerInfo info)
    : config_(std::move(config))
    , registry_(registry)
    , dispatcher_(registry, std::move(info))
    , io_(static_cast<int>(config_.io_threads == 0 ? 1 : config_.io_threads))
    , tool_pool_(config_.tool_threads == 0 ? 1 : config_.tool_threads)
    , acceptor_(io_)
    , sessions_(io_.get_executor(), SessionManagerConfig{config_.session_queue_capacity})
{}

HttpSseTransport::~HttpSseTransport() {
    stop();
}

TransportResult<void> HttpSseTransport::start() {
    if (running_.load()) {
        return tl::unexpected(TransportError{TransportError::Category::State, "transport already started"});
    }

    auto valid = config_.validate();
    if (!valid) {
        return tl::unexpected(TransportError{TransportError::Category::State, valid.error().message});
    }

    asio::error_code ec;
    const auto address = asio::ip::make_address(config_.host, ec);
    if (ec) {
        return tl::unexpected(TransportError{
            TransportError::Category::Bind, "invalid host '" + config_.host + "': " + ec.message()});
    }

    const tcp::endpoint endpoint(address, config_.port);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        return tl::unexpected(TransportError{
            TransportError::Category::Bind,
            std::format("cannot listen on {}:{}: {}", config_.host, config_.port, ec.message())});
    }

    port_.store(acceptor_.local_endpoint(ec).port());
    running_.store(true);

    asio::co_spawn(io_, accept_loop(), asio::detached);

    io_threads_.reserve(config_.io_threads);
    for (std::size_t i = 0; i < config_.io_threads; ++i) {
        io_threads_.emplace_back([this] {
            try {
                io_.run();
            } catch (const std::exception& e) {
                MCPSRV_LOG_ERROR("I/O thread terminated: {}", e.what());
            }
        });
    }

    MCPSRV_LOG_INFO("HTTP+SSE transport listening on {}:{}", config_.host, port_.load());
    return {};
}

void HttpSseTransport::stop() {
    if (running_.exchange(false) == false) {
        return;
    }

    MCPSRV_LOG_INFO("Stopping HTTP+SSE transport ({} live sessions)", sessions_.size());

    sessions_.close_all();
    io_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();

    // No I/O thread is left, so the acceptor can be closed from here
    asio::error_code ignored;
    acceptor_.close(ignored);

    tool_pool_.stop();
    tool_pool_.join();
}

bool HttpSseTransport::is_running() const noexcept {
    return running_.load();
}

std::uint16_t HttpSseTransport::port() const noexcept {
    return port_.load();
}

const HttpServerConfig& HttpSseTransport::config() const noexcept {
    return config_;
}

SessionManager& HttpSseTransport::sessions() noexcept {
    return sessions_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Connections
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<void> HttpSseTransport::accept_loop() {
    while (running_.load()) {
        tcp::socket socket(asio::make_strand(io_));
        try {
            co_await acceptor_.async_accept(socket, asio::use_awaitable);
        } catch (const std::system_error& e) {
            if ((e.code() == asio::error::operation_aborted) || (acceptor_.is_open() == false)) {
                break;
            }
            MCPSRV_LOG_WARN("Accept failed: {}", e.code().message());
            continue;
        }

        const auto executor = socket.get_executor();
        asio::co_spawn(executor, serve_connection(std::move(socket)), asio::detached);
    }
}

asio::awaitable<void> HttpSseTransport::serve_connection(tcp::socket socket) {
    auto stream = std::make_shared<tcp::socket>(std::move(socket));
    std::string buffer;
    asio::steady_timer idle(stream->get_executor());

    while (running_.load()) {
        arm_idle_timeout(idle, config_.idle_timeout, stream);
        auto request = co_await read_request(*stream, buffer, config_);
        idle.cancel();
        if (!request) {
            const auto& failure = request.error();
            if (failure.response.has_value()) {
                MCPSRV_LOG_WARN("Rejecting request: {}", failure.reason);
                co_await write_all(*stream, serialize_response(HttpResponse::from_error(*failure.response), false));
            }
            break;
        }

        if (is_sse_request(*request)) {
            co_await serve_sse(stream);
            co_return;
        }

        const bool keep_alive = request->keep_alive();
        const std::string method_token = request->method_token;
        const std::string path = request->path;

        HttpResponse response = co_await handle_request(std::move(*request));
        MCPSRV_LOG_DEBUG("{} {} -> {}", method_token, path, response.status_code);

        const bool written = co_await write_all(*stream, serialize_response(response, keep_alive));
        if ((written == false) || (keep_alive == false)) {
            break;
        }
    }

    close_socket(*stream);
}

asio::awaitable<void> HttpSseTransport::serve_sse(std::shared_ptr<tcp::socket> socket) {
    auto session = sessions_.create();
    const std::string session_id = session->id();
    MCPSRV_LOG_INFO("SSE stream opened for session {}", session_id);

    std::string preamble = serialize_stream_head(200, sse_response_headers());
    preamble += make_endpoint_event(session_id);

    if (co_await write_all(*socket, std::move(preamble))) {
        asio::co_spawn(socket->get_executor(), watch_disconnect(socket, session), asio::detached);

        asio::steady_timer keepalive(socket->get_executor());
        arm_keepalive(keepalive, config_.keepalive_interval, session);

        for (;;) {
            std::optional<Json> envelope;
            std::string frame;
            bool closed = false;
            try {
                envelope = co_await session->queue().async_receive(asio::use_awaitable);
            } catch (const std::system_error& e) {
                if (e.code() == asio::error::timed_out) {
                    frame = std::string(kSseKeepalive);
                } else {
                    closed = true;  // Queue closed: disconnect or shutdown
                }
            }
            if (closed) {
                break;
            }

            if (envelope.has_value()) {
                try {
                    frame = make_message_event(*envelope);
                } catch (const std::exception& e) {
                    MCPSRV_LOG_ERROR("Dropping unserializable message for session {}: {}",
                                     session_id, e.what());
                    continue;
                }
            }

            if (co_await write_all(*socket, std::move(frame)) == false) {
                break;
            }
            arm_keepalive(keepalive, config_.keepalive_interval, session);
        }

        keepalive.cancel();
    }

    sessions_.remove(session_id);
    close_socket(*socket);
    MCPSRV_LOG_INFO("SSE stream closed for session {}", session_id);
}

// ─────────────────────────────────────────────────────────────────────────────
// Routing
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<HttpResponse> HttpSseTransport::handle_request(HttpRequest request) {
    std::optional<HttpResponse> response;
    std::string failure;
    try {
        response = co_await route(request);
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "Unknown error";
    }

    if (response.has_value() == false) {
        MCPSRV_LOG_ERROR("{} {} failed: {}", request.method_token, request.path, failure);
        co_return HttpResponse::from_error(HttpError::internal(failure));
    }
    co_return std::move(*response);
}

asio::awaitable<HttpResponse> HttpSseTransport::route(const HttpRequest& request) {
    const std::string& path = request.path;
    const HttpMethod method = request.method;

    if (path == "/health") {
        if (method != HttpMethod::Get) {
            co_return HttpResponse::from_error(HttpError::method_not_allowed(allowed_methods(path)));
        }
        co_return handle_health();
    }

    if (path == "/sse") {
        if (method != HttpMethod::Get) {
            co_return HttpResponse::from_error(HttpError::method_not_allowed(allowed_methods(path)));
        }
        co_return HttpResponse::from_error(HttpError::bad_request("Event stream requires a dedicated connection"));
    }

    if (path == "/messages") {
        if (method != HttpMethod::Post) {
            co_return HttpResponse::from_error(HttpError::method_not_allowed(allowed_methods(path)));
        }
        co_return co_await handle_messages(request);
    }

    if (path == "/tools") {
        if (method != HttpMethod::Get) {
            co_return HttpResponse::from_error(HttpError::method_not_allowed(allowed_methods(path)));
        }
        co_return handle_list_tools();
    }

    if (path.starts_with(kToolsPrefix) && (path.size() > kToolsPrefix.size())) {
        const std::string_view segment = std::string_view(path).substr(kToolsPrefix.size());
        if (segment.find('/') != std::string_view::npos) {
            co_return HttpResponse::from_error(HttpError::not_found());
        }
        std::string tool_name = decode_path_segment(segment);
        if (method != HttpMethod::Post) {
            co_return HttpResponse::from_error(HttpError::method_not_allowed(allowed_methods(path)));
        }
        co_return co_await handle_tool_call(request, std::move(tool_name));
    }

    co_return HttpResponse::from_error(HttpError::not_found());
}

HttpResponse HttpSseTransport::handle_health() const {
    const ServerInfo& info = dispatcher_.server_info();
    return HttpResponse::json(200, Json{
        {"server", info.name},
        {"version", info.version},
        {"status", "healthy"},
        {"timestamp", utc_timestamp()}
    });
}

HttpResponse HttpSseTransport::handle_list_tools() const {
    return HttpResponse::json(200, tools_to_json(registry_.list_tools()));
}

asio::awaitable<HttpResponse> HttpSseTransport::handle_messages(const HttpRequest& request) {
    const auto session_id = request.query_param("sessionId");
    if ((session_id.has_value() == false) || (SessionManager::is_valid_session_id(*session_id) == false)) {
        co_return HttpResponse::from_error(HttpError::not_found("Session not found"));
    }

    auto session = sessions_.find(*session_id);
    if (!session) {
        MCPSRV_LOG_DEBUG("POST /messages for unknown session {}", *session_id);
        co_return HttpResponse::from_error(HttpError::not_found("Session not found"));
    }

    auto message = parse_json(request.body);
    if (!message) {
        MCPSRV_LOG_WARN("Invalid JSON for session {}: {}", *session_id, message.error().message);
        co_return HttpResponse::from_error(HttpError::bad_request("Invalid JSON"));
    }

    std::shared_ptr<Session> target = *session;
    auto response = co_await run_on_pool(
        [this, target, payload = std::move(*message)]() {
            return dispatcher_.dispatch(payload, target.get());
        });

    if (response.has_value()) {
        auto queued = target->push(std::move(*response));
        if (!queued) {
            // The stream went away or is saturated; the client cannot be told
            MCPSRV_LOG_WARN("Dropping response for session {}: {}", target->id(), queued.error().message);
        }
    }

    co_return HttpResponse::text(202, "Accepted");
}

asio::awaitable<HttpResponse> HttpSseTransport::handle_tool_call(const HttpRequest& request, std::string tool_name) {
    Json arguments = Json::object();
    if (request.body.empty() == false) {
        auto body = parse_json(request.body);
        if (body && body->is_object()) {
            const auto args_it = body->find("arguments");
            if ((args_it != body->end()) && args_it->is_object()) {
                arguments = *args_it;
            }
        }
    }

    if (registry_.has_tool(tool_name) == false) {
        co_return HttpResponse::from_error(HttpError::not_found("Tool '" + tool_name + "' not found"));
    }

    auto result = co_await run_on_pool(
        [this, name = tool_name, args = std::move(arguments)]() {
            return registry_.invoke(name, args);
        });

    if (!result) {
        MCPSRV_LOG_WARN("Tool '{}' failed: {}", tool_name, result.error().message);
        co_return HttpResponse::from_error(HttpError::internal(result.error().message));
    }
    co_return HttpResponse::json(200, to_call_tool_result(*result));
}

}  // namespace mcpsrv
