#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/thread_pool.hpp>
#include <asio/use_awaitable.hpp>

#include "mcpsrv/server/dispatcher.hpp"
#include "mcpsrv/server/session_manager.hpp"
#include "mcpsrv/server_config.hpp"
#include "mcpsrv/transport.hpp"
#include "mcpsrv/transport/http_types.hpp"

namespace mcpsrv {

/// MCP over HTTP with Server-Sent Events.
///
/// Routes:
///   GET  /health                  server identity and status
///   GET  /sse                     open a session stream (endpoint event first)
///   POST /messages?sessionId=<id> submit a JSON-RPC message, answered over SSE
///   GET  /tools                   tool listing
///   POST /tools/{name}            invoke a tool directly
///
/// Every connection is a coroutine on its own strand of the io_context.
/// JSON-RPC dispatch and tool calls are moved to a worker pool so a slow
/// tool never stalls another session's stream. A stream waits on its
/// session queue only; the keepalive timer and the disconnect watcher
/// wake it through that queue.
///
/// Lifecycle: construct, start() once, stop() (also run by the destructor).
class HttpSseTransport {
public:
    HttpSseTransport(HttpServerConfig config, const IToolRegistry& registry, ServerInfo info = {});
    ~HttpSseTransport();

    HttpSseTransport(const HttpSseTransport&) = delete;
    HttpSseTransport& operator=(const HttpSseTransport&) = delete;

    /// Bind and listen synchronously, then serve on background threads.
    [[nodiscard]] TransportResult<void> start();

    /// Close every session, stop serving and join all threads. Idempotent.
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /// Bound port; differs from config().port when that was 0.
    [[nodiscard]] std::uint16_t port() const noexcept;

    [[nodiscard]] const HttpServerConfig& config() const noexcept;
    [[nodiscard]] SessionManager& sessions() noexcept;

    /// Route a complete non-streaming request. GET /sse is answered with
    /// 400 here since it needs the connection itself.
    [[nodiscard]] asio::awaitable<HttpResponse> handle_request(HttpRequest request);

private:
    asio::awaitable<void> accept_loop();
    asio::awaitable<void> serve_connection(asio::ip::tcp::socket socket);
    asio::awaitable<void> serve_sse(std::shared_ptr<asio::ip::tcp::socket> socket);

    asio::awaitable<HttpResponse> route(const HttpRequest& request);
    [[nodiscard]] HttpResponse handle_health() const;
    [[nodiscard]] HttpResponse handle_list_tools() const;
    asio::awaitable<HttpResponse> handle_messages(const HttpRequest& request);
    asio::awaitable<HttpResponse> handle_tool_call(const HttpRequest& request, std::string tool_name);

    // Run fn on the worker pool and resume on the calling strand
    template <typename F>
    asio::awaitable<std::invoke_result_t<F&>> run_on_pool(F fn) {
        using Result = std::invoke_result_t<F&>;
        co_return co_await asio::co_spawn(
            tool_pool_.get_executor(),
            [fn = std::move(fn)]() mutable -> asio::awaitable<Result> { co_return fn(); },
            asio::use_awaitable);
    }

    HttpServerConfig config_;
    const IToolRegistry& registry_;
    JsonRpcDispatcher dispatcher_;

    asio::io_context io_;
    asio::thread_pool tool_pool_;
    asio::ip::tcp::acceptor acceptor_;
    SessionManager sessions_;

    std::vector<std::thread> io_threads_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> port_{0};
};

}  // namespace mcpsrv
