#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>

#include <asio/any_io_executor.hpp>
#include <asio/experimental/concurrent_channel.hpp>
#include <tl/expected.hpp>

namespace mcpsrv {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Session Errors
// ─────────────────────────────────────────────────────────────────────────────

struct SessionError {
    enum class Code {
        NotFound,   // No live session with that id (never existed or removed)
        Closed,     // Session is shutting down; its queue no longer accepts
        QueueFull   // Outbound queue reached its bound
    };

    Code code;
    std::string message;
};

template <typename T>
using SessionResult = tl::expected<T, SessionError>;

// ─────────────────────────────────────────────────────────────────────────────
// Session
// ─────────────────────────────────────────────────────────────────────────────

/// One SSE-connected client.
///
/// The outbound queue is a thread-safe asio channel: producers (POST
/// /messages handlers, possibly on worker threads) push envelopes with
/// push(), the SSE connection coroutine is the only consumer. Delivery is
/// FIFO. Besides envelopes the channel carries keepalive ticks, delivered
/// to the consumer as `asio::error::timed_out`. Closing the channel is the
/// cancellation signal for the consumer.
class Session {
public:
    using Channel = asio::experimental::concurrent_channel<void(asio::error_code, Json)>;

    Session(std::string id, const asio::any_io_executor& executor, std::size_t queue_capacity);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    [[nodiscard]] bool initialized() const noexcept {
        return initialized_.load(std::memory_order_acquire);
    }

    void mark_initialized() noexcept {
        initialized_.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_open() const noexcept;

    /// Append an envelope to the outbound queue without blocking.
    [[nodiscard]] SessionResult<void> push(Json envelope);

    /// Wake the consumer with a keepalive tick. False if the queue is full
    /// or closed (the consumer is busy or gone, so no tick is needed).
    bool notify_idle();

    /// Consumer side: the SSE loop awaits `queue().async_receive(...)`.
    [[nodiscard]] Channel& queue() noexcept { return channel_; }

    /// Stop accepting envelopes and wake the consumer. Idempotent.
    void close();

private:
    std::string id_;
    std::atomic<bool> initialized_{false};
    Channel channel_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Session Manager
// ─────────────────────────────────────────────────────────────────────────────

struct SessionManagerConfig {
    /// Maximum number of undelivered envelopes per session.
    std::size_t queue_capacity{1024};
};

/// Owns the table of live SSE sessions for one HTTP transport instance.
///
/// Thread-safe. create/remove are atomic with respect to find/enqueue;
/// handles are shared pointers, so a session found by one thread stays valid
/// while another removes it. An enqueue racing a remove either lands before
/// the queue closes or fails with Closed; it never throws.
class SessionManager {
public:
    explicit SessionManager(asio::any_io_executor executor, SessionManagerConfig config = {});

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    ~SessionManager();

    /// Register a new session with a fresh UUIDv4 identifier.
    [[nodiscard]] std::shared_ptr<Session> create();

    [[nodiscard]] SessionResult<std::shared_ptr<Session>> find(std::string_view session_id) const;

    [[nodiscard]] SessionResult<void> enqueue(std::string_view session_id, Json envelope);

    /// Close and unregister. Returns false if the id was not registered.
    bool remove(std::string_view session_id);

    /// Close and unregister every session (server shutdown).
    void close_all();

    [[nodiscard]] std::size_t size() const;

    /// Canonical lowercase 8-4-4-4-12 hex form.
    [[nodiscard]] static bool is_valid_session_id(std::string_view session_id) noexcept;

private:
    // Caller must hold mutex_
    std::string generate_id_locked();

    asio::any_io_executor executor_;
    SessionManagerConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::mt19937_64 rng_;
};

}  // namespace mcpsrv
