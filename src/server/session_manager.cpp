#include "mcpsrv/server/session_manager.hpp"

#include "mcpsrv/log/logger.hpp"

#include <array>
#include <vector>

namespace mcpsrv {

namespace {

constexpr std::size_t kSessionIdLength = 36;

bool is_lower_hex(char c) noexcept {
    return ((c >= '0') && (c <= '9')) || ((c >= 'a') && (c <= 'f'));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Session
// ─────────────────────────────────────────────────────────────────────────────

Session::Session(std::string id, const asio::any_io_executor& executor, std::size_t queue_capacity)
    : id_(std::move(id))
    , channel_(executor, queue_capacity)
{}

bool Session::is_open() const noexcept {
    return channel_.is_open();
}

SessionResult<void> Session::push(Json envelope) {
    if (channel_.is_open() == false) {
        return tl::unexpected(SessionError{SessionError::Code::Closed, "session " + id_ + " is closed"});
    }
    if (channel_.try_send(asio::error_code{}, std::move(envelope)) == false) {
        // try_send also fails if close() won the race after the check above
        if (channel_.is_open() == false) {
            return tl::unexpected(SessionError{SessionError::Code::Closed, "session " + id_ + " is closed"});
        }
        return tl::unexpected(SessionError{SessionError::Code::QueueFull, "session " + id_ + " queue is full"});
    }
    return {};
}

bool Session::notify_idle() {
    return channel_.try_send(asio::error_code(asio::error::timed_out), Json{});
}

void Session::close() {
    channel_.close();
}

// ─────────────────────────────────────────────────────────────────────────────
// SessionManager
// ─────────────────────────────────────────────────────────────────────────────

SessionManager::SessionManager(asio::any_io_executor executor, SessionManagerConfig config)
    : executor_(std::move(executor))
    , config_(config)
    , rng_(std::random_device{}())
{}

SessionManager::~SessionManager() {
    close_all();
}

std::shared_ptr<Session> SessionManager::create() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string id = generate_id_locked();
    while (sessions_.contains(id)) {
        id = generate_id_locked();
    }

    auto session = std::make_shared<Session>(id, executor_, config_.queue_capacity);
    sessions_.emplace(std::move(id), session);

    MCPSRV_LOG_DEBUG("Session {} created ({} live)", session->id(), sessions_.size());
    return session;
}

SessionResult<std::shared_ptr<Session>> SessionManager::find(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(std::string(session_id));
    if (it == sessions_.end()) {
        return tl::unexpected(SessionError{
            SessionError::Code::NotFound,
            "session " + std::string(session_id) + " not found"});
    }
    return it->second;
}

SessionResult<void> SessionManager::enqueue(std::string_view session_id, Json envelope) {
    auto session = find(session_id);
    if (!session) {
        return tl::unexpected(session.error());
    }
    // Outside the lock: a concurrent remove() closes the queue and push fails cleanly
    return (*session)->push(std::move(envelope));
}

bool SessionManager::remove(std::string_view session_id) {
    std::shared_ptr<Session> removed;
    std::size_t remaining = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(std::string(session_id));
        if (it == sessions_.end()) {
            return false;
        }
        removed = std::move(it->second);
        sessions_.erase(it);
        remaining = sessions_.size();
    }

    removed->close();
    MCPSRV_LOG_DEBUG("Session {} removed ({} live)", removed->id(), remaining);
    return true;
}

void SessionManager::close_all() {
    std::vector<std::shared_ptr<Session>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing.reserve(sessions_.size());
        for (auto& [id, session] : sessions_) {
            closing.push_back(std::move(session));
        }
        sessions_.clear();
    }

    for (const auto& session : closing) {
        session->close();
    }
}

std::size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool SessionManager::is_valid_session_id(std::string_view session_id) noexcept {
    if (session_id.size() != kSessionIdLength) {
        return false;
    }
    for (std::size_t i = 0; i < session_id.size(); ++i) {
        const bool is_dash_position = (i == 8) || (i == 13) || (i == 18) || (i == 23);
        if (is_dash_position) {
            if (session_id[i] != '-') {
                return false;
            }
        } else if (is_lower_hex(session_id[i]) == false) {
            return false;
        }
    }
    return true;
}

std::string SessionManager::generate_id_locked() {
    static constexpr char kHex[] = "0123456789abcdef";

    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        const std::uint64_t word = rng_();
        for (std::size_t b = 0; b < 8; ++b) {
            bytes[i + b] = static_cast<std::uint8_t>(word >> (b * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string id;
    id.reserve(kSessionIdLength);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if ((i == 4) || (i == 6) || (i == 8) || (i == 10)) {
            id += '-';
        }
        id += kHex[bytes[i] >> 4];
        id += kHex[bytes[i] & 0x0F];
    }
    return id;
}

}  // namespace mcpsrv
