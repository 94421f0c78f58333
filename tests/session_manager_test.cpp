#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "mcpsrv/server/session_manager.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <set>
#include <system_error>
#include <thread>
#include <vector>

using namespace mcpsrv;
using namespace std::chrono_literals;

namespace {

Json envelope(int id) {
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", Json::object()}};
}

// Non-blocking dequeue; a keepalive tick is consumed and reported as nullopt.
std::optional<Json> try_pop(Session& session) {
    std::optional<Json> out;
    session.queue().try_receive([&out](asio::error_code ec, Json next) {
        if (!ec) {
            out = std::move(next);
        }
    });
    return out;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Creation & Lookup
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("SessionManager creates sessions with fresh UUIDv4 ids", "[session][lifecycle]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());

    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        auto session = manager.create();
        REQUIRE(SessionManager::is_valid_session_id(session->id()));
        REQUIRE(session->id()[14] == '4');  // version nibble
        REQUIRE_FALSE(session->initialized());
        REQUIRE(session->is_open());
        ids.insert(session->id());
    }

    REQUIRE(ids.size() == 200);
    REQUIRE(manager.size() == 200);
}

TEST_CASE("Session ids are never reused after removal", "[session][lifecycle]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());

    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto session = manager.create();
        REQUIRE(seen.insert(session->id()).second);
        manager.remove(session->id());
    }
    REQUIRE(manager.size() == 0);
}

TEST_CASE("SessionManager find reports NotFound for unknown ids", "[session][lookup]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto session = manager.create();

    auto found = manager.find(session->id());
    REQUIRE(found.has_value());
    REQUIRE(found->get() == session.get());

    auto missing = manager.find("00000000-0000-4000-8000-000000000000");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == SessionError::Code::NotFound);
}

TEST_CASE("is_valid_session_id accepts only canonical lowercase UUIDs", "[session]") {
    REQUIRE(SessionManager::is_valid_session_id("3f2b8c1e-9d4a-4b7e-8f01-23456789abcd"));
    REQUIRE_FALSE(SessionManager::is_valid_session_id(""));
    REQUIRE_FALSE(SessionManager::is_valid_session_id("3F2B8C1E-9D4A-4B7E-8F01-23456789ABCD"));
    REQUIRE_FALSE(SessionManager::is_valid_session_id("3f2b8c1e9d4a4b7e8f0123456789abcd"));
    REQUIRE_FALSE(SessionManager::is_valid_session_id("3f2b8c1e-9d4a-4b7e-8f01-23456789abcg"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Queueing
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Enqueued envelopes drain in FIFO order", "[session][queue]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto session = manager.create();

    const Json a = envelope(1);
    const Json b = envelope(2);
    const Json c = envelope(3);
    REQUIRE(manager.enqueue(session->id(), a).has_value());
    REQUIRE(manager.enqueue(session->id(), b).has_value());
    REQUIRE(manager.enqueue(session->id(), c).has_value());

    for (const Json& expected : {a, b, c}) {
        auto next = try_pop(*session);
        REQUIRE(next.has_value());
        REQUIRE(*next == expected);
    }
    REQUIRE_FALSE(try_pop(*session).has_value());
}

TEST_CASE("Queue is drained in order by an awaiting consumer", "[session][queue]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto session = manager.create();

    for (int i = 1; i <= 3; ++i) {
        REQUIRE(manager.enqueue(session->id(), envelope(i)).has_value());
    }

    auto drained = asio::co_spawn(io, [session]() -> asio::awaitable<std::vector<int>> {
        std::vector<int> ids;
        for (int i = 0; i < 3; ++i) {
            Json next = co_await session->queue().async_receive(asio::use_awaitable);
            ids.push_back(next["id"].get<int>());
        }
        co_return ids;
    }, asio::use_future);

    io.run();
    REQUIRE(drained.get() == (std::vector<int>{1, 2, 3}));
}

TEST_CASE("Sessions do not see each other's envelopes", "[session][queue]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto first = manager.create();
    auto second = manager.create();

    REQUIRE(manager.enqueue(first->id(), envelope(1)).has_value());

    REQUIRE_FALSE(try_pop(*second).has_value());
    REQUIRE(try_pop(*first).has_value());
}

TEST_CASE("Enqueue fails explicitly when the session is gone", "[session][queue]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto session = manager.create();
    const std::string id = session->id();

    REQUIRE(manager.remove(id));

    auto via_manager = manager.enqueue(id, envelope(1));
    REQUIRE_FALSE(via_manager.has_value());
    REQUIRE(via_manager.error().code == SessionError::Code::NotFound);

    // A handle obtained before removal sees a closed queue
    auto via_handle = session->push(envelope(2));
    REQUIRE_FALSE(via_handle.has_value());
    REQUIRE(via_handle.error().code == SessionError::Code::Closed);
}

TEST_CASE("Queue is bounded and keeps what it already holds", "[session][queue]") {
    asio::io_context io;
    SessionManager manager(io.get_executor(), SessionManagerConfig{2});
    auto session = manager.create();

    REQUIRE(manager.enqueue(session->id(), envelope(1)).has_value());
    REQUIRE(manager.enqueue(session->id(), envelope(2)).has_value());

    auto overflow = manager.enqueue(session->id(), envelope(3));
    REQUIRE_FALSE(overflow.has_value());
    REQUIRE(overflow.error().code == SessionError::Code::QueueFull);

    REQUIRE((*try_pop(*session))["id"] == 1);
    REQUIRE((*try_pop(*session))["id"] == 2);
    REQUIRE(manager.enqueue(session->id(), envelope(4)).has_value());
}

TEST_CASE("Keepalive ticks are not envelopes", "[session][queue]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto session = manager.create();

    REQUIRE(session->notify_idle());
    REQUIRE(manager.enqueue(session->id(), envelope(1)).has_value());

    REQUIRE_FALSE(try_pop(*session).has_value());  // tick consumed
    REQUIRE((*try_pop(*session))["id"] == 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Removal
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("remove is idempotent", "[session][remove]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto session = manager.create();
    const std::string id = session->id();

    REQUIRE(manager.remove(id));
    REQUIRE_NOTHROW(manager.remove(id));
    REQUIRE_FALSE(manager.remove(id));
    REQUIRE_FALSE(manager.remove("never-existed"));
    REQUIRE(manager.size() == 0);
}

TEST_CASE("remove wakes a consumer waiting on the queue", "[session][remove]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto session = manager.create();

    std::atomic<bool> woke{false};
    asio::co_spawn(io, [session, &woke]() -> asio::awaitable<void> {
        try {
            (void)co_await session->queue().async_receive(asio::use_awaitable);
        } catch (const std::system_error&) {
            woke = true;
        }
    }, asio::detached);

    io.poll();
    REQUIRE_FALSE(woke.load());

    manager.remove(session->id());
    io.restart();
    io.run();
    REQUIRE(woke.load());
}

TEST_CASE("close_all closes and forgets every session", "[session][remove]") {
    asio::io_context io;
    SessionManager manager(io.get_executor());
    auto a = manager.create();
    auto b = manager.create();

    manager.close_all();

    REQUIRE(manager.size() == 0);
    REQUIRE_FALSE(a->is_open());
    REQUIRE_FALSE(b->is_open());
}

TEST_CASE("Concurrent enqueue and remove never throw", "[session][concurrency]") {
    asio::io_context io;
    SessionManager manager(io.get_executor(), SessionManagerConfig{100000});

    std::vector<std::string> ids;
    for (int i = 0; i < 16; ++i) {
        ids.push_back(manager.create()->id());
    }

    std::atomic<bool> stop{false};
    std::atomic<int> failures{0};
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&, t] {
            int n = 0;
            while (stop.load() == false) {
                auto result = manager.enqueue(ids[(t + n) % ids.size()], envelope(n));
                if (!result) {
                    ++failures;
                }
                ++n;
            }
        });
    }

    for (const auto& id : ids) {
        REQUIRE_NOTHROW(manager.remove(id));
        std::this_thread::sleep_for(1ms);
    }
    stop = true;
    for (auto& producer : producers) {
        producer.join();
    }

    REQUIRE(manager.size() == 0);
    REQUIRE(failures.load() > 0);
}
