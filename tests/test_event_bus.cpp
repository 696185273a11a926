#include <catch2/catch.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "events/EventBus.hpp"
#include "utils/Logger.hpp"

using namespace TierCache;

TEST_CASE("EventBus delivers envelopes to every handler of the topic") {
    EventBus bus;
    std::vector<std::string> seen;

    bus.On("test.event", [&seen](const EventEnvelope& e) {
        seen.push_back("first:" + std::any_cast<std::string>(e.data));
    });
    bus.On("test.event", [&seen](const EventEnvelope& e) {
        seen.push_back("second:" + std::any_cast<std::string>(e.data));
    });
    bus.On("other.event", [&seen](const EventEnvelope&) {
        seen.push_back("other");
    });

    bus.Emit("test.event", std::string("hello"));

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "first:hello");
    CHECK(seen[1] == "second:hello");
}

TEST_CASE("EventBus emitting without handlers is harmless") {
    EventBus bus;
    CHECK_NOTHROW(bus.Emit("unhandled.event", 1));
    CHECK(bus.GetHistory().size() == 1);
}

TEST_CASE("EventBus unsubscribe stops delivery") {
    EventBus bus;
    int calls = 0;
    auto unsubscribe = bus.On("test.event", [&calls](const EventEnvelope&) { ++calls; });

    bus.Emit("test.event", 1);
    unsubscribe();
    bus.Emit("test.event", 2);
    unsubscribe(); // second call is a no-op

    CHECK(calls == 1);
    CHECK(bus.GetStatistics().total_handlers == 0);
}

TEST_CASE("EventBus Once handlers run a single time") {
    EventBus bus;
    std::vector<int> values;
    bus.Once("test.once", [&values](const EventEnvelope& e) {
        values.push_back(std::any_cast<int>(e.data));
    });

    bus.Emit("test.once", 1);
    bus.Emit("test.once", 2);

    CHECK(values == std::vector<int>{1});
    CHECK(bus.GetStatistics().total_handlers == 0);
}

TEST_CASE("EventBus Once handler stays registered until it succeeds") {
    EventBus bus;
    int attempts = 0;
    bus.Once("test.once", [&attempts](const EventEnvelope&) {
        if (++attempts == 1) throw std::runtime_error("not yet");
    });

    bus.Emit("test.once", 0);
    bus.Emit("test.once", 0);
    bus.Emit("test.once", 0);

    CHECK(attempts == 2);
}

TEST_CASE("EventBus isolates failing handlers and logs them") {
    EventBus bus;
    std::vector<std::string> errors;
    Logger::SetSink([&errors](LogLevel level, const std::string& message) {
        if (level == LogLevel::Error) errors.push_back(message);
    });

    bool after_ran = false;
    bus.On("test.error", [](const EventEnvelope&) { throw std::runtime_error("boom"); });
    bus.On("test.error", [](const EventEnvelope&) { throw 42; });
    bus.On("test.error", [&after_ran](const EventEnvelope&) { after_ran = true; });

    CHECK_NOTHROW(bus.Emit("test.error", 0));
    Logger::ResetSink();

    CHECK(after_ran);
    REQUIRE(errors.size() == 2);
    CHECK(errors[0].find("test.error") != std::string::npos);
    CHECK(errors[0].find("boom") != std::string::npos);
}

TEST_CASE("EventBus dispatches queued events by priority") {
    EventBus bus;
    std::vector<std::string> order;

    // Events emitted from inside a handler queue up behind the running drain.
    bus.On("trigger", [&bus](const EventEnvelope&) {
        bus.Emit("low", 0, EventPriority::Low);
        bus.Emit("critical", 0, EventPriority::Critical);
        bus.Emit("normal", 0, EventPriority::Normal);
        bus.Emit("high", 0, EventPriority::High);
    });
    for (const char* topic : {"low", "critical", "normal", "high"}) {
        bus.On(topic, [&order](const EventEnvelope& e) { order.push_back(e.type); });
    }

    bus.Emit("trigger", 0);

    CHECK(order == std::vector<std::string>{"critical", "high", "normal", "low"});
    CHECK(bus.GetPendingCount() == 0);
}

TEST_CASE("EventBus keeps enqueue order among equal priorities") {
    EventBus bus;
    std::vector<int> order;

    bus.On("trigger", [&bus](const EventEnvelope&) {
        bus.Emit("n", 1);
        bus.Emit("n", 2);
        bus.Emit("n", 3, EventPriority::High);
        bus.Emit("n", 4);
    });
    bus.On("n", [&order](const EventEnvelope& e) { order.push_back(std::any_cast<int>(e.data)); });

    bus.Emit("trigger", 0);

    CHECK(order == std::vector<int>{3, 1, 2, 4});
}

TEST_CASE("EventBus sequential emits dispatch in call order") {
    EventBus bus;
    std::vector<int> order;
    bus.On("n", [&order](const EventEnvelope& e) { order.push_back(std::any_cast<int>(e.data)); });

    bus.Emit("n", 1, EventPriority::Low);
    bus.Emit("n", 2, EventPriority::Critical);
    bus.Emit("n", 3);

    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("EventBus re-entrant emits are drained before Emit returns") {
    EventBus bus;
    int depth_reached = 0;
    bus.On("chain", [&bus, &depth_reached](const EventEnvelope& e) {
        int depth = std::any_cast<int>(e.data);
        depth_reached = depth;
        if (depth < 5) bus.Emit("chain", depth + 1);
    });

    bus.Emit("chain", 1);
    CHECK(depth_reached == 5);
}

TEST_CASE("EventBus history is bounded and ordered oldest first") {
    EventBus bus(3);
    for (int i = 1; i <= 5; ++i) {
        bus.Emit("test." + std::to_string(i), i, EventPriority::High);
    }

    auto history = bus.GetHistory();
    REQUIRE(history.size() == 3);
    CHECK(history[0].type == "test.3");
    CHECK(history[2].type == "test.5");
    CHECK(history[2].priority == EventPriority::High);
    CHECK(std::any_cast<int>(history[2].data) == 5);
    CHECK(history[0].id < history[1].id);
    CHECK(history[1].id < history[2].id);
    CHECK(history[0].timestamp <= history[2].timestamp);

    auto last_two = bus.GetHistory(2);
    REQUIRE(last_two.size() == 2);
    CHECK(last_two[0].type == "test.4");
    CHECK(last_two[1].type == "test.5");

    CHECK(bus.GetHistory(10).size() == 3);
    CHECK(bus.GetHistory(0).size() == 3);

    bus.ClearHistory();
    CHECK(bus.GetHistory().empty());
}

TEST_CASE("EventBus default history keeps the last 100 envelopes") {
    EventBus bus;
    for (int i = 0; i < 150; ++i) bus.Emit("e", i);

    auto history = bus.GetHistory();
    REQUIRE(history.size() == 100);
    CHECK(std::any_cast<int>(history.front().data) == 50);
    CHECK(std::any_cast<int>(history.back().data) == 149);
}

TEST_CASE("EventBus typed topics pass only the payload") {
    EventBus bus;
    std::string removed;
    QueryResult executed;

    bus.On(Events::kConnectionRemoved, [&removed](const std::string& id) { removed = id; });
    bus.On(Events::kQueryExecuted, [&executed](const QueryResult& r) { executed = r; });

    bus.Emit(Events::kConnectionRemoved, "conn-7");
    QueryResult result;
    result.connection_id = "conn-7";
    result.query = "SELECT 1";
    result.duration_ms = 1.5;
    result.rows_affected = 0;
    bus.Emit(Events::kQueryExecuted, result);

    CHECK(removed == "conn-7");
    CHECK(executed.connection_id == "conn-7");
    CHECK(executed.query == "SELECT 1");
    REQUIRE(executed.rows_affected.has_value());
    CHECK(*executed.rows_affected == 0);
    CHECK_FALSE(executed.error.has_value());

    auto history = bus.GetHistory(1);
    REQUIRE(history.size() == 1);
    CHECK(history[0].type == "query.executed");
}

TEST_CASE("EventBus payload type mismatch is a handler failure") {
    EventBus bus;
    std::vector<std::string> errors;
    Logger::SetSink([&errors](LogLevel level, const std::string& message) {
        if (level == LogLevel::Error) errors.push_back(message);
    });

    bool called = false;
    bus.On(Events::kQueryExecuted, [&called](const QueryResult&) { called = true; });
    CHECK_NOTHROW(bus.Emit("query.executed", std::string("not a QueryResult")));
    Logger::ResetSink();

    CHECK_FALSE(called);
    CHECK(errors.size() == 1);
}

TEST_CASE("EventBus statistics, queue clearing and disposal") {
    EventBus bus;
    bus.On("a", [](const EventEnvelope&) {});
    bus.On("a", [](const EventEnvelope&) {});
    bus.On("b", [](const EventEnvelope&) {});
    bus.Emit("a", 0);

    auto stats = bus.GetStatistics();
    CHECK(stats.total_handlers == 3);
    CHECK(stats.handlers_by_event["a"] == 2);
    CHECK(stats.handlers_by_event["b"] == 1);
    CHECK(stats.pending_events == 0);
    CHECK(stats.history_size == 1);

    bus.ClearQueue();
    CHECK(bus.GetPendingCount() == 0);

    bus.Dispose();
    stats = bus.GetStatistics();
    CHECK(stats.total_handlers == 0);
    CHECK(stats.history_size == 0);
}

TEST_CASE("EventBus handlers may unsubscribe themselves while being dispatched") {
    EventBus bus;
    int calls = 0;
    IEventBus::Unsubscribe unsubscribe;
    unsubscribe = bus.On("self", [&calls, &unsubscribe](const EventEnvelope&) {
        ++calls;
        unsubscribe();
    });

    bus.Emit("self", 0);
    bus.Emit("self", 0);
    CHECK(calls == 1);
}

TEST_CASE("EventBus unsubscribe from another thread waits for the running handler") {
    EventBus bus;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    int calls = 0;

    auto unsubscribe = bus.On("slow", [&](const EventEnvelope&) {
        ++calls;
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished = true;
    });

    std::thread drainer([&bus]() { bus.Emit("slow", 0); });
    while (!started) std::this_thread::yield();

    unsubscribe();
    CHECK(finished);
    drainer.join();

    bus.Emit("slow", 0);
    CHECK(calls == 1);
}

TEST_CASE("EventBus skips handlers unsubscribed after the event was picked up") {
    EventBus bus;
    std::vector<std::string> order;
    IEventBus::Unsubscribe remove_second;

    bus.On("topic", [&order, &remove_second](const EventEnvelope&) {
        order.push_back("first");
        remove_second();
    });
    remove_second = bus.On("topic", [&order](const EventEnvelope&) { order.push_back("second"); });

    bus.Emit("topic", 0);
    CHECK(order == std::vector<std::string>{"first"});
}

TEST_CASE("EventBus Emit from another thread waits for the running drain") {
    EventBus bus;
    std::mutex m;
    std::vector<int> delivered;
    std::atomic<bool> in_slow_handler{false};

    bus.On("slow", [&in_slow_handler](const EventEnvelope&) {
        in_slow_handler = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    });
    bus.On("fast", [&m, &delivered](const EventEnvelope& e) {
        std::lock_guard<std::mutex> lock(m);
        delivered.push_back(std::any_cast<int>(e.data));
    });

    std::thread drainer([&bus]() { bus.Emit("slow", 0); });
    while (!in_slow_handler) std::this_thread::yield();

    bus.Emit("fast", 7);
    {
        // Emit returned, so the envelope has already been dispatched.
        std::lock_guard<std::mutex> lock(m);
        CHECK(delivered == std::vector<int>{7});
    }
    drainer.join();
}
