#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>
#include "../interfaces/IEventBus.hpp"

namespace TierCache {

struct EventBusStatistics {
    size_t total_handlers = 0;
    size_t pending_events = 0;
    size_t history_size = 0;
    std::map<std::string, size_t> handlers_by_event;
};

// Priority-ordered, best-effort pub/sub with a bounded history ring.
//
// Emit enqueues, re-sorts the pending queue by priority (stable, so equal
// priorities keep enqueue order) and drains it unless a drain is already
// running. The internal lock is never held while a handler runs, so handlers
// may Emit, subscribe or unsubscribe freely. Once an unsubscribe returns the
// handler is no longer running and will not be called again, unless the call
// came from inside that handler.
class EventBus : public IEventBus {
public:
    static constexpr size_t kDefaultHistorySize = 100;

    explicit EventBus(size_t max_history_size = kDefaultHistorySize);
    ~EventBus() override = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    using IEventBus::On;
    using IEventBus::Emit;

    Unsubscribe On(const std::string& topic, Handler handler) override;
    void Once(const std::string& topic, Handler handler) override;
    void Emit(const std::string& topic, std::any data, EventPriority priority = EventPriority::Normal) override;
    std::vector<EventEnvelope> GetHistory(std::optional<size_t> count = std::nullopt) const override;

    size_t GetPendingCount() const;
    void ClearQueue();
    void ClearHistory();
    EventBusStatistics GetStatistics() const;
    void Dispose();

private:
    using EnvelopePtr = std::shared_ptr<const EventEnvelope>;

    // Shared between the registry and drain snapshots. Both flags are guarded
    // by mutex_; at most one thread drains, so `running` is a plain flag.
    struct HandlerState {
        Handler fn;
        bool active = true;
        bool running = false;
    };

    struct HandlerSlot {
        uint64_t id;
        std::shared_ptr<HandlerState> state;
    };

    void RemoveHandler(const std::string& topic, uint64_t id);
    void DrainQueue(std::unique_lock<std::mutex>& lock);
    void Dispatch(const EventEnvelope& event, const std::vector<HandlerSlot>& handlers);

    const size_t max_history_size_;

    mutable std::mutex mutex_;
    std::condition_variable drain_cv_;
    std::condition_variable handler_idle_cv_;
    std::unordered_map<std::string, std::vector<HandlerSlot>> handlers_;
    std::deque<EnvelopePtr> queue_;
    std::deque<EnvelopePtr> history_;
    uint64_t event_counter_ = 0;
    uint64_t handler_counter_ = 0;
    bool draining_ = false;
    std::thread::id drain_thread_;
    uint64_t drain_generation_ = 0;
};

}
