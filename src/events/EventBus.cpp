#include "EventBus.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <exception>

namespace TierCache {

const char* ToString(EventPriority priority) {
    switch (priority) {
        case EventPriority::Low:      return "LOW";
        case EventPriority::Normal:   return "NORMAL";
        case EventPriority::High:     return "HIGH";
        case EventPriority::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

EventBus::EventBus(size_t max_history_size) : max_history_size_(max_history_size) {}

IEventBus::Unsubscribe EventBus::On(const std::string& topic, Handler handler) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = ++handler_counter_;
        auto state = std::make_shared<HandlerState>();
        state->fn = std::move(handler);
        handlers_[topic].push_back({id, std::move(state)});
    }
    Logger::Log(LogLevel::Debug, "Registered handler for event: " + topic);

    return [this, topic, id]() {
        RemoveHandler(topic, id);
    };
}

void EventBus::Once(const std::string& topic, Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t id = ++handler_counter_;
    auto fired = std::make_shared<std::atomic<bool>>(false);

    auto wrapped = [this, topic, id, fired, handler = std::move(handler)](const EventEnvelope& event) {
        if (fired->exchange(true)) return;
        try {
            handler(event);
        } catch (...) {
            // Stay registered until an invocation succeeds.
            fired->store(false);
            throw;
        }
        RemoveHandler(topic, id);
    };
    auto state = std::make_shared<HandlerState>();
    state->fn = std::move(wrapped);
    handlers_[topic].push_back({id, std::move(state)});
}

void EventBus::RemoveHandler(const std::string& topic, uint64_t id) {
    bool removed = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = handlers_.find(topic);
        if (it == handlers_.end()) return;
        auto& slots = it->second;
        std::shared_ptr<HandlerState> state;
        auto slot = std::find_if(slots.begin(), slots.end(), [id](const HandlerSlot& s) { return s.id == id; });
        if (slot != slots.end()) {
            state = slot->state;
            state->active = false;
            slots.erase(slot);
            removed = true;
        }
        if (slots.empty()) {
            handlers_.erase(it);
        }

        // A handler removing itself would wait on its own call.
        if (state && drain_thread_ != std::this_thread::get_id()) {
            handler_idle_cv_.wait(lock, [&state] { return !state->running; });
        }
    }
    if (removed) {
        Logger::Log(LogLevel::Debug, "Unregistered handler for event: " + topic);
    }
}

void EventBus::Emit(const std::string& topic, std::any data, EventPriority priority) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto event = std::make_shared<EventEnvelope>();
    event->type = topic;
    event->data = std::move(data);
    event->priority = priority;
    event->timestamp = std::chrono::system_clock::now();
    event->id = ++event_counter_;
    EnvelopePtr envelope = std::move(event);

    queue_.push_back(envelope);
    std::stable_sort(queue_.begin(), queue_.end(), [](const EnvelopePtr& a, const EnvelopePtr& b) {
        return static_cast<int>(a->priority) > static_cast<int>(b->priority);
    });

    history_.push_back(envelope);
    while (history_.size() > max_history_size_) {
        history_.pop_front();
    }

    if (draining_) {
        // A handler emitting from inside the drain: the running loop picks it up.
        if (drain_thread_ == std::this_thread::get_id()) return;

        // Another thread is draining; it only stops once the queue is empty.
        const uint64_t generation = drain_generation_;
        drain_cv_.wait(lock, [this, generation] { return drain_generation_ != generation; });
        return;
    }

    DrainQueue(lock);
}

void EventBus::DrainQueue(std::unique_lock<std::mutex>& lock) {
    draining_ = true;
    drain_thread_ = std::this_thread::get_id();

    while (!queue_.empty()) {
        EnvelopePtr event = queue_.front();
        queue_.pop_front();

        std::vector<HandlerSlot> snapshot;
        auto it = handlers_.find(event->type);
        if (it != handlers_.end()) {
            snapshot = it->second;
        }

        // Unlock before dispatching so handlers can Emit/On/unsubscribe.
        lock.unlock();
        Dispatch(*event, snapshot);
        lock.lock();
    }

    draining_ = false;
    drain_thread_ = std::thread::id();
    ++drain_generation_;
    drain_cv_.notify_all();
}

void EventBus::Dispatch(const EventEnvelope& event, const std::vector<HandlerSlot>& handlers) {
    Logger::Log(LogLevel::Debug, "Dispatching event: " + event.type + " (priority: " + ToString(event.priority) +
        ") to " + std::to_string(handlers.size()) + " handlers");

    for (const auto& slot : handlers) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Unsubscribed after the snapshot was taken.
            if (!slot.state->active) continue;
            slot.state->running = true;
        }
        try {
            slot.state->fn(event);
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Error in event handler for " + event.type + ": " + e.what());
        } catch (...) {
            Logger::Log(LogLevel::Error, "Error in event handler for " + event.type + ": unknown exception");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot.state->running = false;
        }
        handler_idle_cv_.notify_all();
    }
}

std::vector<EventEnvelope> EventBus::GetHistory(std::optional<size_t> count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = history_.size();
    // A count of 0 means the whole history, same as no count.
    if (count && *count > 0 && *count < n) n = *count;

    std::vector<EventEnvelope> out;
    out.reserve(n);
    for (auto it = history_.end() - static_cast<std::ptrdiff_t>(n); it != history_.end(); ++it) {
        out.push_back(**it);
    }
    return out;
}

size_t EventBus::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventBus::ClearQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }
    Logger::Log(LogLevel::Warn, "Event queue cleared");
}

void EventBus::ClearHistory() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.clear();
    }
    Logger::Log(LogLevel::Debug, "Event history cleared");
}

EventBusStatistics EventBus::GetStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EventBusStatistics stats;
    for (const auto& [topic, slots] : handlers_) {
        stats.handlers_by_event[topic] = slots.size();
        stats.total_handlers += slots.size();
    }
    stats.pending_events = queue_.size();
    stats.history_size = history_.size();
    return stats;
}

void EventBus::Dispose() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [topic, slots] : handlers_) {
            for (auto& slot : slots) slot.state->active = false;
        }
        handlers_.clear();
        queue_.clear();
        history_.clear();
    }
    Logger::Log(LogLevel::Info, "Event bus disposed");
}

}
