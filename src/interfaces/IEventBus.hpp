#pragma once
#include <any>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include "../events/EventTypes.hpp"

namespace TierCache {

class IEventBus {
public:
    using Handler = std::function<void(const EventEnvelope&)>;
    using Unsubscribe = std::function<void()>;

    template <typename T>
    struct PayloadHandler {
        using type = std::function<void(const T&)>;
    };

    virtual ~IEventBus() = default;

    virtual Unsubscribe On(const std::string& topic, Handler handler) = 0;
    // Unregisters after the first invocation that returns normally.
    virtual void Once(const std::string& topic, Handler handler) = 0;
    // Returns once the envelope has been dispatched to every handler of its topic.
    virtual void Emit(const std::string& topic, std::any data, EventPriority priority = EventPriority::Normal) = 0;
    // Oldest first. count selects the newest `count` envelopes.
    virtual std::vector<EventEnvelope> GetHistory(std::optional<size_t> count = std::nullopt) const = 0;

    // Payload-only handlers for typed topics. A payload of the wrong type
    // surfaces as a handler failure.
    template <typename T>
    Unsubscribe On(const EventType<T>& type, typename PayloadHandler<T>::type handler) {
        return On(std::string(type.name), [handler = std::move(handler)](const EventEnvelope& event) {
            handler(std::any_cast<const T&>(event.data));
        });
    }

    template <typename T>
    void Emit(const EventType<T>& type, const std::remove_cv_t<T>& data, EventPriority priority = EventPriority::Normal) {
        Emit(std::string(type.name), std::any(data), priority);
    }
};

}
