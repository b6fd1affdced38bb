#pragma once
#include "EventFeed.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace UrSerial {

/**
 * @brief In-process event feed.
 *
 * publish() runs handlers synchronously on the publishing thread. Each
 * subscriber is guarded by its own recursive mutex so that cancel() from
 * another thread waits for an in-flight delivery to finish, while a handler
 * may still cancel (or replace) its own subscription.
 */
class EventBus : public EventFeed {
public:
    EventBus() = default;
    ~EventBus() override;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    std::unique_ptr<Subscription> subscribe(const std::string& channel,
                                            ReadEventHandler handler) override;

    // Returns the number of handlers the event was delivered to
    std::size_t publish(const std::string& channel, const ReadEvent& event);

    std::size_t subscriberCount(const std::string& channel) const;
    std::size_t subscriberCount() const;

private:
    struct Subscriber {
        uint64_t id = 0;
        std::string channel;
        ReadEventHandler handler;
        bool active = true;
        std::recursive_mutex mutex;
    };

    // Shared with every BusSubscription so a subscription outliving the bus is harmless
    struct State {
        std::mutex mutex;
        uint64_t nextId = 1;
        std::map<std::string, std::vector<std::shared_ptr<Subscriber>>> channels;
    };

    class BusSubscription;

    static void removeSubscriber(State& state, const std::shared_ptr<Subscriber>& subscriber);

    std::shared_ptr<State> state_ = std::make_shared<State>();
};

} // namespace UrSerial
