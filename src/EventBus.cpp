#include "EventBus.hpp"
#include "Logger.hpp"
#include <algorithm>

namespace UrSerial {

class EventBus::BusSubscription : public Subscription {
public:
    BusSubscription(std::weak_ptr<State> state, std::shared_ptr<Subscriber> subscriber)
        : state_(std::move(state)), subscriber_(std::move(subscriber)) {}

    ~BusSubscription() override {
        cancel();
    }

    void cancel() override {
        {
            // Waits for a delivery running on another thread
            std::lock_guard<std::recursive_mutex> lock(subscriber_->mutex);
            if (!subscriber_->active) return;
            subscriber_->active = false;
        }

        if (auto state = state_.lock()) {
            EventBus::removeSubscriber(*state, subscriber_);
        }
        LOG_DEBUG("Subscription cancelled on channel: " + subscriber_->channel);
    }

    bool isActive() const override {
        std::lock_guard<std::recursive_mutex> lock(subscriber_->mutex);
        return subscriber_->active;
    }

    const std::string& channel() const override {
        return subscriber_->channel;
    }

private:
    std::weak_ptr<State> state_;
    std::shared_ptr<Subscriber> subscriber_;
};

EventBus::~EventBus() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->channels.empty()) {
        LOG_DEBUG("EventBus destroyed with live subscriptions");
    }
}

std::unique_ptr<Subscription> EventBus::subscribe(const std::string& channel,
                                                  ReadEventHandler handler) {
    auto subscriber = std::make_shared<Subscriber>();
    subscriber->channel = channel;
    subscriber->handler = std::move(handler);

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        subscriber->id = state_->nextId++;
        state_->channels[channel].push_back(subscriber);
    }

    LOG_DEBUG("Subscribed to channel: " + channel);
    return std::make_unique<BusSubscription>(state_, subscriber);
}

std::size_t EventBus::publish(const std::string& channel, const ReadEvent& event) {
    std::vector<std::shared_ptr<Subscriber>> targets;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->channels.find(channel);
        if (it == state_->channels.end()) {
            return 0;
        }
        targets = it->second;
    }

    std::size_t delivered = 0;
    for (const auto& subscriber : targets) {
        std::lock_guard<std::recursive_mutex> lock(subscriber->mutex);
        if (!subscriber->active) continue;

        try {
            subscriber->handler(event);
            delivered++;
        } catch (const std::exception& e) {
            LOG_ERROR("Handler exception on channel " + channel + ": " + std::string(e.what()));
        }
    }
    return delivered;
}

std::size_t EventBus::subscriberCount(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->channels.find(channel);
    return it == state_->channels.end() ? 0 : it->second.size();
}

std::size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    std::size_t total = 0;
    for (const auto& entry : state_->channels) {
        total += entry.second.size();
    }
    return total;
}

void EventBus::removeSubscriber(State& state, const std::shared_ptr<Subscriber>& subscriber) {
    std::lock_guard<std::mutex> lock(state.mutex);
    auto it = state.channels.find(subscriber->channel);
    if (it == state.channels.end()) return;

    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), subscriber), list.end());
    if (list.empty()) {
        state.channels.erase(it);
    }
}

} // namespace UrSerial
