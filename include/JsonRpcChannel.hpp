#pragma once
#include "CommandChannel.hpp"
#include "EventBus.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace UrSerial {

struct RpcTopics {
    std::string service = "ur-serialport";
    std::string requestTopic = "direct_messaging/ur-serialport/requests";
    std::string responseTopic = "direct_messaging/ur-serialport/responses";
};

/**
 * @brief CommandChannel speaking JSON-RPC 2.0 over a message transport.
 *
 * Requests are handed to the publish function; whatever carries them (an MQTT
 * client, a socket) calls onMessage() for every message coming back.
 * Responses resolve the pending call with the same id. Notifications whose
 * method is a read channel name are republished on the EventBus.
 */
class JsonRpcChannel : public CommandChannel {
public:
    using PublishFunction = std::function<void(const std::string& topic, const std::string& payload)>;

    JsonRpcChannel(PublishFunction publish, EventBus& events, RpcTopics topics = RpcTopics{});
    ~JsonRpcChannel() override;

    JsonRpcChannel(const JsonRpcChannel&) = delete;
    JsonRpcChannel& operator=(const JsonRpcChannel&) = delete;

    using CommandChannel::call;
    std::future<json> call(const std::string& command, const json& params) override;

    void onMessage(const std::string& topic, const std::string& payload);

    // Fails every pending call; later calls fail immediately
    void shutdown();

    std::size_t pendingCount() const;
    const RpcTopics& topics() const { return topics_; }

private:
    void handleResponse(const json& message);
    void handleNotification(const json& message);

    PublishFunction publish_;
    EventBus& events_;
    RpcTopics topics_;

    mutable std::mutex pendingMutex_;
    std::map<std::string, std::promise<json>> pending_;
    bool shutdown_ = false;
};

} // namespace UrSerial
