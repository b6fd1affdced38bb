#include "JsonRpcChannel.hpp"
#include "Logger.hpp"
#include "RpcMessageTypes.hpp"
#include "SessionErrors.hpp"

namespace UrSerial {

JsonRpcChannel::JsonRpcChannel(PublishFunction publish, EventBus& events, RpcTopics topics)
    : publish_(std::move(publish)), events_(events), topics_(std::move(topics)) {
    LOG_INFO("[RPC] JSON-RPC channel ready, requests on " + topics_.requestTopic);
}

JsonRpcChannel::~JsonRpcChannel() {
    shutdown();
}

std::future<json> JsonRpcChannel::call(const std::string& command, const json& params) {
    std::promise<json> promise;
    std::future<json> result = promise.get_future();

    RpcRequest request = RpcMessageFactory::createCommandRequest(command, params, topics_.service);
    const std::string payload = RpcMessageFactory::serializeRequest(request).dump();

    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        if (shutdown_) {
            promise.set_exception(std::make_exception_ptr(
                RemoteError(ErrorCode::kChannelClosed, "RPC channel is shut down")));
            return result;
        }
        pending_.emplace(request.id, std::move(promise));
    }

    try {
        publish_(topics_.requestTopic, payload);
        LOG_DEBUG("[RPC] Sent " + request.method + " (id: " + request.id + ")");
    } catch (const std::exception& e) {
        LOG_ERROR("[RPC] Failed to send RPC request: " + std::string(e.what()));

        std::lock_guard<std::mutex> lock(pendingMutex_);
        auto it = pending_.find(request.id);
        if (it != pending_.end()) {
            it->second.set_exception(std::make_exception_ptr(
                RemoteError(ErrorCode::kChannelClosed, "Failed to send request: " + std::string(e.what()))));
            pending_.erase(it);
        }
    }

    return result;
}

void JsonRpcChannel::onMessage(const std::string& topic, const std::string& payload) {
    json message;
    try {
        message = json::parse(payload);
    } catch (const json::parse_error& e) {
        LOG_WARNING("[RPC] Ignoring malformed message on " + topic + ": " + std::string(e.what()));
        return;
    }

    try {
        if (RpcMessageFactory::isResponse(message)) {
            handleResponse(message);
        } else if (RpcMessageFactory::isNotification(message)) {
            handleNotification(message);
        } else {
            LOG_DEBUG("[RPC] Unhandled message on " + topic);
        }
    } catch (const json::exception& e) {
        LOG_WARNING("[RPC] Failed to process message on " + topic + ": " + std::string(e.what()));
    }
}

void JsonRpcChannel::handleResponse(const json& message) {
    RpcResponse response = RpcMessageFactory::parseResponse(message);

    std::promise<json> promise;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        auto it = pending_.find(response.id);
        if (it == pending_.end()) {
            LOG_DEBUG("[RPC] Response for unknown request id: " + response.id);
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }

    if (response.isError) {
        promise.set_exception(std::make_exception_ptr(
            RemoteError(response.errorCode, response.errorMessage)));
    } else {
        promise.set_value(response.result);
    }
}

void JsonRpcChannel::handleNotification(const json& message) {
    RpcNotification notification = RpcMessageFactory::parseNotification(message);
    if (notification.method.compare(0, kReadChannelPrefix.size(), kReadChannelPrefix) != 0) {
        LOG_DEBUG("[RPC] Unhandled notification: " + notification.method);
        return;
    }

    ReadEvent event;
    if (!RpcMessageFactory::parseReadEvent(notification.params, event)) {
        LOG_WARNING("[RPC] Malformed read notification on " + notification.method);
        return;
    }
    events_.publish(notification.method, event);
}

void JsonRpcChannel::shutdown() {
    std::map<std::string, std::promise<json>> abandoned;
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        if (shutdown_) return;
        shutdown_ = true;
        abandoned.swap(pending_);
    }

    for (auto& entry : abandoned) {
        entry.second.set_exception(std::make_exception_ptr(
            RemoteError(ErrorCode::kChannelClosed, "RPC channel is shut down")));
    }

    if (!abandoned.empty()) {
        LOG_WARNING("[RPC] Shut down with " + std::to_string(abandoned.size()) + " pending request(s)");
    }
}

std::size_t JsonRpcChannel::pendingCount() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_.size();
}

} // namespace UrSerial
