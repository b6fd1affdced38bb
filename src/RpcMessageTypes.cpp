#include "RpcMessageTypes.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>

namespace UrSerial {

RpcRequest RpcMessageFactory::createCommandRequest(const std::string& command, const json& params,
                                                   const std::string& service) {
    RpcRequest request;
    request.id = generateTransactionId();
    request.method = std::string(kPluginMethodPrefix) + command;
    request.service = service;
    request.params = params.is_null() ? json::object() : params;
    return request;
}

json RpcMessageFactory::serializeRequest(const RpcRequest& request) {
    return json{
        {"jsonrpc", "2.0"},
        {"method", request.method},
        {"service", request.service},
        {"authority", request.authority},
        {"id", request.id},
        {"params", request.params}
    };
}

bool RpcMessageFactory::isResponse(const json& message) {
    return message.is_object() && message.contains("id") && !message["id"].is_null() &&
           (message.contains("result") || message.contains("error"));
}

bool RpcMessageFactory::isNotification(const json& message) {
    return message.is_object() && message.contains("method") && message["method"].is_string() &&
           (!message.contains("id") || message["id"].is_null());
}

RpcResponse RpcMessageFactory::parseResponse(const json& message) {
    RpcResponse response;
    response.id = idToString(message.at("id"));

    if (message.contains("error") && !message["error"].is_null()) {
        const json& error = message["error"];
        response.isError = true;
        if (error.is_object()) {
            if (error.contains("code") && error["code"].is_number_integer()) {
                response.errorCode = error["code"].get<int>();
            }
            if (error.contains("message") && error["message"].is_string()) {
                response.errorMessage = error["message"].get<std::string>();
            } else {
                response.errorMessage = error.dump();
            }
        } else if (error.is_string()) {
            response.errorMessage = error.get<std::string>();
        } else {
            response.errorMessage = error.dump();
        }
    } else {
        response.result = message.value("result", json());
    }
    return response;
}

RpcNotification RpcMessageFactory::parseNotification(const json& message) {
    RpcNotification notification;
    notification.method = message.at("method").get<std::string>();
    notification.params = message.value("params", json::object());
    return notification;
}

bool RpcMessageFactory::parseReadEvent(const json& params, ReadEvent& out) {
    if (!params.is_object() || !params.contains("data") || !params["data"].is_array()) {
        return false;
    }

    std::vector<uint8_t> data;
    data.reserve(params["data"].size());
    for (const auto& element : params["data"]) {
        if (!element.is_number_integer() || element.get<int64_t>() < 0 || element.get<int64_t>() > 255) {
            return false;
        }
        data.push_back(static_cast<uint8_t>(element.get<int64_t>()));
    }

    std::size_t size = data.size();
    if (params.contains("size") && params["size"].is_number_integer() && params["size"].get<int64_t>() >= 0) {
        size = std::min(params["size"].get<std::size_t>(), data.size());
    }

    out.size = size;
    out.data = std::move(data);
    return true;
}

std::string RpcMessageFactory::generateTransactionId() {
    static std::atomic<uint64_t> counter{0};
    auto now = std::chrono::system_clock::now();
    auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return std::to_string(timestamp) + "-" + std::to_string(++counter);
}

std::string RpcMessageFactory::idToString(const json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    return id.dump();
}

} // namespace UrSerial
