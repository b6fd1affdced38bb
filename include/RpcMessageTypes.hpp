#pragma once
#include "EventFeed.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace UrSerial {

using json = nlohmann::json;

constexpr const char* kPluginMethodPrefix = "plugin:serialport|";

/**
 * @brief JSON-RPC 2.0 request as published to the driver's request topic
 */
struct RpcRequest {
    std::string id;
    std::string method;
    std::string service;
    std::string authority = "USER";
    json params = json::object();
};

/**
 * @brief Response to a request; either a result or an {code, message} error
 */
struct RpcResponse {
    std::string id;
    json result;
    bool isError = false;
    int errorCode = 0;
    std::string errorMessage;
};

/**
 * @brief Message without an id pushed by the driver (read data)
 */
struct RpcNotification {
    std::string method;
    json params;
};

class RpcMessageFactory {
public:
    static RpcRequest createCommandRequest(const std::string& command, const json& params,
                                           const std::string& service);
    static json serializeRequest(const RpcRequest& request);

    static bool isResponse(const json& message);
    static bool isNotification(const json& message);

    static RpcResponse parseResponse(const json& message);
    static RpcNotification parseNotification(const json& message);

    // Reads {size, data} from notification params; false when malformed
    static bool parseReadEvent(const json& params, ReadEvent& out);

    static std::string generateTransactionId();

private:
    static std::string idToString(const json& id);
};

} // namespace UrSerial
