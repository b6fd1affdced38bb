#pragma once
#include <future>
#include <string>
#include <nlohmann/json.hpp>

namespace UrSerial {

using json = nlohmann::json;

namespace Commands {
constexpr const char* kAvailablePorts = "available_ports";
constexpr const char* kForceClose = "force_close";
constexpr const char* kCloseAll = "close_all";
constexpr const char* kOpen = "open";
constexpr const char* kClose = "close";
constexpr const char* kRead = "read";
constexpr const char* kCancelRead = "cancel_read";
constexpr const char* kWrite = "write";
constexpr const char* kWriteBinary = "write_binary";
} // namespace Commands

/**
 * @brief Request/response boundary to the serial driver.
 *
 * call() never blocks on the driver: it returns a future that resolves with the
 * command's result (null for plain acknowledgements) or holds a RemoteError.
 */
class CommandChannel {
public:
    virtual ~CommandChannel() = default;

    virtual std::future<json> call(const std::string& command, const json& params) = 0;

    std::future<json> call(const std::string& command) {
        return call(command, json::object());
    }
};

} // namespace UrSerial
