#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace UrSerial {

// Payload pushed on a read channel. Only the first `size` bytes of data are meaningful.
struct ReadEvent {
    std::size_t size = 0;
    std::vector<uint8_t> data;
};

using ReadEventHandler = std::function<void(const ReadEvent&)>;

const std::string kReadChannelPrefix = "plugin-serialport-read-";

// Channel the driver publishes read data for `path` on
inline std::string readChannelName(const std::string& path) {
    return kReadChannelPrefix + path;
}

/**
 * @brief Active registration on an event feed.
 *
 * cancel() is idempotent. Once it returns, the handler is not invoked again.
 * Destroying the subscription cancels it.
 */
class Subscription {
public:
    virtual ~Subscription() = default;

    virtual void cancel() = 0;
    virtual bool isActive() const = 0;
    virtual const std::string& channel() const = 0;
};

/**
 * @brief Push boundary delivering read data per device channel.
 */
class EventFeed {
public:
    virtual ~EventFeed() = default;

    virtual std::unique_ptr<Subscription> subscribe(const std::string& channel,
                                                    ReadEventHandler handler) = 0;
};

} // namespace UrSerial
