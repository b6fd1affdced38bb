#pragma once
#include "CommandChannel.hpp"
#include "EventBus.hpp"
#include "PortEnumerator.hpp"
#include "SerialPort.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace UrSerial {

/**
 * @brief In-process serial driver exposed through the CommandChannel interface.
 *
 * Owns the open ports of this process. A `read` command starts a background
 * reader per port that publishes every received chunk to the EventBus on the
 * port's read channel until `cancel_read`, `close` or `force_close`.
 * Commands run synchronously; the returned future is always ready.
 */
class LocalDriver : public CommandChannel {
public:
    explicit LocalDriver(EventBus& events,
                         std::vector<std::string> devicePathFilters = PortEnumerator::defaultFilters());
    ~LocalDriver() override;

    LocalDriver(const LocalDriver&) = delete;
    LocalDriver& operator=(const LocalDriver&) = delete;

    // Upper bounds accepted by `read`; larger values are rejected with kInvalidParams
    static constexpr uint64_t kMaxChunkSize = 1024 * 1024;
    static constexpr uint64_t kMaxReadTimeoutMs = std::numeric_limits<int>::max();

    using CommandChannel::call;
    std::future<json> call(const std::string& command, const json& params) override;

    std::vector<std::string> openPorts() const;
    bool isReading(const std::string& path) const;

private:
    using Handler = std::function<json(const json&)>;

    struct Reader {
        std::shared_ptr<std::atomic<bool>> running;
        std::thread thread;
    };

    struct PortEntry {
        std::shared_ptr<SerialPort> port;
        std::unique_ptr<Reader> reader;
    };

    void initializeHandlers();

    json handleAvailablePorts(const json& params);
    json handleOpen(const json& params);
    json handleClose(const json& params);
    json handleCloseAll(const json& params);
    json handleForceClose(const json& params);
    json handleRead(const json& params);
    json handleCancelRead(const json& params);
    json handleWrite(const json& params);
    json handleWriteBinary(const json& params);

    // Reads an optional non-negative integer; absent or 0 yields defaultValue
    static uint64_t boundedParam(const json& params, const std::string& key,
                                 uint64_t defaultValue, uint64_t maxValue);

    std::shared_ptr<SerialPort> findPort(const std::string& path) const;
    std::unique_ptr<Reader> startReader(const std::string& path,
                                        std::shared_ptr<SerialPort> port,
                                        unsigned int timeoutMs,
                                        std::vector<uint8_t> buffer);
    static void stopReader(std::unique_ptr<Reader> reader);
    void releaseAll();

    EventBus& events_;
    PortEnumerator enumerator_;
    std::unordered_map<std::string, Handler> handlers_;

    mutable std::mutex portsMutex_;
    std::map<std::string, PortEntry> ports_;
};

} // namespace UrSerial
