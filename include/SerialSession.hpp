#pragma once
#include "CommandChannel.hpp"
#include "EventFeed.hpp"
#include "SerialOptions.hpp"
#include "SessionErrors.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace UrSerial {

/**
 * @brief Client-side handle for one serial device owned by a remote driver.
 *
 * Every remote step goes through the CommandChannel and is awaited before the
 * next one starts. Read data is never returned by read(); it arrives on the
 * EventFeed channel derived from the path and is handed to the listener.
 *
 * Concurrent open/close/reconfigure calls on the same session are rejected
 * with ConflictError. Other operations are not serialized by the session.
 */
class SerialSession {
public:
    using TextCallback = std::function<void(const std::string&)>;
    using BinaryCallback = std::function<void(const std::vector<uint8_t>&)>;
    using ListenerErrorHandler = std::function<void(const ListenerError&)>;

    SerialSession(const SerialportOptions& options, CommandChannel& channel, EventFeed& feed);
    ~SerialSession();

    SerialSession(const SerialSession&) = delete;
    SerialSession& operator=(const SerialSession&) = delete;

    // Session-independent driver operations
    static std::vector<std::string> availablePorts(CommandChannel& channel);
    static void forceClose(CommandChannel& channel, const std::string& path);
    static void closeAll(CommandChannel& channel);

    void open();
    void close();

    void setPath(const std::string& path);
    void setBaudRate(unsigned int baudRate);
    void change(const ChangeOptions& options);

    void read(const ReadOptions& options = ReadOptions{});
    void cancelRead();

    std::size_t write(const std::string& text);
    std::size_t writeBinary(const std::vector<uint8_t>& bytes);
    std::size_t writeBinary(const json& value);

    void listen(TextCallback callback);
    void listenBinary(BinaryCallback callback);
    void cancelListen();

    void setListenerErrorHandler(ListenerErrorHandler handler);

    bool isOpen() const { return open_.load(); }
    bool isListening() const;
    std::string path() const;
    unsigned int baudRate() const;
    const std::string& encoding() const { return encoding_; }
    unsigned int timeoutMs() const { return settings_.timeoutMs; }
    std::size_t chunkSize() const { return chunkSize_; }

    // {dataBits, flowControl, parity, stopBits, timeout, size, encoding}
    json effectiveOptions() const;

private:
    // Claims the exclusive transition flag for the lifetime of the guard
    class TransitionGuard {
    public:
        TransitionGuard(std::atomic<bool>& flag, const std::string& operation);
        ~TransitionGuard();

        TransitionGuard(const TransitionGuard&) = delete;
        TransitionGuard& operator=(const TransitionGuard&) = delete;

    private:
        std::atomic<bool>& flag_;
    };

    void doOpen();
    void doClose();
    // Runs `mutate` with the device closed, restoring the open state afterwards
    void reconfigure(const std::function<void()>& mutate);

    void subscribe(ReadEventHandler handler);
    void reportListenerError(const std::string& channel, const std::string& message);

    json openParams() const;
    void ensureOpen() const;
    std::size_t writeBytes(const std::vector<uint8_t>& bytes);

    CommandChannel& channel_;
    EventFeed& feed_;

    mutable std::mutex configMutex_;
    std::string path_;
    PortSettings settings_;
    std::string encoding_;
    std::size_t chunkSize_;

    std::atomic<bool> open_{false};
    std::atomic<bool> transitioning_{false};

    mutable std::mutex listenMutex_;
    std::unique_ptr<Subscription> subscription_;
    std::shared_ptr<ListenerErrorHandler> listenerErrorHandler_;
};

} // namespace UrSerial
