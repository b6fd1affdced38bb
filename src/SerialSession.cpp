#include "SerialSession.hpp"
#include "Logger.hpp"
#include "TextDecoder.hpp"
#include <algorithm>

namespace UrSerial {

namespace {

json awaitResult(std::future<json> pending, const std::string& command) {
    try {
        return pending.get();
    } catch (const RemoteError& e) {
        LOG_ERROR("[Serialport] " + command + " failed: " + std::string(e.what()) +
                  " (code: " + std::to_string(e.code()) + ")");
        throw;
    }
}

std::size_t byteCount(const json& result, const std::string& command) {
    if (!result.is_number_integer() || result.get<int64_t>() < 0) {
        throw SerialportError("Malformed response to " + command + ": " + result.dump());
    }
    return result.get<std::size_t>();
}

} // namespace

SerialSession::TransitionGuard::TransitionGuard(std::atomic<bool>& flag, const std::string& operation)
    : flag_(flag) {
    bool expected = false;
    if (!flag_.compare_exchange_strong(expected, true)) {
        throw ConflictError("Cannot " + operation + ": another open/close is in progress");
    }
}

SerialSession::TransitionGuard::~TransitionGuard() {
    flag_.store(false);
}

SerialSession::SerialSession(const SerialportOptions& options, CommandChannel& channel, EventFeed& feed)
    : channel_(channel),
      feed_(feed),
      path_(options.path),
      encoding_(options.encoding && !options.encoding->empty() ? *options.encoding : kDefaultEncoding),
      chunkSize_(options.size && *options.size > 0 ? *options.size : kDefaultChunkSize) {
    settings_.baudRate = options.baudRate;
    settings_.dataBits = options.dataBits && *options.dataBits != 0 ? *options.dataBits : kDefaultDataBits;
    settings_.flowControl = options.flowControl.value_or(kDefaultFlowControl);
    settings_.parity = options.parity.value_or(kDefaultParity);
    settings_.stopBits = options.stopBits.value_or(kDefaultStopBits);
    settings_.timeoutMs = options.timeout && *options.timeout > 0 ? *options.timeout : kDefaultTimeoutMs;
}

SerialSession::~SerialSession() {
    cancelListen();
    if (open_.load()) {
        LOG_WARNING("[Serialport] Session for " + path_ + " dropped while open; the driver still holds the port");
    }
}

std::vector<std::string> SerialSession::availablePorts(CommandChannel& channel) {
    json result = awaitResult(channel.call(Commands::kAvailablePorts), Commands::kAvailablePorts);
    if (!result.is_array()) {
        throw SerialportError("Malformed response to available_ports: " + result.dump());
    }

    std::vector<std::string> ports;
    for (const auto& entry : result) {
        if (entry.is_string()) {
            ports.push_back(entry.get<std::string>());
        }
    }
    return ports;
}

void SerialSession::forceClose(CommandChannel& channel, const std::string& path) {
    awaitResult(channel.call(Commands::kForceClose, {{"path", path}}), Commands::kForceClose);
    LOG_INFO("[Serialport] Force closed " + path);
}

void SerialSession::closeAll(CommandChannel& channel) {
    awaitResult(channel.call(Commands::kCloseAll), Commands::kCloseAll);
    LOG_INFO("[Serialport] Closed all serial ports");
}

void SerialSession::open() {
    TransitionGuard guard(transitioning_, "open");
    doOpen();
}

void SerialSession::close() {
    TransitionGuard guard(transitioning_, "close");
    doClose();
}

void SerialSession::setPath(const std::string& path) {
    reconfigure([this, &path]() {
        std::lock_guard<std::mutex> lock(configMutex_);
        path_ = path;
    });
}

void SerialSession::setBaudRate(unsigned int baudRate) {
    reconfigure([this, baudRate]() {
        std::lock_guard<std::mutex> lock(configMutex_);
        settings_.baudRate = baudRate;
    });
}

void SerialSession::change(const ChangeOptions& options) {
    reconfigure([this, &options]() {
        std::lock_guard<std::mutex> lock(configMutex_);
        if (options.path && !options.path->empty()) {
            path_ = *options.path;
        }
        if (options.baudRate && *options.baudRate != 0) {
            settings_.baudRate = *options.baudRate;
        }
    });
}

void SerialSession::reconfigure(const std::function<void()>& mutate) {
    TransitionGuard guard(transitioning_, "reconfigure");

    const bool wasOpen = open_.load();
    if (wasOpen) {
        doClose();
    }

    mutate();

    if (wasOpen) {
        doOpen();
    }
}

void SerialSession::doOpen() {
    json params;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        if (path_.empty()) {
            throw ValidationError("Path cannot be empty!");
        }
        if (settings_.baudRate == 0) {
            throw ValidationError("Baudrate cannot be empty!");
        }
    }

    if (open_.load()) {
        return;
    }

    params = openParams();
    awaitResult(channel_.call(Commands::kOpen, params), Commands::kOpen);
    open_.store(true);

    LOG_INFO("[Serialport] Opened " + params["path"].get<std::string>() + " at " +
             std::to_string(params["baudRate"].get<unsigned int>()) + " baud");
}

void SerialSession::doClose() {
    if (!open_.load()) {
        return;
    }

    const std::string devicePath = path();

    // In-flight reads go before the device does; the listener outlives the
    // close command so it can still see a final flush
    cancelRead();
    awaitResult(channel_.call(Commands::kClose, {{"path", devicePath}}), Commands::kClose);
    cancelListen();
    open_.store(false);

    LOG_INFO("[Serialport] Closed " + devicePath);
}

void SerialSession::read(const ReadOptions& options) {
    json params;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        params = {
            {"path", path_},
            {"timeout", options.timeout.value_or(settings_.timeoutMs)},
            {"size", options.size.value_or(chunkSize_)}
        };
    }
    awaitResult(channel_.call(Commands::kRead, params), Commands::kRead);
}

void SerialSession::cancelRead() {
    awaitResult(channel_.call(Commands::kCancelRead, {{"path", path()}}), Commands::kCancelRead);
}

std::size_t SerialSession::write(const std::string& text) {
    ensureOpen();
    json result = awaitResult(channel_.call(Commands::kWrite, {{"path", path()}, {"value", text}}),
                              Commands::kWrite);
    return byteCount(result, Commands::kWrite);
}

std::size_t SerialSession::writeBinary(const std::vector<uint8_t>& bytes) {
    ensureOpen();
    return writeBytes(bytes);
}

std::size_t SerialSession::writeBinary(const json& value) {
    ensureOpen();

    if (!value.is_array()) {
        throw ValidationError("Argument type error! Expected type: Uint8Array, number[]");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(value.size());
    for (const auto& element : value) {
        if (!element.is_number_integer()) {
            throw ValidationError("Argument type error! Expected type: Uint8Array, number[]");
        }
        const auto byte = element.get<int64_t>();
        if (byte < 0 || byte > 255) {
            throw ValidationError("Argument type error! Expected type: Uint8Array, number[]");
        }
        bytes.push_back(static_cast<uint8_t>(byte));
    }
    return writeBytes(bytes);
}

std::size_t SerialSession::writeBytes(const std::vector<uint8_t>& bytes) {
    json result = awaitResult(channel_.call(Commands::kWriteBinary, {{"path", path()}, {"value", bytes}}),
                              Commands::kWriteBinary);
    return byteCount(result, Commands::kWriteBinary);
}

void SerialSession::listen(TextCallback callback) {
    const std::string channel = readChannelName(path());
    const std::string encoding = encoding_;

    subscribe([this, callback, channel, encoding](const ReadEvent& event) {
        try {
            const std::size_t size = std::min(event.size, event.data.size());
            callback(TextDecoder::decode(event.data.data(), size, encoding));
        } catch (const std::exception& e) {
            reportListenerError(channel, e.what());
        }
    });
}

void SerialSession::listenBinary(BinaryCallback callback) {
    const std::string channel = readChannelName(path());

    subscribe([this, callback, channel](const ReadEvent& event) {
        try {
            const std::size_t size = std::min(event.size, event.data.size());
            callback(std::vector<uint8_t>(event.data.begin(), event.data.begin() + size));
        } catch (const std::exception& e) {
            reportListenerError(channel, e.what());
        }
    });
}

void SerialSession::subscribe(ReadEventHandler handler) {
    cancelListen();

    const std::string channel = readChannelName(path());
    std::unique_ptr<Subscription> subscription = feed_.subscribe(channel, std::move(handler));

    std::unique_ptr<Subscription> displaced;
    {
        std::lock_guard<std::mutex> lock(listenMutex_);
        displaced = std::move(subscription_);
        subscription_ = std::move(subscription);
    }
    if (displaced) {
        displaced->cancel();
    }

    LOG_INFO("[Serialport] Listening on " + channel);
}

void SerialSession::cancelListen() {
    std::unique_ptr<Subscription> released;
    {
        std::lock_guard<std::mutex> lock(listenMutex_);
        released = std::move(subscription_);
    }
    if (released) {
        released->cancel();
        LOG_DEBUG("[Serialport] Stopped listening on " + released->channel());
    }
}

bool SerialSession::isListening() const {
    std::lock_guard<std::mutex> lock(listenMutex_);
    return subscription_ && subscription_->isActive();
}

void SerialSession::setListenerErrorHandler(ListenerErrorHandler handler) {
    std::lock_guard<std::mutex> lock(listenMutex_);
    if (handler) {
        listenerErrorHandler_ = std::make_shared<ListenerErrorHandler>(std::move(handler));
    } else {
        listenerErrorHandler_.reset();
    }
}

void SerialSession::reportListenerError(const std::string& channel, const std::string& message) {
    ListenerError error(channel, message);
    LOG_ERROR("[Serialport] Listener failed on " + channel + ": " + message);

    std::shared_ptr<ListenerErrorHandler> handler;
    {
        std::lock_guard<std::mutex> lock(listenMutex_);
        handler = listenerErrorHandler_;
    }
    if (!handler) return;

    try {
        (*handler)(error);
    } catch (const std::exception& e) {
        LOG_ERROR("[Serialport] Listener error handler threw: " + std::string(e.what()));
    }
}

std::string SerialSession::path() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return path_;
}

unsigned int SerialSession::baudRate() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return settings_.baudRate;
}

json SerialSession::effectiveOptions() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return json{
        {"dataBits", settings_.dataBits},
        {"flowControl", flowControlToJson(settings_.flowControl)},
        {"parity", parityToJson(settings_.parity)},
        {"stopBits", static_cast<int>(settings_.stopBits)},
        {"timeout", settings_.timeoutMs},
        {"size", chunkSize_},
        {"encoding", encoding_}
    };
}

json SerialSession::openParams() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return json{
        {"path", path_},
        {"baudRate", settings_.baudRate},
        {"dataBits", settings_.dataBits},
        {"flowControl", flowControlToJson(settings_.flowControl)},
        {"parity", parityToJson(settings_.parity)},
        {"stopBits", static_cast<int>(settings_.stopBits)},
        {"timeout", settings_.timeoutMs}
    };
}

void SerialSession::ensureOpen() const {
    if (!open_.load()) {
        throw NotOpenError("Serial port " + path() + " is not opened!");
    }
}

} // namespace UrSerial
