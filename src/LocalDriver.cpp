#include "LocalDriver.hpp"
#include "Logger.hpp"
#include "SessionErrors.hpp"
#include <chrono>

namespace UrSerial {

LocalDriver::LocalDriver(EventBus& events, std::vector<std::string> devicePathFilters)
    : events_(events), enumerator_(std::move(devicePathFilters)) {
    initializeHandlers();
}

LocalDriver::~LocalDriver() {
    releaseAll();
}

void LocalDriver::initializeHandlers() {
    handlers_[Commands::kAvailablePorts] = [this](const json& p) { return handleAvailablePorts(p); };
    handlers_[Commands::kOpen] = [this](const json& p) { return handleOpen(p); };
    handlers_[Commands::kClose] = [this](const json& p) { return handleClose(p); };
    handlers_[Commands::kCloseAll] = [this](const json& p) { return handleCloseAll(p); };
    handlers_[Commands::kForceClose] = [this](const json& p) { return handleForceClose(p); };
    handlers_[Commands::kRead] = [this](const json& p) { return handleRead(p); };
    handlers_[Commands::kCancelRead] = [this](const json& p) { return handleCancelRead(p); };
    handlers_[Commands::kWrite] = [this](const json& p) { return handleWrite(p); };
    handlers_[Commands::kWriteBinary] = [this](const json& p) { return handleWriteBinary(p); };
}

std::future<json> LocalDriver::call(const std::string& command, const json& params) {
    std::promise<json> promise;
    std::future<json> result = promise.get_future();

    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        promise.set_exception(std::make_exception_ptr(
            RemoteError(ErrorCode::kMethodNotFound, "Unknown command: " + command)));
        return result;
    }

    try {
        promise.set_value(it->second(params));
    } catch (const RemoteError&) {
        promise.set_exception(std::current_exception());
    } catch (const json::exception& e) {
        promise.set_exception(std::make_exception_ptr(
            RemoteError(ErrorCode::kInvalidParams, "Invalid params for " + command + ": " + e.what())));
    } catch (const std::exception& e) {
        promise.set_exception(std::make_exception_ptr(
            RemoteError(ErrorCode::kIoFailure, e.what())));
    }
    return result;
}

json LocalDriver::handleAvailablePorts(const json&) {
    std::vector<std::string> ports;
    try {
        ports = enumerator_.enumerate();
    } catch (const std::runtime_error& e) {
        throw RemoteError(ErrorCode::kIoFailure, "Failed to list serial ports: " + std::string(e.what()));
    }
    LOG_INFO("Serial ports: " + json(ports).dump());
    return ports;
}

json LocalDriver::handleOpen(const json& params) {
    const std::string path = params.at("path").get<std::string>();
    const PortSettings settings = portSettingsFromParams(params);

    std::lock_guard<std::mutex> lock(portsMutex_);
    if (ports_.count(path) > 0) {
        throw RemoteError(ErrorCode::kPortAlreadyOpen, "Serial port " + path + " is already open!");
    }

    auto port = std::make_shared<SerialPort>(path);
    if (!port->open(settings)) {
        throw RemoteError(ErrorCode::kOpenFailed, "Error opening " + path + ": " + port->lastError());
    }

    PortEntry entry;
    entry.port = std::move(port);
    ports_.emplace(path, std::move(entry));

    LOG_INFO("Opened serial port " + path + " at " + std::to_string(settings.baudRate) + " baud");
    return nullptr;
}

json LocalDriver::handleClose(const json& params) {
    const std::string path = params.at("path").get<std::string>();

    PortEntry entry;
    {
        std::lock_guard<std::mutex> lock(portsMutex_);
        auto it = ports_.find(path);
        if (it == ports_.end()) {
            throw RemoteError(ErrorCode::kPortNotOpened, "Serial port " + path + " is not opened!");
        }
        entry = std::move(it->second);
        ports_.erase(it);
    }

    // The port itself closes once the reader has let go of it
    stopReader(std::move(entry.reader));
    LOG_INFO("Closed serial port " + path);
    return nullptr;
}

json LocalDriver::handleCloseAll(const json&) {
    releaseAll();
    LOG_INFO("Closed all serial ports");
    return nullptr;
}

json LocalDriver::handleForceClose(const json& params) {
    const std::string path = params.at("path").get<std::string>();

    PortEntry entry;
    {
        std::lock_guard<std::mutex> lock(portsMutex_);
        auto it = ports_.find(path);
        if (it == ports_.end()) {
            return nullptr;
        }
        entry = std::move(it->second);
        ports_.erase(it);
    }

    stopReader(std::move(entry.reader));
    LOG_INFO("Force closed serial port " + path);
    return nullptr;
}

uint64_t LocalDriver::boundedParam(const json& params, const std::string& key,
                                   uint64_t defaultValue, uint64_t maxValue) {
    if (!params.contains(key) || params[key].is_null()) {
        return defaultValue;
    }
    const json& value = params[key];
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw RemoteError(ErrorCode::kInvalidParams, key + " must be a non-negative integer");
    }
    const uint64_t result = value.get<uint64_t>();
    if (result > maxValue) {
        throw RemoteError(ErrorCode::kInvalidParams,
                          key + " exceeds the maximum of " + std::to_string(maxValue));
    }
    return result == 0 ? defaultValue : result;
}

json LocalDriver::handleRead(const json& params) {
    const std::string path = params.at("path").get<std::string>();
    const auto timeoutMs = static_cast<unsigned int>(
        boundedParam(params, "timeout", kDefaultTimeoutMs, kMaxReadTimeoutMs));
    const auto size = static_cast<std::size_t>(
        boundedParam(params, "size", kDefaultChunkSize, kMaxChunkSize));

    std::lock_guard<std::mutex> lock(portsMutex_);
    auto it = ports_.find(path);
    if (it == ports_.end()) {
        throw RemoteError(ErrorCode::kPortNotFound, "Serial port not found");
    }

    if (it->second.reader) {
        LOG_INFO("Serial port " + path + " is already being read!");
        return nullptr;
    }

    it->second.reader = startReader(path, it->second.port, timeoutMs, std::vector<uint8_t>(size));
    return nullptr;
}

json LocalDriver::handleCancelRead(const json& params) {
    const std::string path = params.at("path").get<std::string>();

    std::unique_ptr<Reader> reader;
    {
        std::lock_guard<std::mutex> lock(portsMutex_);
        auto it = ports_.find(path);
        if (it == ports_.end()) {
            throw RemoteError(ErrorCode::kPortNotFound, "Serial port not found");
        }
        reader = std::move(it->second.reader);
    }

    if (reader) {
        stopReader(std::move(reader));
        LOG_INFO("Cancelling " + path + " serial read");
    }
    return nullptr;
}

json LocalDriver::handleWrite(const json& params) {
    const std::string path = params.at("path").get<std::string>();
    const std::string value = params.at("value").get<std::string>();

    auto port = findPort(path);
    const int written = port->write(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    if (written < 0) {
        throw RemoteError(ErrorCode::kIoFailure,
                          "Error writing to serial port " + path + ": " + port->lastError());
    }
    return static_cast<std::size_t>(written);
}

json LocalDriver::handleWriteBinary(const json& params) {
    const std::string path = params.at("path").get<std::string>();
    const json& value = params.at("value");

    if (!value.is_array()) {
        throw RemoteError(ErrorCode::kInvalidParams, "write_binary expects an array of bytes");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(value.size());
    for (const auto& element : value) {
        if (!element.is_number_integer() || element.get<int64_t>() < 0 || element.get<int64_t>() > 255) {
            throw RemoteError(ErrorCode::kInvalidParams, "write_binary expects an array of bytes");
        }
        bytes.push_back(static_cast<uint8_t>(element.get<int64_t>()));
    }

    auto port = findPort(path);
    const int written = port->write(bytes.data(), bytes.size());
    if (written < 0) {
        throw RemoteError(ErrorCode::kIoFailure,
                          "Error writing to serial port " + path + ": " + port->lastError());
    }
    return static_cast<std::size_t>(written);
}

std::shared_ptr<SerialPort> LocalDriver::findPort(const std::string& path) const {
    std::lock_guard<std::mutex> lock(portsMutex_);
    auto it = ports_.find(path);
    if (it == ports_.end()) {
        throw RemoteError(ErrorCode::kPortNotFound, "Serial port not found");
    }
    return it->second.port;
}

std::unique_ptr<LocalDriver::Reader> LocalDriver::startReader(const std::string& path,
                                                              std::shared_ptr<SerialPort> port,
                                                              unsigned int timeoutMs,
                                                              std::vector<uint8_t> buffer) {
    auto reader = std::make_unique<Reader>();
    reader->running = std::make_shared<std::atomic<bool>>(true);

    std::shared_ptr<std::atomic<bool>> running = reader->running;
    EventBus& events = events_;
    const std::string channel = readChannelName(path);

    reader->thread = std::thread([running, port, &events, channel, path, timeoutMs,
                                  buffer = std::move(buffer)]() mutable {
        LOG_INFO("Starting to read serial port " + path + "!");

        try {
            while (running->load()) {
                const int n = port->read(buffer.data(), buffer.size(), static_cast<int>(timeoutMs));
                if (n > 0) {
                    ReadEvent event;
                    event.size = static_cast<std::size_t>(n);
                    event.data.assign(buffer.begin(), buffer.begin() + n);
                    LOG_DEBUG("Serial port " + path + " read data: " + std::to_string(n));
                    events.publish(channel, event);
                } else if (n < 0) {
                    LOG_WARNING("Read error on " + path + ": " + port->lastError());
                    std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Reader for serial port " + path + " stopped: " + std::string(e.what()));
            running->store(false);
        }

        LOG_INFO("Done reading serial port " + path + "!");
    });

    return reader;
}

void LocalDriver::stopReader(std::unique_ptr<Reader> reader) {
    if (!reader) return;

    reader->running->store(false);
    if (!reader->thread.joinable()) return;

    if (reader->thread.get_id() == std::this_thread::get_id()) {
        // Stopped from a listener running on the reader itself; it exits after the callback returns
        reader->thread.detach();
    } else {
        reader->thread.join();
    }
}

void LocalDriver::releaseAll() {
    std::map<std::string, PortEntry> released;
    {
        std::lock_guard<std::mutex> lock(portsMutex_);
        released.swap(ports_);
    }

    for (auto& entry : released) {
        stopReader(std::move(entry.second.reader));
    }
}

std::vector<std::string> LocalDriver::openPorts() const {
    std::lock_guard<std::mutex> lock(portsMutex_);
    std::vector<std::string> paths;
    for (const auto& entry : ports_) {
        paths.push_back(entry.first);
    }
    return paths;
}

bool LocalDriver::isReading(const std::string& path) const {
    std::lock_guard<std::mutex> lock(portsMutex_);
    auto it = ports_.find(path);
    return it != ports_.end() && it->second.reader && it->second.reader->running->load();
}

} // namespace UrSerial
