#pragma once
#include <stdexcept>
#include <string>

namespace UrSerial {

/**
 * @brief Base of every failure raised by the serial session layer.
 *
 * Locally-detected failures carry only a message. Failures reported by the
 * command channel are RemoteError and carry the channel's code as well.
 */
class SerialportError : public std::runtime_error {
public:
    explicit SerialportError(const std::string& message)
        : std::runtime_error(message) {}
};

// Rejected locally before any remote call (missing path/baud, bad payload type)
class ValidationError : public SerialportError {
public:
    explicit ValidationError(const std::string& message)
        : SerialportError(message) {}
};

// Write attempted while the session is closed
class NotOpenError : public SerialportError {
public:
    explicit NotOpenError(const std::string& message)
        : SerialportError(message) {}
};

// Another open/close/reconfigure is already running on the same session
class ConflictError : public SerialportError {
public:
    explicit ConflictError(const std::string& message)
        : SerialportError(message) {}
};

/**
 * @brief Failure returned by the command channel, passed through unchanged.
 */
class RemoteError : public SerialportError {
public:
    RemoteError(int code, const std::string& message)
        : SerialportError(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

/**
 * @brief A listener callback (or the decoding in front of it) failed for one delivery.
 *
 * Never thrown to the caller of listen(); handed to the session's listener
 * error handler and logged.
 */
class ListenerError : public SerialportError {
public:
    ListenerError(const std::string& channel, const std::string& message)
        : SerialportError(message), channel_(channel) {}

    const std::string& channel() const noexcept { return channel_; }

private:
    std::string channel_;
};

namespace ErrorCode {
constexpr int kChannelClosed = -32000;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kPortNotFound = 1001;
constexpr int kPortAlreadyOpen = 1002;
constexpr int kPortNotOpened = 1003;
constexpr int kOpenFailed = 1004;
constexpr int kIoFailure = 1005;
} // namespace ErrorCode

} // namespace UrSerial
