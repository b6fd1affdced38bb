#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace UrSerial {

using json = nlohmann::json;

enum class FlowControl {
    NONE,
    SOFTWARE,
    HARDWARE
};

enum class Parity {
    NONE,
    ODD,
    EVEN
};

enum class StopBits {
    ONE = 1,
    TWO = 2
};

constexpr int kDefaultDataBits = 8;
constexpr FlowControl kDefaultFlowControl = FlowControl::NONE;
constexpr Parity kDefaultParity = Parity::NONE;
constexpr StopBits kDefaultStopBits = StopBits::TWO;
constexpr unsigned int kDefaultTimeoutMs = 200;
constexpr std::size_t kDefaultChunkSize = 1024;
constexpr const char* kDefaultEncoding = "utf-8";

// Construction surface of a session. Only path and baudRate are required,
// and even those are checked at open() time, not here.
struct SerialportOptions {
    std::string path;
    unsigned int baudRate = 0;
    std::optional<std::string> encoding;
    std::optional<int> dataBits;
    std::optional<FlowControl> flowControl;
    std::optional<Parity> parity;
    std::optional<StopBits> stopBits;
    std::optional<unsigned int> timeout;
    std::optional<std::size_t> size;
};

// Per-call overrides for read()
struct ReadOptions {
    std::optional<unsigned int> timeout;
    std::optional<std::size_t> size;
};

// Fields accepted by change(); empty values leave the field untouched
struct ChangeOptions {
    std::optional<std::string> path;
    std::optional<unsigned int> baudRate;
};

// Line settings as the driver applies them
struct PortSettings {
    unsigned int baudRate = 0;
    int dataBits = kDefaultDataBits;
    FlowControl flowControl = kDefaultFlowControl;
    Parity parity = kDefaultParity;
    StopBits stopBits = kDefaultStopBits;
    unsigned int timeoutMs = kDefaultTimeoutMs;
};

bool isValidDataBits(int dataBits);

// Wire form: none is null, otherwise "Software"/"Hardware" and "Odd"/"Even"
json flowControlToJson(FlowControl flowControl);
json parityToJson(Parity parity);
bool flowControlFromJson(const json& value, FlowControl& out);
bool parityFromJson(const json& value, Parity& out);
bool stopBitsFromInt(int value, StopBits& out);

// Lenient decoding used on the driver side: anything unrecognised falls back
// to the default (8 data bits, no flow control, no parity, two stop bits)
PortSettings portSettingsFromParams(const json& params);

} // namespace UrSerial
