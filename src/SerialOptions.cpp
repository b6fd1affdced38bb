#include "SerialOptions.hpp"

namespace UrSerial {

bool isValidDataBits(int dataBits) {
    return dataBits >= 5 && dataBits <= 8;
}

json flowControlToJson(FlowControl flowControl) {
    switch (flowControl) {
        case FlowControl::SOFTWARE: return "Software";
        case FlowControl::HARDWARE: return "Hardware";
        case FlowControl::NONE:
        default: return nullptr;
    }
}

json parityToJson(Parity parity) {
    switch (parity) {
        case Parity::ODD: return "Odd";
        case Parity::EVEN: return "Even";
        case Parity::NONE:
        default: return nullptr;
    }
}

bool flowControlFromJson(const json& value, FlowControl& out) {
    if (value.is_null()) {
        out = FlowControl::NONE;
        return true;
    }
    if (!value.is_string()) return false;

    const std::string name = value.get<std::string>();
    if (name == "Software") {
        out = FlowControl::SOFTWARE;
    } else if (name == "Hardware") {
        out = FlowControl::HARDWARE;
    } else if (name == "None" || name == "none") {
        out = FlowControl::NONE;
    } else {
        return false;
    }
    return true;
}

bool parityFromJson(const json& value, Parity& out) {
    if (value.is_null()) {
        out = Parity::NONE;
        return true;
    }
    if (!value.is_string()) return false;

    const std::string name = value.get<std::string>();
    if (name == "Odd") {
        out = Parity::ODD;
    } else if (name == "Even") {
        out = Parity::EVEN;
    } else if (name == "None" || name == "none") {
        out = Parity::NONE;
    } else {
        return false;
    }
    return true;
}

bool stopBitsFromInt(int value, StopBits& out) {
    switch (value) {
        case 1: out = StopBits::ONE; return true;
        case 2: out = StopBits::TWO; return true;
        default: return false;
    }
}

PortSettings portSettingsFromParams(const json& params) {
    PortSettings settings;

    settings.baudRate = params.at("baudRate").get<unsigned int>();

    if (params.contains("dataBits") && params["dataBits"].is_number_integer()) {
        const int dataBits = params["dataBits"].get<int>();
        if (isValidDataBits(dataBits)) {
            settings.dataBits = dataBits;
        }
    }
    if (params.contains("flowControl")) {
        FlowControl flowControl;
        if (flowControlFromJson(params["flowControl"], flowControl)) {
            settings.flowControl = flowControl;
        }
    }
    if (params.contains("parity")) {
        Parity parity;
        if (parityFromJson(params["parity"], parity)) {
            settings.parity = parity;
        }
    }
    if (params.contains("stopBits") && params["stopBits"].is_number_integer()) {
        StopBits stopBits;
        if (stopBitsFromInt(params["stopBits"].get<int>(), stopBits)) {
            settings.stopBits = stopBits;
        }
    }
    if (params.contains("timeout") && params["timeout"].is_number_unsigned()) {
        settings.timeoutMs = params["timeout"].get<unsigned int>();
    }

    return settings;
}

} // namespace UrSerial
