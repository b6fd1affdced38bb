#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include "PortEnumerator.hpp"
#include <fstream>

namespace UrSerial {

ConfigLoader::ConfigLoader() {
    setDefaults();
}

bool ConfigLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARNING("Config file not found: " + filename + ", using defaults");
        return false;
    }
    
    try {
        json j;
        file >> j;
        return loadSessionConfig(j);
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing config file: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadFromString(const std::string& content) {
    try {
        return loadSessionConfig(json::parse(content));
    } catch (const std::exception& e) {
        LOG_ERROR("Error parsing config: " + std::string(e.what()));
        return false;
    }
}

bool ConfigLoader::loadSessionConfig(const json& j) {
    if (!j.is_object()) {
        LOG_ERROR("Configuration must be a JSON object");
        return false;
    }

    // Parse into a copy so a rejected file leaves the previous config intact
    SessionConfig config = config_;
    SerialportOptions& serial = config.serial;

    if (j.contains("path")) {
        serial.path = j["path"].get<std::string>();
    }
    if (j.contains("baudRate")) {
        serial.baudRate = j["baudRate"].get<unsigned int>();
    }
    if (j.contains("encoding")) {
        serial.encoding = j["encoding"].get<std::string>();
    }
    if (j.contains("dataBits")) {
        const int dataBits = j["dataBits"].get<int>();
        if (!isValidDataBits(dataBits)) {
            LOG_ERROR("Invalid dataBits: " + std::to_string(dataBits) + " (expected 5, 6, 7 or 8)");
            return false;
        }
        serial.dataBits = dataBits;
    }
    if (j.contains("flowControl")) {
        FlowControl flowControl;
        if (!flowControlFromJson(j["flowControl"], flowControl)) {
            LOG_ERROR("Invalid flowControl: " + j["flowControl"].dump() + " (expected null, \"Software\" or \"Hardware\")");
            return false;
        }
        serial.flowControl = flowControl;
    }
    if (j.contains("parity")) {
        Parity parity;
        if (!parityFromJson(j["parity"], parity)) {
            LOG_ERROR("Invalid parity: " + j["parity"].dump() + " (expected null, \"Odd\" or \"Even\")");
            return false;
        }
        serial.parity = parity;
    }
    if (j.contains("stopBits")) {
        StopBits stopBits;
        if (!stopBitsFromInt(j["stopBits"].get<int>(), stopBits)) {
            LOG_ERROR("Invalid stopBits: " + j["stopBits"].dump() + " (expected 1 or 2)");
            return false;
        }
        serial.stopBits = stopBits;
    }
    if (j.contains("timeout")) {
        serial.timeout = j["timeout"].get<unsigned int>();
    }
    if (j.contains("size")) {
        serial.size = j["size"].get<std::size_t>();
    }
    if (j.contains("devicePathFilters")) {
        config.devicePathFilters = j["devicePathFilters"].get<std::vector<std::string>>();
    }
    if (j.contains("logFile")) {
        config.logFile = j["logFile"].get<std::string>();
    }
    if (j.contains("logLevel")) {
        config.logLevel = j["logLevel"].get<std::string>();
        LogLevel level;
        if (!Logger::parseLevel(config.logLevel, level)) {
            LOG_ERROR("Invalid logLevel: " + config.logLevel);
            return false;
        }
    }
    
    config_ = config;
    LOG_INFO("Session configuration loaded successfully");
    return true;
}

SessionConfig ConfigLoader::getConfig() const {
    return config_;
}

void ConfigLoader::setDefaults() {
    config_.serial = SerialportOptions{};
    config_.devicePathFilters = PortEnumerator::defaultFilters();
    config_.logFile = "";
    config_.logLevel = "INFO";
}

} // namespace UrSerial
