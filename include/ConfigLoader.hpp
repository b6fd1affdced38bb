#pragma once
#include "SerialOptions.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace UrSerial {

using json = nlohmann::json;

struct SessionConfig {
    SerialportOptions serial;
    std::vector<std::string> devicePathFilters;
    std::string logFile;
    std::string logLevel;
};

class ConfigLoader {
public:
    ConfigLoader();
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& content);
    SessionConfig getConfig() const;
    
private:
    SessionConfig config_;
    void setDefaults();
    bool loadSessionConfig(const json& jsonConfig);
};

} // namespace UrSerial
