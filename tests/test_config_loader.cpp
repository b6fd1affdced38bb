#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include "PortEnumerator.hpp"
#include "TestSupport.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace UrSerial;
using TestSupport::check;

int main() {
    std::cout << "=== Testing ConfigLoader ===" << std::endl;
    Logger::getInstance().setLogLevel(LogLevel::ERROR);

    std::cout << "\n1. Testing defaults:" << std::endl;
    {
        ConfigLoader loader;
        SessionConfig config = loader.getConfig();
        check(config.serial.path.empty() && config.serial.baudRate == 0, "No path or baud rate by default");
        check(!config.serial.dataBits && !config.serial.encoding, "Optional settings left unset");
        check(config.devicePathFilters == PortEnumerator::defaultFilters(), "Default device filters");
        check(config.logLevel == "INFO" && config.logFile.empty(), "Default logging settings");
    }

    std::cout << "\n2. Testing a full configuration:" << std::endl;
    {
        ConfigLoader loader;
        bool loaded = loader.loadFromString(R"({
            "path": "/dev/ttyUSB0",
            "baudRate": 115200,
            "encoding": "latin1",
            "dataBits": 7,
            "flowControl": "Hardware",
            "parity": "Odd",
            "stopBits": 1,
            "timeout": 50,
            "size": 256,
            "devicePathFilters": ["/dev/ttyACM"],
            "logFile": "serial.log",
            "logLevel": "DEBUG"
        })");
        SessionConfig config = loader.getConfig();
        check(loaded, "Configuration accepted");
        check(config.serial.path == "/dev/ttyUSB0" && config.serial.baudRate == 115200, "Path and baud rate read");
        check(config.serial.encoding == std::string("latin1") && config.serial.dataBits == 7, "Encoding and data bits read");
        check(config.serial.flowControl == FlowControl::HARDWARE && config.serial.parity == Parity::ODD &&
              config.serial.stopBits == StopBits::ONE, "Flow control, parity and stop bits read");
        check(config.serial.timeout == 50u && config.serial.size == std::size_t(256), "Timeout and chunk size read");
        check(config.devicePathFilters == std::vector<std::string>({"/dev/ttyACM"}), "Device filters read");
        check(config.logFile == "serial.log" && config.logLevel == "DEBUG", "Logging settings read");
    }

    std::cout << "\n3. Testing null enums:" << std::endl;
    {
        ConfigLoader loader;
        check(loader.loadFromString(R"({"path": "COM3", "baudRate": 9600, "flowControl": null, "parity": null})"),
              "null flow control and parity accepted");
        SessionConfig config = loader.getConfig();
        check(config.serial.flowControl == FlowControl::NONE && config.serial.parity == Parity::NONE,
              "null maps to none");
        check(!config.serial.stopBits, "Omitted stop bits stay unset");
    }

    std::cout << "\n4. Testing invalid values:" << std::endl;
    {
        ConfigLoader loader;
        loader.loadFromString(R"({"path": "COM3", "baudRate": 9600})");
        check(!loader.loadFromString(R"({"dataBits": 9})"), "dataBits 9 rejected");
        check(!loader.loadFromString(R"({"stopBits": 3})"), "stopBits 3 rejected");
        check(!loader.loadFromString(R"({"parity": "Mark"})"), "Unknown parity rejected");
        check(!loader.loadFromString(R"({"flowControl": "Both"})"), "Unknown flow control rejected");
        check(!loader.loadFromString(R"({"logLevel": "LOUD"})"), "Unknown log level rejected");
        check(!loader.loadFromString(R"({"baudRate": "fast"})"), "Wrong value type rejected");
        check(!loader.loadFromString("[1, 2]"), "Non-object document rejected");
        check(!loader.loadFromString("{ not json"), "Malformed JSON rejected");
        check(loader.getConfig().serial.path == "COM3" && loader.getConfig().serial.baudRate == 9600,
              "Rejected documents leave the previous configuration intact");
    }

    std::cout << "\n5. Testing file loading:" << std::endl;
    {
        const std::string fileName = "test_config_loader.json";
        {
            std::ofstream file(fileName);
            file << R"({"path": "/dev/ttyS1", "baudRate": 19200})";
        }
        ConfigLoader loader;
        check(loader.loadFromFile(fileName), "Configuration file loaded");
        check(loader.getConfig().serial.path == "/dev/ttyS1", "File values applied");
        std::remove(fileName.c_str());

        check(!loader.loadFromFile("does-not-exist.json"), "Missing file reported");
        check(loader.getConfig().serial.baudRate == 19200, "Missing file keeps loaded values");
    }

    return TestSupport::finish("ConfigLoader");
}
