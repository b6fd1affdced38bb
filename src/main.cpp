#include "ConfigLoader.hpp"
#include "EventBus.hpp"
#include "LocalDriver.hpp"
#include "Logger.hpp"
#include "SerialSession.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <thread>

using namespace UrSerial;

std::atomic<bool> g_interrupted(false);

void signalHandler(int) {
    g_interrupted.store(true);
}

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS]\n\n";
    std::cout << "Serial Port Session Client\n";
    std::cout << "Opens a serial device, writes data and prints what the device sends back.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE         Session configuration JSON file\n";
    std::cout << "  -p, --port PATH           Device path (overrides config)\n";
    std::cout << "  -b, --baud RATE           Baud rate (overrides config)\n";
    std::cout << "      --list                List available serial ports and exit\n";
    std::cout << "      --force-close PATH    Release a port held by the driver and exit\n";
    std::cout << "      --close-all           Release every port held by the driver and exit\n";
    std::cout << "      --write TEXT          Write TEXT after opening the port\n";
    std::cout << "      --write-hex HEX       Write raw bytes given as hex (e.g. \"48 65 6c 6c 6f\")\n";
    std::cout << "      --listen SECONDS      Print received data for SECONDS (0 = until Ctrl+C)\n";
    std::cout << "      --binary              Print received data as hex instead of text\n";
    std::cout << "  -h, --help                Display this help message and exit\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " --list\n";
    std::cout << "  " << programName << " -p /dev/ttyUSB0 -b 115200 --write \"AT\\r\\n\" --listen 2\n";
    std::cout << "  " << programName << " -c config/serialport.json --listen 0 --binary\n";
}

bool parseHex(const std::string& text, std::vector<uint8_t>& out) {
    std::string digits;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ':' || c == ',') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        digits.push_back(c);
    }
    if (digits.empty() || digits.size() % 2 != 0) {
        return false;
    }

    out.clear();
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        out.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return true;
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    std::string result;
    char buffer[4];
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        std::snprintf(buffer, sizeof(buffer), i == 0 ? "%02x" : " %02x", bytes[i]);
        result += buffer;
    }
    return result;
}

bool parseUnsigned(const std::string& text, unsigned long& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return false;
    }
    try {
        out = std::stoul(text);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string portOverride;
    unsigned long baudOverride = 0;
    bool listPorts = false;
    bool closeAll = false;
    bool binary = false;
    std::string forceClosePath;
    std::string writeText;
    bool hasWriteText = false;
    std::vector<uint8_t> writeBytes;
    bool hasWriteBytes = false;
    long listenSeconds = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "--list") {
            listPorts = true;
        } else if (arg == "--close-all") {
            closeAll = true;
        } else if (arg == "--binary") {
            binary = true;
        } else if (!hasValue && (arg == "-c" || arg == "--config" || arg == "-p" || arg == "--port" ||
                                 arg == "-b" || arg == "--baud" || arg == "--force-close" ||
                                 arg == "--write" || arg == "--write-hex" || arg == "--listen")) {
            std::cerr << "Error: " << arg << " requires an argument." << std::endl;
            return 1;
        } else if (arg == "-c" || arg == "--config") {
            configFile = argv[++i];
        } else if (arg == "-p" || arg == "--port") {
            portOverride = argv[++i];
        } else if (arg == "-b" || arg == "--baud") {
            if (!parseUnsigned(argv[++i], baudOverride) || baudOverride == 0) {
                std::cerr << "Error: Invalid baud rate: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--force-close") {
            forceClosePath = argv[++i];
        } else if (arg == "--write") {
            writeText = argv[++i];
            hasWriteText = true;
        } else if (arg == "--write-hex") {
            if (!parseHex(argv[++i], writeBytes)) {
                std::cerr << "Error: Invalid hex string: " << argv[i] << std::endl;
                return 1;
            }
            hasWriteBytes = true;
        } else if (arg == "--listen") {
            unsigned long seconds = 0;
            if (!parseUnsigned(argv[++i], seconds)) {
                std::cerr << "Error: Invalid listen duration: " << argv[i] << std::endl;
                return 1;
            }
            listenSeconds = static_cast<long>(seconds);
        } else {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            std::cerr << "Use -h or --help for usage information." << std::endl;
            return 1;
        }
    }

    ConfigLoader loader;
    if (!configFile.empty() && !loader.loadFromFile(configFile)) {
        std::cerr << "Error: Failed to load config file: " << configFile << std::endl;
        return 1;
    }
    SessionConfig config = loader.getConfig();

    LogLevel level;
    if (Logger::parseLevel(config.logLevel, level)) {
        Logger::getInstance().setLogLevel(level);
    }
    if (!config.logFile.empty()) {
        Logger::getInstance().setLogFile(config.logFile);
    }

    if (!portOverride.empty()) {
        config.serial.path = portOverride;
    }
    if (baudOverride != 0) {
        config.serial.baudRate = static_cast<unsigned int>(baudOverride);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    EventBus events;
    LocalDriver driver(events, config.devicePathFilters);

    try {
        if (listPorts) {
            for (const auto& port : SerialSession::availablePorts(driver)) {
                std::cout << port << std::endl;
            }
            return 0;
        }
        if (!forceClosePath.empty()) {
            SerialSession::forceClose(driver, forceClosePath);
            std::cout << "✓ Released " << forceClosePath << std::endl;
            return 0;
        }
        if (closeAll) {
            SerialSession::closeAll(driver);
            std::cout << "✓ Released all ports" << std::endl;
            return 0;
        }

        LOG_INFO("Serial port client starting...");
        SerialSession session(config.serial, driver, events);
        session.setListenerErrorHandler([](const ListenerError& e) {
            std::cerr << "Listener error on " << e.channel() << ": " << e.what() << std::endl;
        });

        session.open();
        std::cout << "✓ Opened " << session.path() << " at " << session.baudRate() << " baud" << std::endl;

        if (listenSeconds >= 0) {
            if (binary) {
                session.listenBinary([](const std::vector<uint8_t>& data) {
                    std::cout << toHex(data) << std::endl;
                });
            } else {
                session.listen([](const std::string& text) {
                    std::cout << text << std::flush;
                });
            }
            session.read();
        }

        if (hasWriteText) {
            std::size_t written = session.write(writeText);
            LOG_INFO("Wrote " + std::to_string(written) + " bytes");
        }
        if (hasWriteBytes) {
            std::size_t written = session.writeBinary(writeBytes);
            LOG_INFO("Wrote " + std::to_string(written) + " bytes");
        }

        if (listenSeconds >= 0) {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(listenSeconds);
            while (!g_interrupted.load() &&
                   (listenSeconds == 0 || std::chrono::steady_clock::now() < deadline)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        }

        session.close();
        std::cout << std::endl << "✓ Closed " << session.path() << std::endl;
    } catch (const std::exception& e) {
        LOG_ERROR("Serial port client failed: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    LOG_INFO("Serial port client stopped");
    return 0;
}
