#pragma once
#include "SerialOptions.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace UrSerial {

// POSIX termios port used by the local driver
class SerialPort {
public:
    explicit SerialPort(const std::string& devicePath);
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;
    
    bool open(const PortSettings& settings);
    void close();
    bool isOpen() const;
    
    // Waits up to timeoutMs for data; returns bytes read, 0 on timeout, -1 on error
    int read(uint8_t* buffer, std::size_t size, int timeoutMs);
    int write(const uint8_t* data, std::size_t size);

    const std::string& devicePath() const { return devicePath_; }
    std::string lastError() const;
    
private:
    std::string devicePath_;
    int fd_;
    mutable std::mutex errorMutex_;
    std::string lastError_;
    std::mutex writeMutex_;
    
    bool configurePort(const PortSettings& settings);
    void setError(const std::string& error);
};

} // namespace UrSerial
