#include "SerialPort.hpp"
#include "Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <sys/select.h>
#include <cerrno>
#include <cstring>

namespace UrSerial {

SerialPort::SerialPort(const std::string& devicePath) 
    : devicePath_(devicePath), fd_(-1) {}

SerialPort::~SerialPort() {
    close();
}

bool SerialPort::open(const PortSettings& settings) {
    if (fd_ >= 0) {
        close();
    }
    
    fd_ = ::open(devicePath_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        setError(std::string(strerror(errno)));
        LOG_ERROR("Failed to open " + devicePath_ + ": " + lastError());
        return false;
    }
    
    if (!configurePort(settings)) {
        close();
        return false;
    }
    
    return true;
}

void SerialPort::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool SerialPort::isOpen() const {
    return fd_ >= 0;
}

int SerialPort::read(uint8_t* buffer, std::size_t size, int timeoutMs) {
    if (fd_ < 0) return -1;
    
    fd_set readfds;
    struct timeval timeout;
    
    FD_ZERO(&readfds);
    FD_SET(fd_, &readfds);
    
    timeout.tv_sec = timeoutMs / 1000;
    timeout.tv_usec = (timeoutMs % 1000) * 1000;
    
    int ret = select(fd_ + 1, &readfds, nullptr, nullptr, &timeout);
    if (ret < 0) {
        if (errno == EINTR) return 0;
        setError(std::string(strerror(errno)));
        return -1;
    } else if (ret == 0) {
        return 0;
    }
    
    ssize_t n = ::read(fd_, buffer, size);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
        setError(std::string(strerror(errno)));
        return -1;
    }
    return static_cast<int>(n);
}

int SerialPort::write(const uint8_t* data, std::size_t size) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (fd_ < 0) {
        setError("port is not open");
        return -1;
    }

    std::size_t sent = 0;
    while (sent < size) {
        ssize_t w = ::write(fd_, data + sent, size - sent);
        if (w > 0) {
            sent += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            // Output buffer full on a non-blocking fd; wait for room
            fd_set writefds;
            FD_ZERO(&writefds);
            FD_SET(fd_, &writefds);
            struct timeval timeout{1, 0};
            if (select(fd_ + 1, nullptr, &writefds, nullptr, &timeout) > 0) continue;
        }
        setError(w < 0 ? std::string(strerror(errno)) : "write returned 0");
        return sent > 0 ? static_cast<int>(sent) : -1;
    }
    return static_cast<int>(sent);
}

std::string SerialPort::lastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

void SerialPort::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

bool SerialPort::configurePort(const PortSettings& settings) {
    struct termios tty;
    
    if (tcgetattr(fd_, &tty) != 0) {
        setError("tcgetattr failed: " + std::string(strerror(errno)));
        LOG_ERROR(lastError());
        return false;
    }
    
    speed_t speed;
    switch (settings.baudRate) {
        case 1200: speed = B1200; break;
        case 2400: speed = B2400; break;
        case 4800: speed = B4800; break;
        case 9600: speed = B9600; break;
        case 19200: speed = B19200; break;
        case 38400: speed = B38400; break;
        case 57600: speed = B57600; break;
        case 115200: speed = B115200; break;
        case 230400: speed = B230400; break;
        case 460800: speed = B460800; break;
        case 500000: speed = B500000; break;
        case 576000: speed = B576000; break;
        case 921600: speed = B921600; break;
        case 1000000: speed = B1000000; break;
        case 1152000: speed = B1152000; break;
        case 1500000: speed = B1500000; break;
        case 2000000: speed = B2000000; break;
        default:
            setError("Unsupported baudrate: " + std::to_string(settings.baudRate));
            LOG_ERROR(lastError());
            return false;
    }
    
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    
    tty.c_cflag &= ~CSIZE;
    switch (settings.dataBits) {
        case 5: tty.c_cflag |= CS5; break;
        case 6: tty.c_cflag |= CS6; break;
        case 7: tty.c_cflag |= CS7; break;
        default: tty.c_cflag |= CS8; break;
    }

    switch (settings.parity) {
        case Parity::ODD:
            tty.c_cflag |= PARENB | PARODD;
            break;
        case Parity::EVEN:
            tty.c_cflag |= PARENB;
            tty.c_cflag &= ~PARODD;
            break;
        case Parity::NONE:
            tty.c_cflag &= ~(PARENB | PARODD);
            break;
    }

    if (settings.stopBits == StopBits::TWO) {
        tty.c_cflag |= CSTOPB;
    } else {
        tty.c_cflag &= ~CSTOPB;
    }

    tty.c_cflag &= ~CRTSCTS;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);
    if (settings.flowControl == FlowControl::HARDWARE) {
        tty.c_cflag |= CRTSCTS;
    } else if (settings.flowControl == FlowControl::SOFTWARE) {
        tty.c_iflag |= IXON | IXOFF;
    }

    tty.c_cflag |= CREAD | CLOCAL;
    
    tty.c_lflag &= ~ICANON;
    tty.c_lflag &= ~ECHO;
    tty.c_lflag &= ~ECHOE;
    tty.c_lflag &= ~ECHONL;
    tty.c_lflag &= ~ISIG;
    
    tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL);
    
    tty.c_oflag &= ~OPOST;
    tty.c_oflag &= ~ONLCR;
    
    tty.c_cc[VTIME] = 0;
    tty.c_cc[VMIN] = 0;
    
    if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
        setError("tcsetattr failed: " + std::string(strerror(errno)));
        LOG_ERROR(lastError());
        return false;
    }
    
    tcflush(fd_, TCIOFLUSH);
    
    return true;
}

} // namespace UrSerial
