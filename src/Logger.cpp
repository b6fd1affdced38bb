#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace UrSerial {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : minLevel_(LogLevel::INFO) {}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < minLevel_.load()) return;
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::stringstream ss;
    ss << "[" << getCurrentTimestamp() << "] "
       << "[" << levelToString(level) << "] "
       << message;
    
    std::string logMsg = ss.str();
    
    if (level >= LogLevel::WARNING) {
        std::cerr << logMsg << std::endl;
    } else {
        std::cout << logMsg << std::endl;
    }
    
    if (logFile_.is_open()) {
        logFile_ << logMsg << std::endl;
        logFile_.flush();
    }
}

void Logger::setLogLevel(LogLevel level) {
    minLevel_.store(level);
}

LogLevel Logger::getLogLevel() const {
    return minLevel_.load();
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    if (filename.empty()) return;
    logFile_.open(filename, std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
    }
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    
    if (upper == "DEBUG") {
        out = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        out = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        out = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    
    std::tm tm{};
    localtime_r(&time, &tm);
    
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace UrSerial
