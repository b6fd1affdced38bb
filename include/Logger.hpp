#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <atomic>

namespace UrSerial {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void setLogFile(const std::string& filename);

    // Accepts DEBUG, INFO, WARNING (or WARN), ERROR in any case
    static bool parseLevel(const std::string& name, LogLevel& out);
    
private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    
    std::mutex mutex_;
    std::atomic<LogLevel> minLevel_;
    std::ofstream logFile_;
};

} // namespace UrSerial

#define LOG_DEBUG(msg) ::UrSerial::Logger::getInstance().log(::UrSerial::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) ::UrSerial::Logger::getInstance().log(::UrSerial::LogLevel::INFO, msg)
#define LOG_WARNING(msg) ::UrSerial::Logger::getInstance().log(::UrSerial::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) ::UrSerial::Logger::getInstance().log(::UrSerial::LogLevel::ERROR, msg)
