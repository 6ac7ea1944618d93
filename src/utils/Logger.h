#pragma once
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    SUCCESS,
    WARNING,
    ERROR
};

/**
 * @brief Process-wide logger.
 *
 * Every record goes to the log file (when one is set) and to the console.
 * A UI collaborator can mirror records through the callback.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx);
        minLevel = level;
    }

    // Empty path disables the file sink.
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level < minLevel) return;
        writeToFile(level, message);
        if (consoleEnabled) {
            printToConsole(level, message);
        }

        if (callback) {
            callback(level, message);
        }
    }

    // Convenience methods
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }

    /**
     * @brief Parses "debug", "info", "warning"/"warn", "error" (any case).
     * Unknown names map to INFO.
     */
    static LogLevel parseLevel(const std::string& name);

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    LogLevel minLevel = LogLevel::INFO;
    std::string logFilePath = "openflux.log";
    bool consoleEnabled = true;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};
