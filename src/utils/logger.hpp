// src/utils/logger.hpp
#pragma once

#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

#include "config/system_config.hpp"

#ifndef S2LP_BUILD_ARDUINO
#include <iostream>
#endif

namespace s2lp {

#ifndef LOGGER_DISABLE_COLORS

/**
 * @brief ANSI color codes for terminal output
 */
struct Colors {
    static constexpr const char* kReset = "\033[0m\r";
    static constexpr const char* kRed = "\033[31m";
    static constexpr const char* kGreen = "\033[32m";
    static constexpr const char* kYellow = "\033[33m";
    static constexpr const char* kCyan = "\033[36m";
    static constexpr const char* kWhite = "\033[37m";
};

#endif  // LOGGER_DISABLE_COLORS

/**
 * @brief Enumeration for different logging levels.
 */
enum class LogLevel { kDebug, kInfo, kWarning, kError };

/**
 * @brief Get the printable name of a log level
 */
const char* LogLevelToString(LogLevel level);

/**
 * @brief Abstract interface for log output handlers.
 */
class LogHandler {
   public:
    virtual ~LogHandler() = default;

    /**
     * @brief Write a log message.
     * @param level The severity level of the message.
     * @param message The message to be logged.
     */
    virtual void Write(LogLevel level, const std::string& message) = 0;

    /**
     * @brief Flushes any buffered log messages.
     */
    virtual void Flush() = 0;

   protected:
#ifndef LOGGER_DISABLE_COLORS
    const char* GetColorForLevel(LogLevel level) const {
        switch (level) {
            case LogLevel::kDebug:
                return Colors::kCyan;
            case LogLevel::kInfo:
                return Colors::kGreen;
            case LogLevel::kWarning:
                return Colors::kYellow;
            case LogLevel::kError:
                return Colors::kRed;
            default:
                return Colors::kWhite;
        }
    }
#endif  // LOGGER_DISABLE_COLORS
};

#ifdef S2LP_BUILD_ARDUINO
/**
 * @brief Arduino Serial output handler.
 */
class SerialLogHandler : public LogHandler {
   public:
    explicit SerialLogHandler(unsigned long baud_rate = 115200) {
        if (!Serial) {
            Serial.begin(baud_rate);
        }
    }

    void Write(LogLevel level, const std::string& message) override {
#ifndef LOGGER_DISABLE_COLORS
        Serial.print(GetColorForLevel(level));
#endif
        Serial.print("[");
        Serial.print(LogLevelToString(level));
        Serial.print("] ");
        Serial.print(message.c_str());
#ifndef LOGGER_DISABLE_COLORS
        Serial.println(Colors::kReset);
#else
        Serial.println();
#endif
    }

    void Flush() override { Serial.flush(); }
};

#else
/**
 * @brief Native console output handler.
 */
class ConsoleLogHandler : public LogHandler {
   public:
    void Write(LogLevel level, const std::string& message) override {
#ifndef LOGGER_DISABLE_COLORS
        std::cout << GetColorForLevel(level) << " [" << LogLevelToString(level)
                  << "] " << message << Colors::kReset << std::endl;
#else
        std::cout << " [" << LogLevelToString(level) << "] " << message
                  << std::endl;
#endif
    }

    void Flush() override { std::cout.flush(); }
};
#endif

/**
 * @brief Main logger class.
 *
 * Messages below the configured level are dropped, the rest are forwarded to
 * the installed handler. The driver logs through the LOG_* macros below.
 */
class Logger {
   public:
    Logger();
    ~Logger() = default;

    /**
     * @brief Set the minimum log level to be processed.
     * @param level The minimum log level.
     */
    void SetLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        min_log_level_ = level;
    }

    LogLevel getLogLevel() {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        return min_log_level_;
    }

    /**
     * @brief Set a custom log handler.
     * @param handler Unique pointer to the log handler implementation.
     */
    void SetHandler(std::unique_ptr<LogHandler> handler) {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        handler_ = std::move(handler);
    }

    void Log(LogLevel level, const std::string& message) {
        LogMessage(level, message);
    }

    /**
     * @brief Log a printf-style formatted message.
     * @param level The severity level of the message.
     * @param format The format string.
     * @param ... Variable arguments for formatting.
     */
    void Log(LogLevel level, const char* format, ...) {
        char buffer[LOGGER_BUFFER_SIZE];

        va_list args;
        va_start(args, format);
        vsnprintf(buffer, sizeof(buffer), format, args);
        va_end(args);

        LogMessage(level, buffer);
    }

    /**
     * @brief Restore the default handler and level.
     */
    void Reset();

    void Flush() {
        std::lock_guard<std::mutex> lock(logger_mutex_);
        if (handler_) {
            handler_->Flush();
        }
    }

    template <typename... Args>
    void Debug(const char* format, Args... args) {
        Log(LogLevel::kDebug, format, args...);
    }

    template <typename... Args>
    void Info(const char* format, Args... args) {
        Log(LogLevel::kInfo, format, args...);
    }

    template <typename... Args>
    void Warning(const char* format, Args... args) {
        Log(LogLevel::kWarning, format, args...);
    }

    template <typename... Args>
    void Error(const char* format, Args... args) {
        Log(LogLevel::kError, format, args...);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

   private:
    LogLevel min_log_level_{LogLevel::kDebug};
    std::unique_ptr<LogHandler> handler_;
    std::mutex logger_mutex_;

    void LogMessage(LogLevel level, const std::string& message);
};

/**
 * @brief Global logger instance
 */
extern Logger LOG;

#if S2LP_LOG_LEVEL <= 0
#define LOG_DEBUG(fmt, ...) s2lp::LOG.Debug(fmt, ##__VA_ARGS__)
#else
#define LOG_DEBUG(fmt, ...) \
    do {                    \
    } while (0)  // Compiles to nothing
#endif

#if S2LP_LOG_LEVEL <= 1
#define LOG_INFO(fmt, ...) s2lp::LOG.Info(fmt, ##__VA_ARGS__)
#else
#define LOG_INFO(fmt, ...) \
    do {                   \
    } while (0)
#endif

#if S2LP_LOG_LEVEL <= 2
#define LOG_WARNING(fmt, ...) s2lp::LOG.Warning(fmt, ##__VA_ARGS__)
#else
#define LOG_WARNING(fmt, ...) \
    do {                      \
    } while (0)
#endif

#if S2LP_LOG_LEVEL <= 3
#define LOG_ERROR(fmt, ...) s2lp::LOG.Error(fmt, ##__VA_ARGS__)
#else
#define LOG_ERROR(fmt, ...) \
    do {                    \
    } while (0)
#endif

#define LOG_FLUSH() s2lp::LOG.Flush()

}  // namespace s2lp
