/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-18
 * @copyright MIT License
 */
#pragma once

#ifndef MTR_CORE_LOG_HPP
    #define MTR_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace mtr::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "math", "bench").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 * setLogger() and setMinLevel() are meant to be called once at startup.
 */
class Log final {
public:
    Log() = delete;

    /// @brief Install a sink; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("mtr", msg); }
    static void info (std::string_view msg) { info ("mtr", msg); }
    static void warn (std::string_view msg) { warn ("mtr", msg); }
    static void error(std::string_view msg) { error("mtr", msg); }
    static void fatal(std::string_view msg) { fatal("mtr", msg); }
};

} // namespace mtr::core

#endif // MTR_CORE_LOG_HPP
