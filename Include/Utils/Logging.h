/**
 * @file Logging.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Logging utilities
 * @version 0.2
 * @date 2026-10-12
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdio>

#ifndef MCRW_ENABLE_LOGGING
#define MCRW_ENABLE_LOGGING 1
#endif

#define LOG_DEBUG(fmt, ...) Logger::log(Logger::Level::Debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  Logger::log(Logger::Level::Info, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  Logger::log(Logger::Level::Warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) Logger::log(Logger::Level::Error, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_HEX(label, data, length) Logger::hex(__FILE__, __LINE__, label, data, length)

/**
 * @brief Minimal printf style logger
 *
 * Writes to stderr so tool output on stdout stays clean. Messages below the
 * runtime level are dropped; MCRW_ENABLE_LOGGING=0 compiles everything out.
 */
class Logger {
public:
    enum class Level : uint8_t {
        Debug = 0,
        Info,
        Warn,
        Error,
        Off
    };

    // ANSI color codes
    static constexpr const char* COLOR_RESET   = "\033[0m";
    static constexpr const char* COLOR_RED     = "\033[31m";
    static constexpr const char* COLOR_YELLOW  = "\033[33m";
    static constexpr const char* COLOR_GREEN   = "\033[32m";
    static constexpr const char* COLOR_CYAN    = "\033[36m";
    static constexpr const char* COLOR_GRAY    = "\033[90m";

    static void setLevel(Level level) {
        minimumLevel() = level;
    }

    static bool enabled(Level level) {
#if MCRW_ENABLE_LOGGING
        return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minimumLevel());
#else
        (void)level;
        return false;
#endif
    }

    static void log(Level level, const char* file, int line, const char* fmt, ...) {
#if MCRW_ENABLE_LOGGING
        if (!enabled(level)) {
            return;
        }

        prefix(level, file, line);

        va_list args;
        va_start(args, fmt);
        std::vfprintf(stderr, fmt, args);
        va_end(args);

        std::fprintf(stderr, "\n");
#else
        (void)level; (void)file; (void)line; (void)fmt;
#endif
    }

    static void hex(const char* file, int line, const char* label, const uint8_t* data, size_t length) {
#if MCRW_ENABLE_LOGGING
        if (!enabled(Level::Debug)) {
            return;
        }

        prefix(Level::Debug, file, line);
        std::fprintf(stderr, "%s (%zu):", label, length);
        for (size_t i = 0; i < length; ++i) {
            std::fprintf(stderr, " %02X", data[i]);
        }
        std::fprintf(stderr, "\n");
#else
        (void)file; (void)line; (void)label; (void)data; (void)length;
#endif
    }

private:
    static Level& minimumLevel() {
        static Level level = Level::Warn;
        return level;
    }

    static void prefix(Level level, const char* file, int line) {
        // Choose color based on log level
        const char* color = COLOR_RESET;
        const char* name = "DEBUG";
        switch (level) {
            case Level::Error:
                color = COLOR_RED;
                name = "ERROR";
                break;
            case Level::Warn:
                color = COLOR_YELLOW;
                name = "WARN";
                break;
            case Level::Info:
                color = COLOR_GREEN;
                name = "INFO";
                break;
            default:
                color = COLOR_CYAN;
                break;
        }

        // Print colored level with file and line info
        std::fprintf(stderr, "%s[%s]%s %s[%s:%d]%s ",
                     color, name, COLOR_RESET,
                     COLOR_GRAY, file, line, COLOR_RESET);
    }
};
