// SPDX-License-Identifier: MIT
// Logging.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <cstdint>
#include <cstring>
#include <format>
#include <functional>
#include <iostream>
#include <string>

class Log {
public:
    /** Message severity. */
    enum class Level : uint8_t {
        Debug,
        Info,
        Warning,
        Error,
    };

    /** Output sink: receives complete messages without trailing new line. */
    using Sink = std::function<void(Level, const std::string&)>;

    /**
     * Print debug message (verbose mode only).
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void debug(const std::format_string<Args...> fmt, Args&&... args)
    {
        if (verbose_flag()) {
            print(Level::Debug,
                  std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    /**
     * Print informational message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void info(const std::format_string<Args...> fmt, Args&&... args)
    {
        print(Level::Info,
              std::vformat(fmt.get(), std::make_format_args(args...)));
    }

    /**
     * Print warning message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void warning(const std::format_string<Args...> fmt, Args&&... args)
    {
        print(Level::Warning,
              std::vformat(fmt.get(), std::make_format_args(args...)));
    }

    /**
     * Print error message.
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void error(const std::format_string<Args...> fmt, Args&&... args)
    {
        print(Level::Error,
              std::vformat(fmt.get(), std::make_format_args(args...)));
    }

    /**
     * Print error message.
     * @param code system error code
     * @param fmt format description
     * @param ... format arguments
     */
    template <typename... Args>
    static void error(int code, const std::format_string<Args...> fmt,
                      Args&&... args)
    {
        std::string msg =
            std::vformat(fmt.get(), std::make_format_args(args...));
        if (code) {
            msg += std::format(", error code [{}] {}", code,
                               std::strerror(code));
        }
        print(Level::Error, msg);
    }

    /**
     * Verbose output flag getter/setter.
     * @return reference to verbose flag
     */
    static bool& verbose_flag()
    {
        static bool verbose = false;
        return verbose;
    }

    /**
     * Output sink getter/setter, empty sink means standard output streams.
     * @return reference to current sink
     */
    static Sink& sink()
    {
        static Sink handler;
        return handler;
    }

private:
    /**
     * Write message to the sink or to stdout/stderr.
     * @param level message severity
     * @param msg formatted message
     */
    static void print(Level level, const std::string& msg)
    {
        const Sink& handler = sink();
        if (handler) {
            handler(level, msg);
            return;
        }
        switch (level) {
            case Level::Debug:
            case Level::Info:
                std::cout << msg << '\n';
                break;
            case Level::Warning:
                std::cerr << "WARNING: " << msg << '\n';
                break;
            case Level::Error:
                std::cerr << "ERROR: " << msg << '\n';
                break;
        }
    }
};
