#pragma once
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <string>

namespace rebootto {

enum class LogLevel {
    INFO,
    VERBOSE,
    WARN,
    ERROR,
    SUCCESS
};

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static inline bool verbose_enabled = false;

    // Replaces console output, e.g. to capture messages in tests. Pass an
    // empty function to restore the console.
    static inline Sink sink;

    __attribute__((format(printf, 1, 2)))
    static void info(const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(LogLevel::INFO, fmt, ap);
        va_end(ap);
    }

    __attribute__((format(printf, 1, 2)))
    static void verbose(const char* fmt, ...) {
        if (!verbose_enabled) return;
        va_list ap;
        va_start(ap, fmt);
        log(LogLevel::VERBOSE, fmt, ap);
        va_end(ap);
    }

    __attribute__((format(printf, 1, 2)))
    static void warn(const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(LogLevel::WARN, fmt, ap);
        va_end(ap);
    }

    __attribute__((format(printf, 1, 2)))
    static void error(const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(LogLevel::ERROR, fmt, ap);
        va_end(ap);
    }

    __attribute__((format(printf, 1, 2)))
    static void success(const char* fmt, ...) {
        va_list ap;
        va_start(ap, fmt);
        log(LogLevel::SUCCESS, fmt, ap);
        va_end(ap);
    }

private:
    static void log(LogLevel level, const char* fmt, va_list ap) {
        char buf[1024];
        std::vsnprintf(buf, sizeof(buf), fmt, ap);
        std::string message(buf);

        if (sink) {
            sink(level, message);
            return;
        }

        switch (level) {
            case LogLevel::VERBOSE:
                std::fprintf(stdout, "\033[90m[DEBUG] %s\033[0m\n", message.c_str());
                break;
            case LogLevel::INFO:
                std::fprintf(stdout, "[INFO]  %s\n", message.c_str());
                break;
            case LogLevel::WARN:
                std::fprintf(stderr, "\033[33m[WARN]  %s\033[0m\n", message.c_str());
                break;
            case LogLevel::ERROR:
                std::fprintf(stderr, "\033[31m[ERROR] %s\033[0m\n", message.c_str());
                break;
            case LogLevel::SUCCESS:
                std::fprintf(stdout, "\033[32m[ OK  ] %s\033[0m\n", message.c_str());
                break;
        }
    }
};

} // namespace rebootto
