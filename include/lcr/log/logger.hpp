#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

/*
===============================================================================
 lcr::log - process-wide stream logger
===============================================================================

  NL_INFO("[CONN] Connected to " << url);

  2026-10-19 14:03:07.412 INFO  [dispatch] [CONN] Connected to wss://...

- The level check runs before the message is formatted
- Each line is built outside the sink lock and written in one piece
- Threads may tag their lines with set_thread_name() (the socket thread and
  the dispatch thread do); untagged threads print "-"
===============================================================================
*/

namespace lcr::log {

enum class Level : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

[[nodiscard]]
inline constexpr std::string_view to_string(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
        case Level::Off:   return "off";
        default:           return "unknown";
    }
}

// Inverse of to_string(). Unknown names map to Info.
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    for (auto lvl : {Level::Trace, Level::Debug, Level::Warn, Level::Error, Level::Fatal, Level::Off}) {
        if (name == to_string(lvl)) {
            return lvl;
        }
    }
    return Level::Info;
}

// Name shown in every line logged by the calling thread
inline std::string& thread_name() noexcept {
    thread_local std::string name = "-";
    return name;
}

inline void set_thread_name(std::string_view name) {
    thread_name().assign(name.data(), name.size());
}


class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }
    [[nodiscard]] Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept {
        return lvl != Level::Off && lvl >= level();
    }

    // ANSI colors, off by default (log files, CI output)
    void enable_color(bool on) noexcept { color_.store(on, std::memory_order_relaxed); }

    // nullptr restores stdout
    void set_output(std::ostream* os) noexcept {
        std::lock_guard lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    void log(Level lvl, std::string_view msg) {
        if (!enabled(lvl)) {
            return;
        }
        const bool color = color_.load(std::memory_order_relaxed);

        std::string line;
        line.reserve(msg.size() + 64);
        if (color) {
            line += ansi_(lvl);
        }
        append_timestamp_(line);
        line += ' ';
        line += label_(lvl);
        line += " [";
        line += thread_name();
        line += "] ";
        line.append(msg.data(), msg.size());
        if (color) {
            line += "\033[0m";
        }
        line += '\n';

        std::lock_guard lock(mutex_);
        out_->write(line.data(), static_cast<std::streamsize>(line.size()));
        out_->flush();
    }

private:
    Logger() = default;

    // Fixed width so that messages line up
    static constexpr std::string_view label_(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO ";
            case Level::Warn:  return "WARN ";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            default:           return "?????";
        }
    }

    static constexpr std::string_view ansi_(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            default:           return "\033[0m";
        }
    }

    // Local time, millisecond resolution
    static void append_timestamp_(std::string& out) {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const std::time_t t = system_clock::to_time_t(now);
        const int ms = static_cast<int>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        char buf[32];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        n += static_cast<std::size_t>(std::snprintf(buf + n, sizeof(buf) - n, ".%03d", ms));
        out.append(buf, n);
    }

    std::ostream* out_{&std::cout};
    std::atomic<Level> level_{Level::Info};
    std::atomic<bool> color_{false};
    std::mutex mutex_;
};


// Collects one message and hands it to the logger on destruction
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.view());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace lcr::log


#define NL_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define NL_TRACE(msg)  NL_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define NL_DEBUG(msg)  NL_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define NL_INFO(msg)   NL_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define NL_WARN(msg)   NL_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define NL_ERROR(msg)  NL_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define NL_FATAL(msg)  NL_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
