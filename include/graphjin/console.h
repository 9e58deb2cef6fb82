#pragma once
// ═══════════════════════════════════════════════════════════════════
//  graphjin/console.h — Leveled diagnostic logging with colors
// ═══════════════════════════════════════════════════════════════════
//  Every level writes to stderr: the service shell speaks JSON-RPC on
//  stdout and diagnostics must never land on that channel.
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace graphjin::console {

enum class Level : int {
    Off = 0,
    Error = 1,
    Warn = 2,
    Info = 3,
    Debug = 4
};

namespace detail {

// ANSI color codes
struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<Level>& level() {
    static std::atomic<Level> l{Level::Info};
    return l;
}

inline std::atomic<bool>& colors() {
    static std::atomic<bool> c{true};
    return c;
}

inline std::mutex& streamMutex() {
    static std::mutex m;
    return m;
}

inline std::ostream*& stream() {
    static std::ostream* os = &std::cerr;
    return os;
}

// Stringify a single argument
template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        if constexpr (std::is_floating_point_v<T>) {
            std::ostringstream oss;
            oss << arg;
            return oss.str();
        }
        return std::to_string(arg);
    } else if constexpr (requires { arg.dump(); }) {
        return arg.dump();
    } else {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    }
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level lvl, const char* color, const char* prefix, const Args&... args) {
    if (static_cast<int>(lvl) > static_cast<int>(level().load())) return;

    std::ostringstream line;
    bool useColors = colors().load();
    if (useColors) line << Colors::Gray;
    line << "[" << timestamp() << "] ";
    if (useColors) line << color;
    line << prefix;
    if (useColors) line << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);
    line << '\n';

    std::lock_guard<std::mutex> lock(streamMutex());
    *stream() << line.str() << std::flush;
}

} // namespace detail

// ── Configuration ──
inline void setLevel(Level lvl) { detail::level().store(lvl); }
inline Level getLevel() { return detail::level().load(); }
inline void setColors(bool enabled) { detail::colors().store(enabled); }

// Redirects output (tests capture into a stringstream); nullptr restores stderr
inline void setStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(detail::streamMutex());
    detail::stream() = os ? os : &std::cerr;
}

inline Level parseLevel(const std::string& name) {
    if (name == "off") return Level::Off;
    if (name == "error") return Level::Error;
    if (name == "warn") return Level::Warn;
    if (name == "debug") return Level::Debug;
    return Level::Info;
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, detail::Colors::Red, "✖ ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, detail::Colors::Yellow, "⚠ ", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, detail::Colors::Blue, "ℹ ", args...);
}

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, detail::Colors::Cyan, "● ", args...);
}

} // namespace graphjin::console
