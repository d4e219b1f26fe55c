#pragma once
// ═══════════════════════════════════════════════════════════════════
//  unionpp/console.h — Leveled console logging with colors
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    console::setLevel(console::Level::Debug);
//    console::info("compiled", 3, "input unions");
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>

namespace unionpp::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

inline const char* levelName(Level level) {
    switch (level) {
        case Level::Debug:  return "debug";
        case Level::Info:   return "info";
        case Level::Warn:   return "warn";
        case Level::Error:  return "error";
        case Level::Silent: return "silent";
    }
    return "unknown";
}

inline Level parseLevel(std::string_view name) {
    if (name == "debug")  return Level::Debug;
    if (name == "info")   return Level::Info;
    if (name == "warn")   return Level::Warn;
    if (name == "error")  return Level::Error;
    if (name == "silent") return Level::Silent;
    throw std::invalid_argument("Unknown log level '" + std::string(name) + "'");
}

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

struct Sink {
    std::atomic<Level> level{Level::Warn};
    std::ostream* stream = &std::cerr;
    bool colors = true;
    std::mutex mutex;
};

inline Sink& sink() {
    static Sink s;
    return s;
}

// Stringify a single argument
template <typename T>
std::string stringify(const T& arg) {
    if constexpr (std::is_convertible_v<T, std::string_view>) {
        return std::string(std::string_view(arg));
    } else if constexpr (std::is_same_v<std::decay_t<T>, bool>) {
        return arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        std::ostringstream oss;
        oss << arg;
        return oss.str();
    } else if constexpr (requires { nlohmann::json(arg).dump(); }) {
        return nlohmann::json(arg).dump();
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
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, const char* color, const char* prefix, const Args&... args) {
    auto& s = sink();
    if (level < s.level.load()) return;

    auto stamp = "[" + timestamp() + "] ";
    std::ostringstream body;
    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) body << " ";
        first = false;
        body << stringify(arg);
    };
    (printOne(args), ...);

    // stream and colors are swapped by setStream under the same lock
    std::lock_guard<std::mutex> lock(s.mutex);
    auto& out = *s.stream;
    if (s.colors) {
        out << Colors::Gray << stamp << color << prefix << Colors::Reset;
    } else {
        out << stamp << prefix;
    }
    out << body.str() << std::endl;
}

} // namespace detail

// ── Configuration ──
inline void setLevel(Level level) { detail::sink().level.store(level); }
inline Level level() { return detail::sink().level.load(); }

inline void setStream(std::ostream& os, bool colors = false) {
    auto& s = detail::sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.stream = &os;
    s.colors = colors;
}

inline void resetStream() { setStream(std::cerr, true); }

// ── console::debug ──
template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, detail::Colors::Cyan, "debug ", args...);
}

// ── console::info ──
template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, detail::Colors::Blue, "info  ", args...);
}

// ── console::warn ──
template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, detail::Colors::Yellow, "warn  ", args...);
}

// ── console::error ──
template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, detail::Colors::Red, "error ", args...);
}

} // namespace unionpp::console
