#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/console.h — Leveled, colored console logging
// ═══════════════════════════════════════════════════════════════════
//
//    console::setLevel(console::Level::Debug);
//    console::debug("Dog.owner: batch of", 3);
//
// ═══════════════════════════════════════════════════════════════════

#include <atomic>
#include <ctime>
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

namespace batchql::console {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Silent = 4 };

namespace detail {

struct Colors {
    static constexpr const char* Reset   = "\033[0m";
    static constexpr const char* Red     = "\033[31m";
    static constexpr const char* Yellow  = "\033[33m";
    static constexpr const char* Blue    = "\033[34m";
    static constexpr const char* Cyan    = "\033[36m";
    static constexpr const char* Gray    = "\033[90m";
};

inline std::atomic<Level>& currentLevel() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

inline std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

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
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

template <typename... Args>
void print(Level level, std::ostream& os, const char* color, const char* prefix,
           const Args&... args) {
    if (level < currentLevel().load()) return;

    std::ostringstream line;
    line << Colors::Gray << "[" << timestamp() << "] "
         << color << prefix << Colors::Reset;

    bool first = true;
    auto printOne = [&](const auto& arg) {
        if (!first) line << " ";
        first = false;
        line << stringify(arg);
    };
    (printOne(args), ...);

    std::lock_guard<std::mutex> lock(outputMutex());
    os << line.str() << std::endl;
}

} // namespace detail

inline void setLevel(Level level) { detail::currentLevel().store(level); }
inline Level level() { return detail::currentLevel().load(); }

inline bool enabled(Level level) { return level >= detail::currentLevel().load(); }

// Accepts "debug", "info", "warn", "error", "silent".
inline Level parseLevel(std::string_view name) {
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "silent") return Level::Silent;
    throw std::invalid_argument("Unknown log level '" + std::string(name) + "'");
}

template <typename... Args>
void log(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Reset, "", args...);
}

template <typename... Args>
void info(const Args&... args) {
    detail::print(Level::Info, std::cout, detail::Colors::Blue, "ℹ ", args...);
}

template <typename... Args>
void warn(const Args&... args) {
    detail::print(Level::Warn, std::cerr, detail::Colors::Yellow, "⚠ ", args...);
}

template <typename... Args>
void error(const Args&... args) {
    detail::print(Level::Error, std::cerr, detail::Colors::Red, "✖ ", args...);
}

template <typename... Args>
void debug(const Args&... args) {
    detail::print(Level::Debug, std::cout, detail::Colors::Cyan, "● ", args...);
}

} // namespace batchql::console
