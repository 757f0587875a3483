#pragma once
// Copyright (c) 2024-2026 The ZNS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZNS_CORE_LOGGING_H
#define ZNS_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    RESOLVE    = 1u << 0,
    REGISTRY   = 1u << 1,
    RECORDS    = 1u << 2,
    CODEC      = 1u << 3,
    RPC        = 1u << 4,
    NET        = 1u << 5,
    CONFIG     = 1u << 6,
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator~(LogCategory a) noexcept {
    return static_cast<LogCategory>(~static_cast<uint32_t>(a));
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Returns the short string name for a single log category bit.
/// If multiple bits are set, returns the name of the lowest set bit.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses a level name ("trace", "debug", "info", "warn", "error",
/// "fatal", "off"; case-insensitive). Returns nullopt for unknown names.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

/// Parses a comma-separated list of category names ("resolve,rpc") into
/// a bitmask. Unknown names are ignored; "all" selects every category.
[[nodiscard]] LogCategory parse_log_categories(std::string_view names);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    static Logger& instance();

    // -- configuration (all thread-safe) ------------------------------------

    void set_level(LogLevel level);
    void enable_category(LogCategory cat);

    /// Replaces the enabled category bitmask.
    void set_categories(LogCategory cats);

    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] LogCategory enabled_categories() const noexcept;

    /// Fast lockless check: returns true if a message at the given
    /// level and category would actually be written.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);

    /// Opens (or replaces) the append-mode log file and enables the file
    /// sink. An empty path closes the file and disables the sink.
    void set_log_file(const std::filesystem::path& path);

    /// Enables or disables the in-memory sink. Captured lines are kept
    /// until take_captured() drains them.
    void set_capture(bool enable);

    /// Returns and clears all captured lines.
    [[nodiscard]] std::vector<std::string> take_captured();

    void flush();

    // -- logging entry point ------------------------------------------------

    /// Writes a fully formatted log line. The caller is responsible for
    /// performing the will_log() check beforehand.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger() = default;
    ~Logger();

    /// "2026-02-03 12:00:00.123" (UTC)
    static std::string format_timestamp();

    // -- atomic state for lockless will_log() checks -----------------------
    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};
    std::atomic<bool>     capture_{false};

    // -- guarded state for I/O ---------------------------------------------
    mutable std::mutex       write_mutex_;
    std::ofstream            file_stream_;
    std::vector<std::string> captured_;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Each macro performs a lockless will_log() check before doing any string
// formatting, so disabled paths have near-zero overhead.
//
// Usage:
//   LOG_INFO(core::LogCategory::RESOLVE, "resolving " + domain);
//   LOG_WARN(core::LogCategory::RECORDS, "conflicting record key " + key);
// ---------------------------------------------------------------------------

#define ZNS_LOG(lvl, cat, msg)                                            \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) ZNS_LOG(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) ZNS_LOG(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  ZNS_LOG(core::LogLevel::INFO,  cat, msg)
#define LOG_WARN(cat, msg)  ZNS_LOG(core::LogLevel::WARN,  cat, msg)
#define LOG_ERROR(cat, msg) ZNS_LOG(core::LogLevel::ERR,   cat, msg)
#define LOG_FATAL(cat, msg) ZNS_LOG(core::LogLevel::FATAL, cat, msg)

#endif // ZNS_CORE_LOGGING_H
