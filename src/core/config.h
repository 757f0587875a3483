#pragma once

#include "core/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// Configuration key constants
// ---------------------------------------------------------------------------
inline constexpr const char* CONF_CONF     = "conf";
inline constexpr const char* CONF_NETWORK  = "network";
inline constexpr const char* CONF_URL      = "url";
inline constexpr const char* CONF_REGISTRY = "registry";
inline constexpr const char* CONF_TIMEOUT  = "timeout";
inline constexpr const char* CONF_LOGLEVEL = "loglevel";
inline constexpr const char* CONF_DEBUG    = "debug";
inline constexpr const char* CONF_LOGFILE  = "logfile";

// ---------------------------------------------------------------------------
// Config  --  layered configuration
//
// Priority order: command-line args  >  config file  >  programmatic defaults
// Multi-value keys (e.g. -debug=rpc -debug=resolve) are accumulated into a
// vector accessible via get_list(). Arguments that do not start with '-'
// are kept, in order, as positional arguments.
// ---------------------------------------------------------------------------
class Config {
public:
    Config() = default;

    /// Parse command-line arguments.
    /// Accepted formats:
    ///   -key=value   --key=value   (key/value pair)
    ///   -key         --key         (boolean flag, value = "1")
    ///   word                       (positional argument)
    void parse_args(int argc, const char* const argv[]);

    /// Parse an INI-style configuration file.
    /// Format per line:  key=value
    /// Lines starting with '#' and blank lines are ignored.
    [[nodiscard]] Result<void> parse_file(const std::filesystem::path& path);

    /// Set a default value (lowest priority; replaces previous defaults).
    void set(std::string_view key, std::string value);

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;
    [[nodiscard]] std::string get_or(std::string_view key,
                                     std::string_view default_val) const;

    /// Returns @p default_val when absent or not an integer.
    [[nodiscard]] int64_t get_int(std::string_view key,
                                  int64_t default_val = 0) const;

    /// Truthy: "1", "true", "yes", "on" (case-insensitive).
    [[nodiscard]] bool get_bool(std::string_view key,
                                bool default_val = false) const;

    [[nodiscard]] std::vector<std::string> get_list(
        std::string_view key) const;

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& positional() const noexcept {
        return positional_;
    }

private:
    using ValueMap =
        std::unordered_map<std::string, std::vector<std::string>>;

    // Lookup checks cli_values_, then file_values_, then defaults_.
    ValueMap cli_values_;
    ValueMap file_values_;
    ValueMap defaults_;
    std::vector<std::string> positional_;

    static void insert(ValueMap& target, std::string_view key,
                       std::string value);
    [[nodiscard]] const std::vector<std::string>* lookup(
        std::string_view key) const;
};

} // namespace core
