// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace hiegraph::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Expands a leading "~" or "~/"; "~user" forms are left alone
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/'))
        return path;
    const char* home = std::getenv("HOME");
    if (!home)
        return path;
    if (path.size() <= 2)
        return std::filesystem::path(home);
    return std::filesystem::path(home) / path.substr(2);
}

// Accepts true/false, yes/no, on/off and 1/0
inline std::optional<bool> parse_bool(std::string_view s) {
    std::string v(s);
    trim(v);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "yes" || v == "on" || v == "1")
        return true;
    if (v == "false" || v == "no" || v == "off" || v == "0")
        return false;
    return std::nullopt;
}

// Parse a value from a TOML config file; empty when the file or key is missing.
// Both "[section] key = v" and "section.key = v" are recognized.
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// $XDG_CONFIG_HOME/hiegraph/config.toml or ~/.config/hiegraph/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

// Explicit path, then HIEGRAPH_CONFIG, then get_config_path()
std::filesystem::path resolve_config_path(const std::string& override_path = "");

} // namespace hiegraph::config
