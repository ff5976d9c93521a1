// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <array>
#include <cstdlib>
#include <hiegraph/config/config_helpers.h>
#include <hiegraph/config/extraction_config.h>

namespace hiegraph::config {

namespace {

constexpr std::array<std::string_view, 6> kLogLevels = {"trace", "debug", "info",
                                                        "warn",  "error", "off"};

Result<void> applyBool(const std::filesystem::path& path, const char* section, const char* key,
                       bool& target) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty())
        return {};
    auto parsed = parse_bool(raw);
    if (!parsed)
        return Error{ErrorCode::InvalidArgument,
                     std::string(section) + "." + key + ": expected a boolean, got '" + raw + "'"};
    target = *parsed;
    return {};
}

} // namespace

Result<OutputFormat> parseOutputFormat(std::string_view value) {
    if (value == "text")
        return OutputFormat::Text;
    if (value == "json")
        return OutputFormat::Json;
    return Error{ErrorCode::InvalidArgument,
                 "Unknown output format '" + std::string(value) + "' (expected text or json)"};
}

bool isValidLogLevel(std::string_view level) {
    for (auto known : kLogLevels) {
        if (known == level)
            return true;
    }
    return false;
}

Result<ExtractionConfig> loadExtractionConfig(const std::filesystem::path& configPath) {
    ExtractionConfig config;

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        if (auto level = parse_config_value(configPath, "log", "level"); !level.empty())
            config.logLevel = level;
        if (auto file = parse_config_value(configPath, "log", "file"); !file.empty())
            config.logFile = expand_tilde(file).string();
        if (auto ext = parse_config_value(configPath, "input", "extension"); !ext.empty())
            config.inputExtension = ext;
        if (auto format = parse_config_value(configPath, "output", "format"); !format.empty()) {
            auto parsed = parseOutputFormat(format);
            if (!parsed)
                return parsed.error();
            config.format = parsed.value();
        }
        if (auto r = applyBool(configPath, "debug", "dump_hie_file", config.dumpHieFile); !r)
            return r.error();
        if (auto r = applyBool(configPath, "debug", "dump_parsed", config.dumpParsed); !r)
            return r.error();
    }

    if (const char* env = std::getenv("HIEGRAPH_LOG_LEVEL"); env && *env)
        config.logLevel = env;
    return config;
}

Result<void> validateExtractionConfig(const ExtractionConfig& config) {
    if (!isValidLogLevel(config.logLevel))
        return Error{ErrorCode::InvalidArgument, "Unknown log level '" + config.logLevel + "'"};
    if (config.inputExtension.empty())
        return Error{ErrorCode::InvalidArgument, "Input extension must not be empty"};
    return {};
}

} // namespace hiegraph::config
