// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <hiegraph/core/types.h>

namespace hiegraph::config {

enum class OutputFormat { Text, Json };

struct ExtractionConfig {
    // trace, debug, info, warn, error or off
    std::string logLevel = "warn";
    // Optional log file in addition to stderr
    std::string logFile;
    // Suffix of dump files picked up when a directory is given as input
    std::string inputExtension = ".hie.json";
    OutputFormat format = OutputFormat::Text;
    bool dumpHieFile = false;
    bool dumpParsed = true;
};

Result<OutputFormat> parseOutputFormat(std::string_view value);

bool isValidLogLevel(std::string_view level);

/**
 * @brief Defaults, overlaid with the config file (if it exists), then the environment
 *
 * Recognized keys: [log] level, [log] file, [input] extension, [output] format,
 * [debug] dump_hie_file, [debug] dump_parsed. HIEGRAPH_LOG_LEVEL overrides [log] level.
 * The log level is taken as is; callers apply their own overrides and then run
 * validateExtractionConfig.
 *
 * @return ErrorCode::InvalidArgument for format or boolean values that do not parse
 */
Result<ExtractionConfig> loadExtractionConfig(const std::filesystem::path& configPath);

// Checks the fields that later layers may still override: log level and input extension
Result<void> validateExtractionConfig(const ExtractionConfig& config);

} // namespace hiegraph::config
