// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include <hiegraph/app/extraction_service.h>
#include <hiegraph/config/config_helpers.h>
#include <hiegraph/config/extraction_config.h>
#include <hiegraph/parse/module_printer.h>

namespace {

constexpr const char* kVersion = "0.1.0";

void setupLogging(const hiegraph::config::ExtractionConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.logFile.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile));
    }

    auto logger = std::make_shared<spdlog::logger>("hiegraph", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.logLevel));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"hiegraph-dump - extract declarations and use edges from HIE tree exports"};

    std::vector<std::string> inputs;
    std::string configPath;
    std::string logLevel;
    std::string logFile;
    std::string format;
    bool dumpHieFile = false;
    bool dumpParsed = false;
    bool strict = false;

    app.add_option("inputs", inputs, "Dump files or directories to search")->required();
    app.add_option("-c,--config", configPath, "Config file (default: HIEGRAPH_CONFIG or XDG)");
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error, off)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));
    app.add_option("--log-file", logFile, "Log file path (optional)");
    app.add_option("--format", format, "Output format for parsed modules: text|json")
        ->check(CLI::IsMember({"text", "json"}));
    app.add_flag("--ddump-hie-file", dumpHieFile, "Debug dump the loaded tree exports");
    app.add_flag("--ddump-parsed", dumpParsed, "Debug dump the parsed modules");
    app.add_flag("--strict", strict, "Exit with an error when any module fails to parse");
    app.set_version_flag("--version", std::string("hiegraph-dump ") + kVersion);
    CLI11_PARSE(app, argc, argv);

    auto loaded = hiegraph::config::loadExtractionConfig(
        hiegraph::config::resolve_config_path(configPath));
    if (!loaded) {
        std::cerr << "Invalid configuration: " << loaded.error().message << std::endl;
        return 2;
    }
    auto config = loaded.value();
    if (!logLevel.empty())
        config.logLevel = logLevel;
    if (!logFile.empty())
        config.logFile = logFile;
    if (!format.empty()) {
        auto parsed = hiegraph::config::parseOutputFormat(format);
        if (!parsed) {
            std::cerr << parsed.error().message << std::endl;
            return 2;
        }
        config.format = parsed.value();
    }
    if (dumpHieFile) {
        config.dumpHieFile = true;
        config.dumpParsed = dumpParsed;
    } else if (dumpParsed) {
        config.dumpParsed = true;
    }

    if (auto valid = hiegraph::config::validateExtractionConfig(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 2;
    }

    try {
        setupLogging(config);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 2;
    }

    hiegraph::app::ExtractionService service(config);

    std::vector<std::filesystem::path> paths(inputs.begin(), inputs.end());
    auto files = service.collectInputs(paths);
    if (!files) {
        spdlog::error("{}", files.error().message);
        return 1;
    }

    hiegraph::app::ExtractionService::LoadObserver dumpLoaded;
    if (config.dumpHieFile) {
        dumpLoaded = [](const std::filesystem::path&, const hiegraph::hie::HieFile& file) {
            std::cerr << hiegraph::parse::formatHieFile(file);
        };
    }

    auto report = service.extract(files.value(), dumpLoaded);

    if (config.dumpParsed) {
        if (config.format == hiegraph::config::OutputFormat::Json)
            std::cout << hiegraph::parse::modulesToJson(report.modules).dump(2) << std::endl;
        else
            std::cout << hiegraph::parse::formatModules(report.modules);
    }

    if (strict && !report.ok()) {
        spdlog::error("{} of {} file(s) failed", report.failures.size(), files.value().size());
        return 1;
    }
    return 0;
}
