// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <hiegraph/app/extraction_service.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <hiegraph/hie/hie_json_reader.h>
#include <hiegraph/parse/hie_parser.h>

namespace fs = std::filesystem;

namespace hiegraph::app {

namespace {

bool hasSuffix(const std::string& name, const std::string& suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ExtractionService::ExtractionService(config::ExtractionConfig config)
    : config_(std::move(config)) {}

Result<std::vector<fs::path>>
ExtractionService::collectInputs(const std::vector<fs::path>& inputs) const {
    std::vector<fs::path> files;

    for (const auto& input : inputs) {
        std::error_code ec;
        if (fs::is_regular_file(input, ec)) {
            files.push_back(input);
            continue;
        }
        if (!fs::is_directory(input, ec)) {
            return Error{ErrorCode::FileNotFound, "No such file or directory: " + input.string()};
        }

        std::vector<fs::path> found;
        for (fs::recursive_directory_iterator it(input, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (it->is_regular_file(ec) &&
                hasSuffix(it->path().filename().string(), config_.inputExtension)) {
                found.push_back(it->path());
            }
        }
        if (ec) {
            return Error{ErrorCode::PermissionDenied,
                         "Cannot scan " + input.string() + ": " + ec.message()};
        }
        std::sort(found.begin(), found.end());
        spdlog::debug("{}: {} dump file(s) matching '{}'", input.string(), found.size(),
                      config_.inputExtension);
        files.insert(files.end(), found.begin(), found.end());
    }

    if (files.empty()) {
        return Error{ErrorCode::NotFound, "No files matched your search criteria"};
    }
    return files;
}

ExtractionReport ExtractionService::extract(const std::vector<fs::path>& files,
                                            const LoadObserver& onLoaded) const {
    ExtractionReport report;

    for (const auto& path : files) {
        auto loaded = hie::readHieJson(path);
        if (!loaded) {
            spdlog::warn("Skipping {}: {}", path.string(), loaded.error().message);
            report.failures.push_back({path, loaded.error()});
            continue;
        }
        if (onLoaded)
            onLoaded(path, loaded.value());

        auto module = parse::parseHieFile(loaded.value());
        if (!module) {
            spdlog::warn("Skipping {}: no single module root matched in module {}",
                         path.string(), loaded.value().moduleName);
            report.failures.push_back(
                {path, Error{ErrorCode::ParseError, "Module production did not match for " +
                                                        loaded.value().moduleName}});
            continue;
        }

        spdlog::debug("Parsed {}: {} declaration(s), {} import(s)", module->name,
                      module->decls.size(), module->imports.size());
        report.modules.push_back(std::move(*module));
    }

    spdlog::info("Extracted {} module(s) from {} file(s), {} failure(s)", report.modules.size(),
                 files.size(), report.failures.size());
    return report;
}

} // namespace hiegraph::app
