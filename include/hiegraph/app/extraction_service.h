// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include <hiegraph/config/extraction_config.h>
#include <hiegraph/core/types.h>
#include <hiegraph/hie/hie_types.h>
#include <hiegraph/parse/module.h>

namespace hiegraph::app {

struct ExtractionFailure {
    std::filesystem::path path;
    Error error;
};

struct ExtractionReport {
    std::vector<parse::Module> modules;
    std::vector<ExtractionFailure> failures;

    bool ok() const noexcept { return failures.empty(); }
};

/**
 * @brief Loads dump files and extracts one module per file
 *
 * A file that cannot be read or whose module production does not match is recorded in
 * the report and skipped; the remaining files are still processed.
 */
class ExtractionService {
public:
    // Called with every dump after it is loaded and before it is parsed
    using LoadObserver = std::function<void(const std::filesystem::path&, const hie::HieFile&)>;

    explicit ExtractionService(config::ExtractionConfig config);

    /**
     * @brief Expands directories into the dump files below them
     *
     * Files given directly are kept whatever their extension; directories contribute the
     * regular files ending in the configured extension, sorted by path.
     *
     * @return ErrorCode::FileNotFound for a missing input, ErrorCode::NotFound when
     *         nothing matched
     */
    Result<std::vector<std::filesystem::path>>
    collectInputs(const std::vector<std::filesystem::path>& inputs) const;

    ExtractionReport extract(const std::vector<std::filesystem::path>& files,
                             const LoadObserver& onLoaded = {}) const;

    const config::ExtractionConfig& config() const { return config_; }

private:
    config::ExtractionConfig config_;
};

} // namespace hiegraph::app
