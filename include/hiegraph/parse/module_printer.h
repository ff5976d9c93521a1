// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <hiegraph/hie/hie_types.h>
#include <hiegraph/parse/module.h>

namespace hiegraph::parse {

/**
 * @brief Indented text rendering of a parsed module, for debug dumps
 *
 * @code
 * module Data.Tree (src/Data/Tree.hs)
 *   import Data.List
 *   data Tree #3
 *     con Leaf #4 uses []
 *     con Node #5 record
 *       field val #6 uses [7]
 * @endcode
 */
std::string formatModule(const Module& module);

std::string formatModules(const std::vector<Module>& modules);

/**
 * @brief Indented rendering of a raw dump: type table, then every tree of the forest
 */
std::string formatHieFile(const hie::HieFile& file);

nlohmann::json moduleToJson(const Module& module);

nlohmann::json modulesToJson(const std::vector<Module>& modules);

} // namespace hiegraph::parse
