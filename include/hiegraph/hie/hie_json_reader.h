// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string_view>
#include <hiegraph/core/types.h>
#include <hiegraph/hie/hie_types.h>

namespace hiegraph::hie {

/**
 * @brief Reads a module dump from its JSON export
 *
 * Document layout:
 * @code
 * { "module": "Data.Tree", "path": "src/Data/Tree.hs",
 *   "types": [ {"kind": "var", "key": 7, "name": "a"}, {"kind": "app", "args": [0, 0]} ],
 *   "asts": { "src/Data/Tree.hs": NODE } }
 *
 * NODE = { "annotations": [["Module", "Module"]], "types": [1],
 *          "identifiers": [ {"module": "Data.List", "context": ["IEThing Import"]},
 *                           {"name": {"key": 3, "occ": "Tree"}, "type": 1,
 *                            "context": ["Decl DataDec"]} ],
 *          "span": {"file": "src/Data/Tree.hs", "start": [1, 1], "end": [1, 10]},
 *          "children": [NODE, ...] }
 * @endcode
 * Only "module", "path", "types" and "asts" are required; node members default to
 * empty. Type indices must fall inside "types".
 *
 * @return ErrorCode::InvalidData for malformed documents
 */
Result<HieFile> parseHieJson(std::string_view text);

/**
 * @return ErrorCode::FileNotFound if path does not exist, otherwise as parseHieJson
 */
Result<HieFile> readHieJson(const std::filesystem::path& path);

} // namespace hiegraph::hie
