// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>
#include <hiegraph/core/symbol_key.h>
#include <hiegraph/hie/hie_types.h>

namespace hiegraph::parse {

// Resolved type table: slot i holds the keys reachable from type i
using ResolvedTypes = std::vector<SymbolKeys>;

/**
 * @brief Flattens a type table into the symbol keys each entry refers to
 *
 * Every index is expanded on its own, depth first, following structural arguments left
 * to right and emitting the key of each type variable reached. An index met again while
 * it is still being expanded contributes nothing, which cuts cycles. Keys are neither
 * sorted nor deduplicated, so an entry whose arguments share subterms can resolve to a
 * list exponential in the nesting depth: a chain where entry i is fun[i-1, i-1] gives
 * 2^i keys at entry i. Expansion depth is bounded only by the table size and does not
 * use the call stack.
 *
 * @pre every structural argument is a valid index into types (see findInvalidTypeIndex)
 */
ResolvedTypes resolveTypes(const hie::TypeTable& types);

/**
 * @brief Keys reachable from a single entry, using the same rules as resolveTypes
 */
SymbolKeys resolveType(const hie::TypeTable& types, hie::TypeIndex root);

/**
 * @brief First structural argument that does not index into types, if any
 */
std::optional<hie::TypeIndex> findInvalidTypeIndex(const hie::TypeTable& types);

} // namespace hiegraph::parse
