// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <hiegraph/hie/hie_types.h>
#include <hiegraph/parse/grammar.h>
#include <hiegraph/parse/module.h>
#include <hiegraph/parse/type_resolver.h>

namespace hiegraph::parse {

/**
 * @brief Copy of node with every type index replaced by its resolved keys
 *
 * Covers node types and identifier types of the whole subtree. Fails if any index lies
 * outside resolved.
 */
std::optional<Ast> resolveAst(const hie::RawAst& node, const ResolvedTypes& resolved);

/**
 * @brief Extracts the module described by one dump
 *
 * Resolves the type table once, resolves every root of the forest against it and runs
 * the module production. Returns std::nullopt when the table or a tree refers to a type
 * outside the table, or when the forest does not hold exactly one module root.
 */
std::optional<Module> parseHieFile(const hie::HieFile& file);

} // namespace hiegraph::parse
