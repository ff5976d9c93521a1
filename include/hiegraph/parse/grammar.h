// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <hiegraph/core/symbol_key.h>
#include <hiegraph/hie/hie_types.h>
#include <hiegraph/parse/module.h>
#include <hiegraph/parse/tree_parser.h>

namespace hiegraph::parse {

// Tree whose type annotations have been resolved to key lists
using Ast = hie::HieAst<SymbolKeys>;
using AstForest = std::vector<Ast>;
using AstIdentifierEntry = hie::IdentifierEntry<SymbolKeys>;

template <typename A> using AstParser = TreeParser<Ast, A>;

const std::vector<Ast>& nodeChildren(const Ast& node);
const hie::IdentifierTable<SymbolKeys>& nodeIdentifiers(const Ast& node);

AstParser<Unit> annotation(hie::AnnotationTag tag);
AstParser<Unit> noAnnotation();

/**
 * @brief Key and name of the only identifier of a node used in the given context
 */
AstParser<std::pair<SymbolKey, std::string>> uniqueName(hie::ContextTag context);

/**
 * @brief uniqueName applied to the children of a node; exactly one child must match
 */
AstParser<std::pair<SymbolKey, std::string>> uniqueNameChild(hie::ContextTag context);

struct ModuleContents {
    std::vector<std::string> imports;
    std::vector<TopLevelDecl> decls;
};

/**
 * @brief Contents of the single module root among the root forest
 *
 * Fails unless exactly one root parses as a module root.
 */
std::optional<ModuleContents> parseModuleForest(const AstForest& roots);

/**
 * @brief Imports and declarations below a module root node
 *
 * Each child is tried as an import first, then as a top-level declaration; children
 * that are neither are skipped.
 */
std::optional<ModuleContents> parseModuleRoot(const Ast& node);

/**
 * @brief Name of the module imported by an import declaration node
 */
std::optional<std::string> parseImport(const Ast& node);

std::optional<TopLevelDecl> parseTopLevelDecl(const Ast& node);

/**
 * @brief Data type declared by node, with every child that parses as a constructor
 */
std::optional<DataType> parseDataType(const Ast& node);

std::optional<DataCon> parseDataCon(const Ast& node);

/**
 * @brief Record body: exactly one child whose children yield at least one field
 *
 * Grandchildren that are not fields are skipped. When no child or several children
 * qualify, the record alternative fails as a whole.
 */
std::optional<DataConBody> parseRecordBody(const Ast& node);

std::optional<RecordField> parseRecordField(const Ast& node);

std::optional<Value> parseValue(const Ast& node);
std::optional<Class> parseClass(const Ast& node);

/**
 * @brief Keys used in the subtree rooted at node, in pre-order
 *
 * Per node: its resolved type keys, then for each identifier in a Use context its own
 * key followed by the keys of its type, then the uses of each child in order.
 */
SymbolKeys collectUses(const Ast& node);

} // namespace hiegraph::parse
