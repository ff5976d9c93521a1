// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <hiegraph/core/symbol_key.h>

namespace hiegraph::hie {

// Index into a module's type table
using TypeIndex = int32_t;

/**
 * @brief Node annotations the grammar distinguishes
 *
 * The dump carries (constructor, type) string pairs such as ("Module", "Module"). Only
 * the pairs the grammar matches get their own tag; everything else is Unrecognized so a
 * node with foreign annotations is still known to be annotated.
 */
enum class AnnotationTag : uint8_t { ModuleRoot, ImportDecl, Unrecognized };

/**
 * @brief Identifier usage contexts the grammar distinguishes
 */
enum class ContextTag : uint8_t {
    Use,           // Use
    ImportContext, // IEThing Import
    DataDecl,      // Decl DataDec
    ConDecl,       // Decl ConDec
    RecFieldDecl,  // RecField RecFieldDecl
    Unrecognized
};

AnnotationTag classifyAnnotation(std::string_view constructor, std::string_view type);
ContextTag classifyContext(std::string_view context);

const char* annotationTagName(AnnotationTag tag);
const char* contextTagName(ContextTag tag);

struct ModuleName {
    std::string name;

    friend bool operator==(const ModuleName&, const ModuleName&) = default;
    friend auto operator<=>(const ModuleName&, const ModuleName&) = default;
};

struct Name {
    SymbolKey key;
    std::string occName;

    // Names are identified by their key alone
    friend bool operator==(const Name& a, const Name& b) { return a.key == b.key; }
    friend auto operator<=>(const Name& a, const Name& b) { return a.key <=> b.key; }
};

// Module names sort before names, matching the identifier map order of the dump
using Identifier = std::variant<ModuleName, Name>;

template <typename T> struct IdentifierDetails {
    std::optional<T> type;
    std::set<ContextTag> context;
};

template <typename T> using IdentifierTable = std::map<Identifier, IdentifierDetails<T>>;

template <typename T> using IdentifierEntry = typename IdentifierTable<T>::value_type;

struct Position {
    int line = 0;
    int column = 0;
};

struct Span {
    std::string file;
    Position start;
    Position end;
};

template <typename T> struct NodeInfo {
    std::set<AnnotationTag> annotations;
    std::vector<T> types;
    IdentifierTable<T> identifiers;
};

/**
 * @brief One node of a module's syntax tree
 *
 * T is the type annotation carried by nodes and identifiers: a raw TypeIndex as read
 * from the dump, or a resolved key list once the module assembler has run.
 */
template <typename T> struct HieAst {
    NodeInfo<T> info;
    Span span;
    std::vector<HieAst<T>> children;
};

/**
 * @brief Structural shape of a type term; only used for diagnostics
 */
enum class TypeTermKind : uint8_t { App, TyConApp, ForAll, Fun, Qual, Lit, Cast, Coercion };

std::optional<TypeTermKind> typeTermKindFromString(std::string_view kind);
const char* typeTermKindName(TypeTermKind kind);

struct TypeVar {
    Name name;
};

struct StructuralType {
    TypeTermKind kind = TypeTermKind::App;
    std::vector<TypeIndex> args;
};

using TypeTerm = std::variant<TypeVar, StructuralType>;

// Flat arena; entries refer to each other by index and may form cycles
using TypeTable = std::vector<TypeTerm>;

using RawAst = HieAst<TypeIndex>;

struct HieFile {
    std::string moduleName;
    std::string sourcePath;
    TypeTable types;
    // Root forest keyed by source file, sorted by path
    std::map<std::string, RawAst> asts;
};

} // namespace hiegraph::hie
