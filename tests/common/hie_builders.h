// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

// Builders for hand-made HIE trees used across parser tests

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <hiegraph/core/symbol_key.h>
#include <hiegraph/hie/hie_types.h>

namespace hiegraph::test {

inline SymbolKey key(int64_t raw) {
    return SymbolKey{raw};
}

inline SymbolKeys keys(std::initializer_list<int64_t> raws) {
    SymbolKeys out;
    for (auto raw : raws)
        out.emplace_back(raw);
    return out;
}

/**
 * @brief Fluent construction of a node; T is the type annotation (TypeIndex or SymbolKeys)
 */
template <typename T> class NodeBuilder {
public:
    NodeBuilder& annotate(hie::AnnotationTag tag) {
        node_.info.annotations.insert(tag);
        return *this;
    }

    NodeBuilder& type(T t) {
        node_.info.types.push_back(std::move(t));
        return *this;
    }

    NodeBuilder& name(int64_t raw, std::string occ, std::initializer_list<hie::ContextTag> context,
                      std::optional<T> type = std::nullopt) {
        hie::IdentifierDetails<T> details{std::move(type), context};
        node_.info.identifiers.emplace(hie::Name{SymbolKey{raw}, std::move(occ)},
                                       std::move(details));
        return *this;
    }

    NodeBuilder& moduleName(std::string module, std::initializer_list<hie::ContextTag> context) {
        hie::IdentifierDetails<T> details{std::nullopt, context};
        node_.info.identifiers.emplace(hie::ModuleName{std::move(module)}, std::move(details));
        return *this;
    }

    NodeBuilder& child(hie::HieAst<T> c) {
        node_.children.push_back(std::move(c));
        return *this;
    }

    hie::HieAst<T> build() const { return node_; }

    operator hie::HieAst<T>() const { return node_; }

private:
    hie::HieAst<T> node_;
};

using AstBuilder = NodeBuilder<SymbolKeys>;
using RawBuilder = NodeBuilder<hie::TypeIndex>;

// Leaf carrying a single name in the given context
template <typename T = SymbolKeys>
hie::HieAst<T> nameNode(int64_t raw, std::string occ, hie::ContextTag context) {
    return NodeBuilder<T>().name(raw, std::move(occ), {context});
}

// Leaf using each key once
template <typename T = SymbolKeys> hie::HieAst<T> useNode(std::initializer_list<int64_t> raws) {
    NodeBuilder<T> builder;
    for (auto raw : raws)
        builder.name(raw, "u" + std::to_string(raw), {hie::ContextTag::Use});
    return builder;
}

// import <module>
template <typename T = SymbolKeys> hie::HieAst<T> importNode(std::string module) {
    return NodeBuilder<T>()
        .annotate(hie::AnnotationTag::ImportDecl)
        .child(NodeBuilder<T>().moduleName(std::move(module), {hie::ContextTag::ImportContext}));
}

// Field declaration: name child plus the given use subtree
template <typename T = SymbolKeys>
hie::HieAst<T> fieldNode(int64_t raw, std::string occ, hie::HieAst<T> uses) {
    return NodeBuilder<T>()
        .child(nameNode<T>(raw, std::move(occ), hie::ContextTag::RecFieldDecl))
        .child(std::move(uses));
}

// Record constructor: name child plus one child holding the fields
template <typename T = SymbolKeys>
hie::HieAst<T> recordConNode(int64_t raw, std::string occ, std::vector<hie::HieAst<T>> fields) {
    NodeBuilder<T> record;
    for (auto& field : fields)
        record.child(std::move(field));
    return NodeBuilder<T>()
        .child(nameNode<T>(raw, std::move(occ), hie::ContextTag::ConDecl))
        .child(record.build());
}

// Constructor without record syntax; extra children hold its argument types
template <typename T = SymbolKeys>
hie::HieAst<T> nakedConNode(int64_t raw, std::string occ, std::vector<hie::HieAst<T>> args = {}) {
    NodeBuilder<T> con;
    con.child(nameNode<T>(raw, std::move(occ), hie::ContextTag::ConDecl));
    for (auto& arg : args)
        con.child(std::move(arg));
    return con;
}

template <typename T = SymbolKeys>
hie::HieAst<T> dataNode(int64_t raw, std::string occ, std::vector<hie::HieAst<T>> cons) {
    NodeBuilder<T> data;
    data.child(nameNode<T>(raw, std::move(occ), hie::ContextTag::DataDecl));
    for (auto& con : cons)
        data.child(std::move(con));
    return data;
}

template <typename T = SymbolKeys>
hie::HieAst<T> moduleNode(std::vector<hie::HieAst<T>> children) {
    NodeBuilder<T> root;
    root.annotate(hie::AnnotationTag::ModuleRoot);
    for (auto& c : children)
        root.child(std::move(c));
    return root;
}

} // namespace hiegraph::test
