// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <array>
#include <hiegraph/hie/hie_types.h>

namespace hiegraph::hie {

namespace {

struct TypeKindEntry {
    std::string_view name;
    TypeTermKind kind;
};

constexpr std::array<TypeKindEntry, 8> kTypeKinds = {{
    {"app", TypeTermKind::App},
    {"tycon", TypeTermKind::TyConApp},
    {"forall", TypeTermKind::ForAll},
    {"fun", TypeTermKind::Fun},
    {"qual", TypeTermKind::Qual},
    {"lit", TypeTermKind::Lit},
    {"cast", TypeTermKind::Cast},
    {"coercion", TypeTermKind::Coercion},
}};

} // namespace

AnnotationTag classifyAnnotation(std::string_view constructor, std::string_view type) {
    if (constructor == "Module" && type == "Module")
        return AnnotationTag::ModuleRoot;
    if (constructor == "ImportDecl" && type == "ImportDecl")
        return AnnotationTag::ImportDecl;
    return AnnotationTag::Unrecognized;
}

ContextTag classifyContext(std::string_view context) {
    if (context == "Use")
        return ContextTag::Use;
    if (context == "IEThing Import")
        return ContextTag::ImportContext;
    if (context == "Decl DataDec")
        return ContextTag::DataDecl;
    if (context == "Decl ConDec")
        return ContextTag::ConDecl;
    if (context == "RecField RecFieldDecl")
        return ContextTag::RecFieldDecl;
    return ContextTag::Unrecognized;
}

const char* annotationTagName(AnnotationTag tag) {
    switch (tag) {
        case AnnotationTag::ModuleRoot: return "Module/Module";
        case AnnotationTag::ImportDecl: return "ImportDecl/ImportDecl";
        case AnnotationTag::Unrecognized: return "?";
    }
    return "?";
}

const char* contextTagName(ContextTag tag) {
    switch (tag) {
        case ContextTag::Use: return "Use";
        case ContextTag::ImportContext: return "IEThing Import";
        case ContextTag::DataDecl: return "Decl DataDec";
        case ContextTag::ConDecl: return "Decl ConDec";
        case ContextTag::RecFieldDecl: return "RecField RecFieldDecl";
        case ContextTag::Unrecognized: return "?";
    }
    return "?";
}

std::optional<TypeTermKind> typeTermKindFromString(std::string_view kind) {
    for (const auto& entry : kTypeKinds) {
        if (entry.name == kind)
            return entry.kind;
    }
    return std::nullopt;
}

const char* typeTermKindName(TypeTermKind kind) {
    for (const auto& entry : kTypeKinds) {
        if (entry.kind == kind)
            return entry.name.data();
    }
    return "?";
}

} // namespace hiegraph::hie
