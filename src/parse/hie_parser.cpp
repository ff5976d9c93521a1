// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <hiegraph/parse/hie_parser.h>

namespace hiegraph::parse {

namespace {

const SymbolKeys* lookup(const ResolvedTypes& resolved, hie::TypeIndex index) {
    if (index < 0 || static_cast<size_t>(index) >= resolved.size())
        return nullptr;
    return &resolved[static_cast<size_t>(index)];
}

} // namespace

std::optional<Ast> resolveAst(const hie::RawAst& node, const ResolvedTypes& resolved) {
    Ast out;
    out.span = node.span;
    out.info.annotations = node.info.annotations;

    out.info.types.reserve(node.info.types.size());
    for (auto index : node.info.types) {
        const auto* keys = lookup(resolved, index);
        if (!keys)
            return std::nullopt;
        out.info.types.push_back(*keys);
    }

    for (const auto& [identifier, details] : node.info.identifiers) {
        hie::IdentifierDetails<SymbolKeys> resolvedDetails;
        resolvedDetails.context = details.context;
        if (details.type) {
            const auto* keys = lookup(resolved, *details.type);
            if (!keys)
                return std::nullopt;
            resolvedDetails.type = *keys;
        }
        out.info.identifiers.emplace(identifier, std::move(resolvedDetails));
    }

    out.children.reserve(node.children.size());
    for (const auto& child : node.children) {
        auto resolvedChild = resolveAst(child, resolved);
        if (!resolvedChild)
            return std::nullopt;
        out.children.push_back(std::move(*resolvedChild));
    }
    return out;
}

std::optional<Module> parseHieFile(const hie::HieFile& file) {
    if (findInvalidTypeIndex(file.types))
        return std::nullopt;

    const auto resolved = resolveTypes(file.types);

    AstForest roots;
    roots.reserve(file.asts.size());
    for (const auto& [path, ast] : file.asts) {
        auto root = resolveAst(ast, resolved);
        if (!root)
            return std::nullopt;
        roots.push_back(std::move(*root));
    }

    auto contents = parseModuleForest(roots);
    if (!contents)
        return std::nullopt;
    return Module{file.moduleName, file.sourcePath, std::move(contents->decls),
                  std::move(contents->imports)};
}

} // namespace hiegraph::parse
