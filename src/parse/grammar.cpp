// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <hiegraph/parse/grammar.h>

#include <variant>

namespace hiegraph::parse {

namespace {

using NamedKey = std::pair<SymbolKey, std::string>;
using ModuleItem = std::variant<std::string, TopLevelDecl>;

std::optional<std::string> importedModuleName(const AstIdentifierEntry& entry) {
    const auto& [identifier, details] = entry;
    const auto* module = std::get_if<hie::ModuleName>(&identifier);
    if (!module || !details.context.contains(hie::ContextTag::ImportContext))
        return std::nullopt;
    return module->name;
}

// The child of an import declaration naming the module
std::optional<std::string> importTarget(const Ast& node) {
    static const auto bare = noAnnotation();
    static const auto target = pOne(nodeIdentifiers, importedModuleName);
    if (!bare(node))
        return std::nullopt;
    return target(node);
}

std::optional<DataConBody> parseNakedBody(const Ast& node) {
    return NakedBody{collectUses(node)};
}

std::optional<DataConBody> parseRecordFields(const Ast& node) {
    static const auto fields = pSome(nodeChildren, parseRecordField);
    auto parsed = fields(node);
    if (!parsed)
        return std::nullopt;
    return RecordBody{std::move(*parsed)};
}

void appendKeys(SymbolKeys& out, const SymbolKeys& keys) {
    out.insert(out.end(), keys.begin(), keys.end());
}

void appendUses(const Ast& node, SymbolKeys& out) {
    for (const auto& keys : node.info.types)
        appendKeys(out, keys);

    for (const auto& [identifier, details] : node.info.identifiers) {
        const auto* name = std::get_if<hie::Name>(&identifier);
        if (!name || !details.context.contains(hie::ContextTag::Use))
            continue;
        out.push_back(name->key);
        if (details.type)
            appendKeys(out, *details.type);
    }

    for (const auto& child : node.children)
        appendUses(child, out);
}

} // namespace

const std::vector<Ast>& nodeChildren(const Ast& node) {
    return node.children;
}

const hie::IdentifierTable<SymbolKeys>& nodeIdentifiers(const Ast& node) {
    return node.info.identifiers;
}

AstParser<Unit> annotation(hie::AnnotationTag tag) {
    return pCheck<Ast>([tag](const Ast& node) { return node.info.annotations.contains(tag); });
}

AstParser<Unit> noAnnotation() {
    return pCheck<Ast>([](const Ast& node) { return node.info.annotations.empty(); });
}

AstParser<NamedKey> uniqueName(hie::ContextTag context) {
    return pOne(nodeIdentifiers,
                [context](const AstIdentifierEntry& entry) -> std::optional<NamedKey> {
                    const auto& [identifier, details] = entry;
                    const auto* name = std::get_if<hie::Name>(&identifier);
                    if (!name || !details.context.contains(context))
                        return std::nullopt;
                    return NamedKey{name->key, name->occName};
                });
}

AstParser<NamedKey> uniqueNameChild(hie::ContextTag context) {
    return pOne(nodeChildren, uniqueName(context));
}

std::optional<ModuleContents> parseModuleForest(const AstForest& roots) {
    static const auto moduleRoot = pOne(&selfSelect<AstForest>, parseModuleRoot);
    return moduleRoot(roots);
}

std::optional<ModuleContents> parseModuleRoot(const Ast& node) {
    static const auto isModule = annotation(hie::AnnotationTag::ModuleRoot);
    static const auto items = pMany(
        nodeChildren,
        pAlt(pMap(makeParser(parseImport), [](std::string name) -> ModuleItem { return name; }),
             pMap(makeParser(parseTopLevelDecl),
                  [](TopLevelDecl decl) -> ModuleItem { return decl; })));

    if (!isModule(node))
        return std::nullopt;

    auto parsed = items(node);
    ModuleContents contents;
    for (auto& item : *parsed) {
        if (auto* moduleName = std::get_if<std::string>(&item))
            contents.imports.push_back(std::move(*moduleName));
        else
            contents.decls.push_back(std::get<TopLevelDecl>(std::move(item)));
    }
    return contents;
}

std::optional<std::string> parseImport(const Ast& node) {
    static const auto isImport = annotation(hie::AnnotationTag::ImportDecl);
    static const auto target = pOne(nodeChildren, importTarget);
    if (!isImport(node))
        return std::nullopt;
    return target(node);
}

std::optional<TopLevelDecl> parseTopLevelDecl(const Ast& node) {
    static const auto decl = pFirstOf<Ast, TopLevelDecl>({
        pMap(makeParser(parseDataType), [](DataType d) -> TopLevelDecl { return d; }),
        pMap(makeParser(parseValue), [](Value v) -> TopLevelDecl { return v; }),
        pMap(makeParser(parseClass), [](Class c) -> TopLevelDecl { return c; }),
    });
    return decl(node);
}

std::optional<DataType> parseDataType(const Ast& node) {
    static const auto typeName = uniqueNameChild(hie::ContextTag::DataDecl);
    static const auto constructors = pMany(nodeChildren, parseDataCon);

    auto name = typeName(node);
    if (!name)
        return std::nullopt;
    return DataType{name->first, std::move(name->second), std::move(*constructors(node))};
}

std::optional<DataCon> parseDataCon(const Ast& node) {
    static const auto conName = uniqueNameChild(hie::ContextTag::ConDecl);
    static const auto body = pAlt(makeParser(parseRecordBody), makeParser(parseNakedBody));

    auto name = conName(node);
    if (!name)
        return std::nullopt;
    auto parsedBody = body(node);
    if (!parsedBody)
        return std::nullopt;
    return DataCon{name->first, std::move(name->second), std::move(*parsedBody)};
}

std::optional<DataConBody> parseRecordBody(const Ast& node) {
    static const auto record = pOne(nodeChildren, parseRecordFields);
    return record(node);
}

std::optional<RecordField> parseRecordField(const Ast& node) {
    static const auto fieldName = uniqueNameChild(hie::ContextTag::RecFieldDecl);
    auto name = fieldName(node);
    if (!name)
        return std::nullopt;
    return RecordField{name->first, std::move(name->second), collectUses(node)};
}

// TODO: value bindings need their own context tags (ValBind, MatchBind) in the export
std::optional<Value> parseValue(const Ast&) {
    return std::nullopt;
}

std::optional<Class> parseClass(const Ast&) {
    return std::nullopt;
}

SymbolKeys collectUses(const Ast& node) {
    SymbolKeys uses;
    appendUses(node, uses);
    return uses;
}

} // namespace hiegraph::parse
