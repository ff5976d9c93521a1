// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <hiegraph/parse/module_printer.h>

#include <iterator>
#include <type_traits>
#include <variant>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace hiegraph::parse {

using json = nlohmann::json;

namespace {

template <typename... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

std::string formatKeys(const SymbolKeys& keys) {
    return fmt::format("[{}]", fmt::join(keys, ", "));
}

json keysToJson(const SymbolKeys& keys) {
    json out = json::array();
    for (const auto& key : keys)
        out.push_back(key.raw());
    return out;
}

class Printer {
public:
    template <typename... Args> void line(fmt::format_string<Args...> format, Args&&... args) {
        out_.append(static_cast<size_t>(indent_) * 2, ' ');
        fmt::format_to(std::back_inserter(out_), format, std::forward<Args>(args)...);
        out_.push_back('\n');
    }

    void indent() { ++indent_; }
    void dedent() { --indent_; }

    std::string take() { return std::move(out_); }

private:
    std::string out_;
    int indent_ = 0;
};

void printDataCon(Printer& p, const DataCon& con) {
    std::visit(Overloaded{
                   [&](const NakedBody& body) {
                       p.line("con {} #{} uses {}", con.name, con.key,
                              formatKeys(body.uses));
                   },
                   [&](const RecordBody& body) {
                       p.line("con {} #{} record", con.name, con.key);
                       p.indent();
                       for (const auto& field : body.fields)
                           p.line("field {} #{} uses {}", field.name, field.key,
                                  formatKeys(field.uses));
                       p.dedent();
                   },
               },
               con.body);
}

void printDecl(Printer& p, const TopLevelDecl& decl) {
    std::visit(Overloaded{
                   [&](const DataType& data) {
                       p.line("data {} #{}", data.name, data.key);
                       p.indent();
                       for (const auto& con : data.cons)
                           printDataCon(p, con);
                       p.dedent();
                   },
                   [&](const Value&) { p.line("value"); },
                   [&](const Class& cls) { p.line("class {} #{}", cls.name, cls.key); },
               },
               decl);
}

void printModule(Printer& p, const Module& module) {
    p.line("module {} ({})", module.name, module.path);
    p.indent();
    for (const auto& imported : module.imports)
        p.line("import {}", imported);
    for (const auto& decl : module.decls)
        printDecl(p, decl);
    p.dedent();
}

std::string formatContext(const std::set<hie::ContextTag>& context) {
    std::string out = "{";
    bool first = true;
    for (auto tag : context) {
        if (!first)
            out += ", ";
        out += hie::contextTagName(tag);
        first = false;
    }
    out += "}";
    return out;
}

void printAst(Printer& p, const hie::RawAst& node) {
    std::string annotations;
    for (auto tag : node.info.annotations) {
        if (!annotations.empty())
            annotations += " ";
        annotations += hie::annotationTagName(tag);
    }
    p.line("node [{}] types {} at {}:{}:{}-{}:{}", annotations,
           fmt::format("[{}]", fmt::join(node.info.types, ", ")), node.span.file,
           node.span.start.line, node.span.start.column, node.span.end.line,
           node.span.end.column);

    p.indent();
    for (const auto& [identifier, details] : node.info.identifiers) {
        auto type = details.type ? std::to_string(*details.type) : std::string("-");
        if (const auto* name = std::get_if<hie::Name>(&identifier))
            p.line("name {} #{} type {} {}", name->occName, name->key, type,
                   formatContext(details.context));
        else
            p.line("module {} {}", std::get<hie::ModuleName>(identifier).name,
                   formatContext(details.context));
    }
    for (const auto& child : node.children)
        printAst(p, child);
    p.dedent();
}

void printTypeTerm(Printer& p, size_t index, const hie::TypeTerm& term) {
    std::visit(Overloaded{
                   [&](const hie::TypeVar& var) {
                       p.line("{}: var {} #{}", index, var.name.occName, var.name.key);
                   },
                   [&](const hie::StructuralType& structural) {
                       p.line("{}: {} [{}]", index, hie::typeTermKindName(structural.kind),
                              fmt::join(structural.args, ", "));
                   },
               },
               term);
}

json dataConToJson(const DataCon& con) {
    json out = {{"key", con.key.raw()}, {"name", con.name}};
    std::visit(Overloaded{
                   [&](const NakedBody& body) {
                       out["naked"] = {{"uses", keysToJson(body.uses)}};
                   },
                   [&](const RecordBody& body) {
                       json fields = json::array();
                       for (const auto& field : body.fields)
                           fields.push_back({{"key", field.key.raw()},
                                             {"name", field.name},
                                             {"uses", keysToJson(field.uses)}});
                       out["record"] = std::move(fields);
                   },
               },
               con.body);
    return out;
}

json declToJson(const TopLevelDecl& decl) {
    return std::visit(Overloaded{
                          [](const DataType& data) {
                              json cons = json::array();
                              for (const auto& con : data.cons)
                                  cons.push_back(dataConToJson(con));
                              return json{{"kind", "data"},
                                          {"key", data.key.raw()},
                                          {"name", data.name},
                                          {"constructors", std::move(cons)}};
                          },
                          [](const Value&) { return json{{"kind", "value"}}; },
                          [](const Class& cls) {
                              return json{
                                  {"kind", "class"}, {"key", cls.key.raw()}, {"name", cls.name}};
                          },
                      },
                      decl);
}

} // namespace

std::string formatModule(const Module& module) {
    Printer p;
    printModule(p, module);
    return p.take();
}

std::string formatModules(const std::vector<Module>& modules) {
    Printer p;
    for (const auto& module : modules)
        printModule(p, module);
    return p.take();
}

std::string formatHieFile(const hie::HieFile& file) {
    Printer p;
    p.line("hie {} ({})", file.moduleName, file.sourcePath);
    p.indent();
    p.line("types");
    p.indent();
    for (size_t i = 0; i < file.types.size(); ++i)
        printTypeTerm(p, i, file.types[i]);
    p.dedent();
    for (const auto& [path, ast] : file.asts) {
        p.line("ast {}", path);
        p.indent();
        printAst(p, ast);
        p.dedent();
    }
    p.dedent();
    return p.take();
}

json moduleToJson(const Module& module) {
    json decls = json::array();
    for (const auto& decl : module.decls)
        decls.push_back(declToJson(decl));
    return json{{"name", module.name},
                {"path", module.path},
                {"imports", module.imports},
                {"decls", std::move(decls)}};
}

json modulesToJson(const std::vector<Module>& modules) {
    json out = json::array();
    for (const auto& module : modules)
        out.push_back(moduleToJson(module));
    return out;
}

} // namespace hiegraph::parse
