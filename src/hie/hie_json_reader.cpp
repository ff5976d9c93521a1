// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <hiegraph/hie/hie_json_reader.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace hiegraph::hie {

using json = nlohmann::json;

namespace {

// Structural problems the JSON library itself does not detect
class DumpFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Narrows a JSON integer to a type index, rejecting anything outside 0..typeCount-1
TypeIndex checkedTypeIndex(const json& j, size_t typeCount, const std::string& where) {
    if (!j.is_number_integer())
        throw DumpFormatError(where + ": type index must be an integer");
    if (j.is_number_unsigned()) {
        auto index = j.get<uint64_t>();
        if (index >= typeCount)
            throw DumpFormatError(where + ": type index " + std::to_string(index) +
                                  " outside type table");
        return static_cast<TypeIndex>(index);
    }
    auto index = j.get<int64_t>();
    if (index < 0 || static_cast<uint64_t>(index) >= typeCount)
        throw DumpFormatError(where + ": type index " + std::to_string(index) +
                              " outside type table");
    return static_cast<TypeIndex>(index);
}

class NodeReader {
public:
    explicit NodeReader(size_t typeCount) : typeCount_(typeCount) {}

    RawAst read(const json& j, const std::string& where) const {
        RawAst node;
        if (!j.is_object())
            throw DumpFormatError(where + ": node must be an object");

        if (auto it = j.find("annotations"); it != j.end()) {
            for (const auto& pair : *it) {
                if (!pair.is_array() || pair.size() != 2)
                    throw DumpFormatError(where + ": annotation must be a [constructor, type]");
                node.info.annotations.insert(
                    classifyAnnotation(pair[0].get<std::string>(), pair[1].get<std::string>()));
            }
        }

        if (auto it = j.find("types"); it != j.end()) {
            for (const auto& index : *it)
                node.info.types.push_back(typeIndex(index, where));
        }

        if (auto it = j.find("identifiers"); it != j.end()) {
            for (const auto& entry : *it)
                readIdentifier(entry, node.info.identifiers, where);
        }

        if (auto it = j.find("span"); it != j.end())
            node.span = readSpan(*it);

        if (auto it = j.find("children"); it != j.end()) {
            node.children.reserve(it->size());
            size_t i = 0;
            for (const auto& child : *it) {
                auto childWhere = where + ".children[" + std::to_string(i++) + "]";
                node.children.push_back(read(child, childWhere));
            }
        }
        return node;
    }

private:
    TypeIndex typeIndex(const json& j, const std::string& where) const {
        return checkedTypeIndex(j, typeCount_, where);
    }

    void readIdentifier(const json& j, IdentifierTable<TypeIndex>& table,
                        const std::string& where) const {
        IdentifierDetails<TypeIndex> details;
        if (auto it = j.find("type"); it != j.end() && !it->is_null())
            details.type = typeIndex(*it, where);
        if (auto it = j.find("context"); it != j.end()) {
            for (const auto& ctx : *it)
                details.context.insert(classifyContext(ctx.get<std::string>()));
        }

        Identifier identifier;
        if (auto it = j.find("module"); it != j.end()) {
            identifier = ModuleName{it->get<std::string>()};
        } else if (auto nameIt = j.find("name"); nameIt != j.end()) {
            identifier = Name{SymbolKey{nameIt->at("key").get<int64_t>()},
                              nameIt->at("occ").get<std::string>()};
        } else {
            throw DumpFormatError(where + ": identifier needs \"module\" or \"name\"");
        }

        // Repeated identifiers merge their contexts, as in the dump's own map
        auto [pos, inserted] = table.emplace(std::move(identifier), details);
        if (!inserted) {
            pos->second.context.insert(details.context.begin(), details.context.end());
            if (!pos->second.type)
                pos->second.type = details.type;
        }
    }

    static Position readPosition(const json& j) {
        return Position{j.at(0).get<int>(), j.at(1).get<int>()};
    }

    static Span readSpan(const json& j) {
        Span span;
        span.file = j.value("file", std::string{});
        if (auto it = j.find("start"); it != j.end())
            span.start = readPosition(*it);
        if (auto it = j.find("end"); it != j.end())
            span.end = readPosition(*it);
        return span;
    }

    size_t typeCount_;
};

TypeTerm readTypeTerm(const json& j, size_t index, size_t typeCount) {
    const auto kind = j.at("kind").get<std::string>();
    if (kind == "var") {
        auto key = SymbolKey{j.at("key").get<int64_t>()};
        return TypeVar{Name{key, j.value("name", std::string{})}};
    }

    auto structuralKind = typeTermKindFromString(kind);
    if (!structuralKind)
        throw DumpFormatError("types[" + std::to_string(index) + "]: unknown kind '" + kind +
                              "'");

    StructuralType term;
    term.kind = *structuralKind;
    if (auto it = j.find("args"); it != j.end()) {
        auto where = "types[" + std::to_string(index) + "]: argument";
        for (const auto& arg : *it)
            term.args.push_back(checkedTypeIndex(arg, typeCount, where));
    }
    return term;
}

HieFile readHieFile(const json& doc) {
    HieFile file;
    file.moduleName = doc.at("module").get<std::string>();
    file.sourcePath = doc.at("path").get<std::string>();

    const auto& types = doc.at("types");
    file.types.reserve(types.size());
    for (const auto& term : types)
        file.types.push_back(readTypeTerm(term, file.types.size(), types.size()));

    NodeReader reader(file.types.size());
    const auto& asts = doc.at("asts");
    if (!asts.is_object())
        throw DumpFormatError("asts must be an object keyed by source file");
    for (const auto& [path, node] : asts.items())
        file.asts.emplace(path, reader.read(node, "asts[" + path + "]"));
    return file;
}

} // namespace

Result<HieFile> parseHieJson(std::string_view text) {
    try {
        auto doc = json::parse(text);
        return readHieFile(doc);
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed dump: ") + e.what()};
    } catch (const DumpFormatError& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed dump: ") + e.what()};
    }
}

Result<HieFile> readHieJson(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return Error{ErrorCode::FileNotFound, "No such dump: " + path.string()};

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorCode::PermissionDenied, "Cannot open dump: " + path.string()};

    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto file = parseHieJson(buffer.str());
    if (!file)
        return Error{file.error().code, path.string() + ": " + file.error().message};
    return file;
}

} // namespace hiegraph::hie
