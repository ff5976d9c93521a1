// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <variant>
#include <vector>
#include <hiegraph/core/symbol_key.h>

namespace hiegraph::parse {

struct RecordField {
    SymbolKey key;
    std::string name;
    SymbolKeys uses;
};

struct RecordBody {
    std::vector<RecordField> fields;
};

// Constructor without record syntax; uses cover the whole constructor
struct NakedBody {
    SymbolKeys uses;
};

using DataConBody = std::variant<RecordBody, NakedBody>;

struct DataCon {
    SymbolKey key;
    std::string name;
    DataConBody body;
};

struct DataType {
    SymbolKey key;
    std::string name;
    std::vector<DataCon> cons;
};

// Value bindings are not extracted yet; no production yields one
struct Value {};

struct ClassMethod {};

// Class declarations are not extracted yet; no production yields one
struct Class {
    SymbolKey key;
    std::string name;
    std::vector<ClassMethod> methods;
};

using TopLevelDecl = std::variant<DataType, Value, Class>;

struct Module {
    std::string name;
    std::string path;
    std::vector<TopLevelDecl> decls;
    std::vector<std::string> imports;
};

} // namespace hiegraph::parse
