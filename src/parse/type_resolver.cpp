// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <hiegraph/parse/type_resolver.h>

#include <variant>

namespace hiegraph::parse {

namespace {

// Depth-first expansion over an explicit stack of structural entries
class Expansion {
public:
    explicit Expansion(const hie::TypeTable& types)
        : types_(types), active_(types.size(), false) {}

    void expand(hie::TypeIndex root, SymbolKeys& out) {
        enter(root, out);
        while (!stack_.empty()) {
            auto& frame = stack_.back();
            const auto& args = std::get<hie::StructuralType>(types_[frame.slot]).args;
            if (frame.next == args.size()) {
                active_[frame.slot] = false;
                stack_.pop_back();
                continue;
            }
            auto arg = args[frame.next++];
            enter(arg, out);
        }
    }

private:
    struct Frame {
        size_t slot;
        size_t next;
    };

    void enter(hie::TypeIndex index, SymbolKeys& out) {
        auto slot = static_cast<size_t>(index);
        if (active_[slot])
            return;
        if (const auto* var = std::get_if<hie::TypeVar>(&types_[slot])) {
            out.push_back(var->name.key);
            return;
        }
        active_[slot] = true;
        stack_.push_back(Frame{slot, 0});
    }

    const hie::TypeTable& types_;
    // Indices on the current expansion path
    std::vector<bool> active_;
    std::vector<Frame> stack_;
};

} // namespace

SymbolKeys resolveType(const hie::TypeTable& types, hie::TypeIndex root) {
    SymbolKeys keys;
    Expansion expansion(types);
    expansion.expand(root, keys);
    return keys;
}

ResolvedTypes resolveTypes(const hie::TypeTable& types) {
    ResolvedTypes resolved;
    resolved.reserve(types.size());
    for (size_t i = 0; i < types.size(); ++i)
        resolved.push_back(resolveType(types, static_cast<hie::TypeIndex>(i)));
    return resolved;
}

std::optional<hie::TypeIndex> findInvalidTypeIndex(const hie::TypeTable& types) {
    const auto size = static_cast<hie::TypeIndex>(types.size());
    for (const auto& term : types) {
        const auto* structural = std::get_if<hie::StructuralType>(&term);
        if (!structural)
            continue;
        for (auto arg : structural->args) {
            if (arg < 0 || arg >= size)
                return arg;
        }
    }
    return std::nullopt;
}

} // namespace hiegraph::parse
