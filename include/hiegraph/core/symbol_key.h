// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <vector>
#include <fmt/format.h>

namespace hiegraph {

/**
 * @brief Identity of a named entity as assigned by the compiler that wrote the dump
 *
 * The raw value is the GHC unique of the name. It is only ever copied from the tree
 * source; nothing in hiegraph derives or invents keys.
 */
class SymbolKey {
public:
    constexpr explicit SymbolKey(int64_t raw) noexcept : raw_(raw) {}

    constexpr int64_t raw() const noexcept { return raw_; }

    friend constexpr bool operator==(const SymbolKey&, const SymbolKey&) = default;
    friend constexpr auto operator<=>(const SymbolKey&, const SymbolKey&) = default;

private:
    int64_t raw_;
};

// Ordered use-list; duplicates are meaningful
using SymbolKeys = std::vector<SymbolKey>;

} // namespace hiegraph

template <> struct std::hash<hiegraph::SymbolKey> {
    size_t operator()(const hiegraph::SymbolKey& key) const noexcept {
        return std::hash<int64_t>{}(key.raw());
    }
};

// Keys print as their raw value, so key lists can go through fmt::join
template <> struct fmt::formatter<hiegraph::SymbolKey> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const hiegraph::SymbolKey& key, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", key.raw());
    }
};
