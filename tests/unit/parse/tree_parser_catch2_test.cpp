// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include <hiegraph/parse/tree_parser.h>

using namespace hiegraph::parse;

namespace {

using Ints = std::vector<int>;
using Labelled = std::pair<std::string, Ints>;

std::optional<int> evenValue(const int& x) {
    if (x % 2 == 0)
        return x;
    return std::nullopt;
}

std::optional<int> aboveOne(const int& x) {
    if (x > 1)
        return x;
    return std::nullopt;
}

const Ints& labelledValues(const Labelled& labelled) {
    return labelled.second;
}

std::string labelOf(const Labelled& labelled) {
    return labelled.first;
}

// Selector returning its children by value
Ints countdown(const int& n) {
    Ints out;
    for (int i = n; i > 0; --i)
        out.push_back(i);
    return out;
}

const auto kSelf = &selfSelect<Ints>;

} // namespace

TEST_CASE("pOne requires exactly one match", "[parse][tree_parser]") {
    auto one = pOne(kSelf, evenValue);

    SECTION("single match succeeds") {
        auto result = one(Ints{1, 2, 3});
        REQUIRE(result.has_value());
        CHECK(*result == 2);
    }

    SECTION("no match fails") {
        CHECK_FALSE(one(Ints{1, 3, 5}).has_value());
    }

    SECTION("two matches fail") {
        CHECK_FALSE(one(Ints{2, 3, 4}).has_value());
    }

    SECTION("no children fails") {
        CHECK_FALSE(one(Ints{}).has_value());
    }
}

TEST_CASE("pMany never fails and keeps order", "[parse][tree_parser]") {
    auto many = pMany(kSelf, evenValue);

    SECTION("successes in child order") {
        auto result = many(Ints{4, 1, 2, 7, 8});
        REQUIRE(result.has_value());
        CHECK(*result == Ints{4, 2, 8});
    }

    SECTION("no successes gives an empty result") {
        auto result = many(Ints{1, 3});
        REQUIRE(result.has_value());
        CHECK(result->empty());
    }

    SECTION("no children gives an empty result") {
        auto result = many(Ints{});
        REQUIRE(result.has_value());
        CHECK(result->empty());
    }
}

TEST_CASE("pSome requires a non-empty result", "[parse][tree_parser]") {
    auto some = pSome(kSelf, evenValue);

    auto result = some(Ints{1, 6, 3});
    REQUIRE(result.has_value());
    CHECK(*result == Ints{6});

    CHECK_FALSE(some(Ints{1, 3}).has_value());
    CHECK_FALSE(some(Ints{}).has_value());
}

TEST_CASE("pAny returns the first match", "[parse][tree_parser]") {
    auto any = pAny(kSelf, aboveOne);

    SECTION("first success wins") {
        auto result = any(Ints{1, 3, 2});
        REQUIRE(result.has_value());
        CHECK(*result == 3);
    }

    SECTION("later children are not inspected") {
        int calls = 0;
        auto counting = pAny(kSelf, [&calls](const int& x) -> std::optional<int> {
            ++calls;
            return aboveOne(x);
        });
        REQUIRE(counting(Ints{5, 6, 7}).has_value());
        CHECK(calls == 1);
    }

    SECTION("no match fails") {
        CHECK_FALSE(any(Ints{0, 1}).has_value());
    }
}

TEST_CASE("pAll is all-or-nothing", "[parse][tree_parser]") {
    auto all = pAll(kSelf, evenValue);

    auto result = all(Ints{2, 4});
    REQUIRE(result.has_value());
    CHECK(*result == Ints{2, 4});

    CHECK_FALSE(all(Ints{2, 3, 4}).has_value());

    auto empty = all(Ints{});
    REQUIRE(empty.has_value());
    CHECK(empty->empty());
}

TEST_CASE("Selectors may return children by value", "[parse][tree_parser]") {
    auto evens = pMany(&countdown, evenValue);
    auto result = evens(5);
    REQUIRE(result.has_value());
    CHECK(*result == Ints{4, 2});
}

TEST_CASE("pCheck tests the context", "[parse][tree_parser]") {
    auto positive = pCheck<int>([](const int& x) { return x > 0; });
    CHECK(positive(3).has_value());
    CHECK_FALSE(positive(-3).has_value());
}

TEST_CASE("Context switching", "[parse][tree_parser]") {
    SECTION("pWithContext ignores the current context") {
        auto fixed = pWithContext<int>(Ints{1, 2, 4}, pMany(kSelf, evenValue));
        auto result = fixed(99);
        REQUIRE(result.has_value());
        CHECK(*result == Ints{2, 4});
    }

    SECTION("pLocal runs on a projection") {
        auto inner = pLocal(&labelledValues, pOne(kSelf, evenValue));
        auto result = inner(Labelled{"xs", Ints{3, 8}});
        REQUIRE(result.has_value());
        CHECK(*result == 8);

        auto label = pLocal(&labelOf, [](const std::string& s) -> std::optional<size_t> {
            return s.size();
        });
        CHECK(label(Labelled{"four", {}}) == std::optional<size_t>{4});
    }
}

TEST_CASE("Alternation and transformation", "[parse][tree_parser]") {
    TreeParser<int, int> even = evenValue;
    TreeParser<int, int> big = aboveOne;

    SECTION("pAlt tries the second parser only after the first fails") {
        auto either = pAlt(even, pMap(big, [](int x) { return x * 100; }));
        CHECK(either(4) == std::optional<int>{4});
        CHECK(either(3) == std::optional<int>{300});
        CHECK_FALSE(either(1).has_value());
    }

    SECTION("pFirstOf keeps declaration order") {
        auto first = pFirstOf<int, std::string>({
            pMap(big, [](int) { return std::string("big"); }),
            pMap(even, [](int) { return std::string("even"); }),
        });
        CHECK(first(4) == std::optional<std::string>{"big"});
        CHECK(first(0) == std::optional<std::string>{"even"});
        CHECK_FALSE(first(1).has_value());
    }

    SECTION("pOptional absorbs failure") {
        auto maybeEven = pOptional(even);
        auto hit = maybeEven(2);
        REQUIRE(hit.has_value());
        CHECK(*hit == std::optional<int>{2});

        auto miss = maybeEven(3);
        REQUIRE(miss.has_value());
        CHECK_FALSE(miss->has_value());
    }

    SECTION("makeParser wraps a production function") {
        auto parser = makeParser(evenValue);
        CHECK(parser(6) == std::optional<int>{6});
    }
}
