// Copyright (c) 2025 hiegraph Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace hiegraph::parse {

/**
 * @brief Value produced by parsers that only test their context
 */
using Unit = std::monostate;

/**
 * @brief A parser over a context of type Ctx producing an A
 *
 * A parser inspects the context it is given and either produces a value or returns
 * std::nullopt. Failure carries no position or message and has no side effects, so any
 * alternative can be retried on the same context.
 *
 * Plain functions with the signature std::optional<A>(const Ctx&) are parsers too; the
 * primitives below accept any callable of that shape. Sequencing is ordinary control
 * flow inside such a function: run a sub-parser, return std::nullopt if it failed,
 * continue with its value otherwise.
 */
template <typename Ctx, typename A> using TreeParser = std::function<std::optional<A>(const Ctx&)>;

/**
 * @brief Chooses the children a primitive descends into
 *
 * Range may be a reference to a container owned by the context or a container returned
 * by value. Children become the context of the sub-parser.
 */
template <typename Ctx, typename Range> using Selector = Range (*)(const Ctx&);

namespace detail {

template <typename Range>
using child_t =
    std::remove_cvref_t<std::ranges::range_reference_t<std::remove_reference_t<Range>>>;

template <typename Sub, typename Child>
using parser_value_t =
    typename std::remove_cvref_t<std::invoke_result_t<const Sub&, const Child&>>::value_type;

} // namespace detail

// Selector for contexts that already are the sequence to iterate
template <typename T> const T& selfSelect(const T& ctx) {
    return ctx;
}

template <typename Ctx, typename A>
TreeParser<Ctx, A> makeParser(std::optional<A> (*fn)(const Ctx&)) {
    return fn;
}

/**
 * @brief Runs sub on every selected child and collects the results
 *
 * Fails as soon as sub fails on any selected child. Selecting no child at all succeeds
 * with an empty vector.
 */
template <typename Ctx, typename Range, typename Sub,
          typename A = detail::parser_value_t<Sub, detail::child_t<Range>>>
TreeParser<Ctx, std::vector<A>> pAll(Selector<Ctx, Range> select, Sub sub) {
    return [select, sub = std::move(sub)](const Ctx& ctx) -> std::optional<std::vector<A>> {
        std::vector<A> results;
        for (const auto& child : select(ctx)) {
            auto result = sub(child);
            if (!result)
                return std::nullopt;
            results.push_back(std::move(*result));
        }
        return results;
    };
}

/**
 * @brief Runs sub on every selected child, keeping the successes in order
 *
 * Never fails.
 */
template <typename Ctx, typename Range, typename Sub,
          typename A = detail::parser_value_t<Sub, detail::child_t<Range>>>
TreeParser<Ctx, std::vector<A>> pMany(Selector<Ctx, Range> select, Sub sub) {
    return [select, sub = std::move(sub)](const Ctx& ctx) -> std::optional<std::vector<A>> {
        std::vector<A> results;
        for (const auto& child : select(ctx)) {
            if (auto result = sub(child))
                results.push_back(std::move(*result));
        }
        return results;
    };
}

/**
 * @brief Like pMany, but fails when no child matches
 *
 * The vector of a successful result is never empty.
 */
template <typename Ctx, typename Range, typename Sub,
          typename A = detail::parser_value_t<Sub, detail::child_t<Range>>>
TreeParser<Ctx, std::vector<A>> pSome(Selector<Ctx, Range> select, Sub sub) {
    return [many = pMany(select, std::move(sub))](const Ctx& ctx) -> std::optional<std::vector<A>> {
        auto results = many(ctx);
        if (!results || results->empty())
            return std::nullopt;
        return results;
    };
}

/**
 * @brief Result of sub on the first selected child it accepts
 *
 * Children are tried in selection order and the search stops at the first success; a
 * later child that would also match is never looked at.
 */
template <typename Ctx, typename Range, typename Sub,
          typename A = detail::parser_value_t<Sub, detail::child_t<Range>>>
TreeParser<Ctx, A> pAny(Selector<Ctx, Range> select, Sub sub) {
    return [select, sub = std::move(sub)](const Ctx& ctx) -> std::optional<A> {
        for (const auto& child : select(ctx)) {
            if (auto result = sub(child))
                return result;
        }
        return std::nullopt;
    };
}

/**
 * @brief Result of sub on the only selected child it accepts
 *
 * Fails when sub accepts no child or more than one.
 */
template <typename Ctx, typename Range, typename Sub,
          typename A = detail::parser_value_t<Sub, detail::child_t<Range>>>
TreeParser<Ctx, A> pOne(Selector<Ctx, Range> select, Sub sub) {
    return [select, sub = std::move(sub)](const Ctx& ctx) -> std::optional<A> {
        std::optional<A> found;
        for (const auto& child : select(ctx)) {
            auto result = sub(child);
            if (!result)
                continue;
            if (found)
                return std::nullopt;
            found = std::move(result);
        }
        return found;
    };
}

template <typename Ctx, typename Pred> TreeParser<Ctx, Unit> pCheck(Pred predicate) {
    return [predicate = std::move(predicate)](const Ctx& ctx) -> std::optional<Unit> {
        if (predicate(ctx))
            return Unit{};
        return std::nullopt;
    };
}

/**
 * @brief Runs sub with a fixed context, ignoring the current one
 */
template <typename Ctx, typename Inner, typename Sub,
          typename A = detail::parser_value_t<Sub, Inner>>
TreeParser<Ctx, A> pWithContext(Inner context, Sub sub) {
    return [context = std::move(context), sub = std::move(sub)](const Ctx&) -> std::optional<A> {
        return sub(context);
    };
}

/**
 * @brief Runs sub on a projection of the current context
 */
template <typename Ctx, typename Inner, typename Sub,
          typename A = detail::parser_value_t<Sub, std::remove_cvref_t<Inner>>>
TreeParser<Ctx, A> pLocal(Inner (*project)(const Ctx&), Sub sub) {
    return [project, sub = std::move(sub)](const Ctx& ctx) -> std::optional<A> {
        return sub(project(ctx));
    };
}

template <typename Ctx, typename A, typename F,
          typename B = std::remove_cvref_t<std::invoke_result_t<const F&, A&&>>>
TreeParser<Ctx, B> pMap(TreeParser<Ctx, A> parser, F f) {
    return [parser = std::move(parser), f = std::move(f)](const Ctx& ctx) -> std::optional<B> {
        auto result = parser(ctx);
        if (!result)
            return std::nullopt;
        return f(std::move(*result));
    };
}

/**
 * @brief Ordered choice: second runs only when first fails
 */
template <typename Ctx, typename A>
TreeParser<Ctx, A> pAlt(TreeParser<Ctx, A> first, TreeParser<Ctx, A> second) {
    return [first = std::move(first), second = std::move(second)](const Ctx& ctx) {
        if (auto result = first(ctx))
            return result;
        return second(ctx);
    };
}

template <typename Ctx, typename A>
TreeParser<Ctx, A> pFirstOf(std::initializer_list<TreeParser<Ctx, A>> alternatives) {
    return [alternatives = std::vector<TreeParser<Ctx, A>>(alternatives)](
               const Ctx& ctx) -> std::optional<A> {
        for (const auto& alternative : alternatives) {
            if (auto result = alternative(ctx))
                return result;
        }
        return std::nullopt;
    };
}

// Always succeeds; the inner optional is empty when parser failed
template <typename Ctx, typename A>
TreeParser<Ctx, std::optional<A>> pOptional(TreeParser<Ctx, A> parser) {
    return [parser = std::move(parser)](const Ctx& ctx) -> std::optional<std::optional<A>> {
        return std::optional<std::optional<A>>{std::in_place, parser(ctx)};
    };
}

} // namespace hiegraph::parse
