#pragma once

// Internal helpers shared by the Series kernel translation units.

#include <kestrel/series/series.hpp>

#include <cmath>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace kestrel::detail {

template <typename T>
[[nodiscard]] auto wrap(std::string name, ChunkedArray<T> array) -> Series {
    return Series(std::move(name), AnyArray{std::move(array)});
}

/// Walk two equal-length arrays in lockstep across their (possibly different)
/// chunk boundaries, calling f(lhs_value, lhs_valid, rhs_value, rhs_valid).
template <typename L, typename R, typename F>
void zip_for_each(const ChunkedArray<L>& lhs, const ChunkedArray<R>& rhs, F&& f) {
    const auto& lc = lhs.chunks();
    const auto& rc = rhs.chunks();
    std::size_t li = 0, lo = 0, ri = 0, ro = 0;
    while (li < lc.size() && ri < rc.size()) {
        if (lo == lc[li].size()) {
            ++li;
            lo = 0;
            continue;
        }
        if (ro == rc[ri].size()) {
            ++ri;
            ro = 0;
            continue;
        }
        f(lc[li].value(lo), lc[li].is_valid(lo), rc[ri].value(ro), rc[ri].is_valid(ro));
        ++lo;
        ++ro;
    }
}

/// Flat, writable copy of an array: values plus a full validity bitmap.
template <typename T>
struct Materialized {
    std::vector<T> values;
    Validity validity;

    [[nodiscard]] auto finish() && -> ChunkedArray<T> {
        bool any_null = false;
        for (bool valid : validity) {
            if (!valid) {
                any_null = true;
                break;
            }
        }
        std::optional<Validity> bits;
        if (any_null) {
            bits = std::move(validity);
        }
        return ChunkedArray<T>(std::move(values), std::move(bits));
    }
};

template <typename T>
[[nodiscard]] auto materialize(const ChunkedArray<T>& array) -> Materialized<T> {
    Materialized<T> out;
    out.values.reserve(array.size());
    out.validity.reserve(array.size());
    array.for_each([&](const auto& v, bool valid) {
        out.values.push_back(valid ? T(v) : T{});
        out.validity.push_back(valid);
    });
    return out;
}

/// Gather positions from `array`; nullopt positions become null. Indices must
/// already be bounds-checked.
template <typename T>
[[nodiscard]] auto gather(const ChunkedArray<T>& array,
                          std::span<const std::optional<std::size_t>> indices)
    -> ChunkedArray<T> {
    auto flat = array.rechunk();
    const auto& chunk = flat.chunks().front();
    ArrayBuilder<T> builder(indices.size());
    for (const auto& idx : indices) {
        if (idx.has_value()) {
            builder.push(chunk.get(*idx));
        } else {
            builder.push_null();
        }
    }
    return builder.finish();
}

template <typename T>
[[nodiscard]] auto gather(const ChunkedArray<T>& array, std::span<const std::size_t> indices)
    -> ChunkedArray<T> {
    auto flat = array.rechunk();
    const auto& chunk = flat.chunks().front();
    ArrayBuilder<T> builder(indices.size());
    for (auto idx : indices) {
        builder.push(chunk.get(idx));
    }
    return builder.finish();
}

/// Strict weak ordering used by sort, min and max. NaN orders above every
/// number and equal to other NaNs.
template <typename T>
[[nodiscard]] auto value_less(const T& lhs, const T& rhs) -> bool {
    if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(lhs)) {
            return false;
        }
        return std::isnan(rhs) || lhs < rhs;
    } else {
        return lhs < rhs;
    }
}

/// Equality where NaN equals NaN, used for structural comparisons.
template <typename T>
[[nodiscard]] auto value_equal(const T& lhs, const T& rhs) -> bool {
    if constexpr (std::is_floating_point_v<T>) {
        return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
    } else {
        return lhs == rhs;
    }
}

template <typename T>
inline constexpr bool is_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool>;

/// Exact comparison of two integers of any width and signedness.
template <typename L, typename R>
[[nodiscard]] auto integer_compare(CompareOp op, L lhs, R rhs) -> bool {
    switch (op) {
        case CompareOp::Eq:
            return std::cmp_equal(lhs, rhs);
        case CompareOp::Ne:
            return std::cmp_not_equal(lhs, rhs);
        case CompareOp::Lt:
            return std::cmp_less(lhs, rhs);
        case CompareOp::Le:
            return std::cmp_less_equal(lhs, rhs);
        case CompareOp::Gt:
            return std::cmp_greater(lhs, rhs);
        case CompareOp::Ge:
            return std::cmp_greater_equal(lhs, rhs);
    }
    return false;
}

/// Call f(lhs_array, rhs_array) with both arrays at their own integer types.
/// Throws std::invalid_argument unless both Series are integer typed.
template <typename F>
void visit_integers(const Series& lhs, const Series& rhs, F&& f) {
    std::visit(
        [&](const auto& larr, const auto& rarr) {
            using L = typename std::decay_t<decltype(larr)>::value_type;
            using R = typename std::decay_t<decltype(rarr)>::value_type;
            if constexpr (is_integer_v<L> && is_integer_v<R>) {
                f(larr, rarr);
            } else {
                throw std::invalid_argument("visit_integers: both series must be integer typed");
            }
        },
        lhs.array(), rhs.array());
}

/// Cast a numeric Series to `dtype`; never fails for numeric inputs.
[[nodiscard]] auto cast_numeric(const Series& series, DType dtype) -> Series;

}  // namespace kestrel::detail
