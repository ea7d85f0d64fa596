#include <kestrel/series/series.hpp>

#include "kernels.hpp"

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <string_view>
#include <type_traits>
#include <utility>

namespace kestrel {

namespace {

using Indices = std::vector<std::size_t>;

template <typename T>
inline constexpr bool radix_sortable_v =
    (std::is_integral_v<T> && !std::is_same_v<T, bool>) || is_temporal_v<T>;

constexpr std::uint64_t kSignFlip = std::uint64_t{1} << 63;

// Unsigned key whose order matches the value order. Signed values are
// sign-flipped so that unsigned comparison equals signed comparison.
template <typename T>
auto radix_key(const T& value) -> std::uint64_t {
    if constexpr (std::is_same_v<T, Date>) {
        return static_cast<std::uint64_t>(static_cast<std::int64_t>(value.days)) ^ kSignFlip;
    } else if constexpr (is_temporal_v<T>) {
        return static_cast<std::uint64_t>(value.nanos) ^ kSignFlip;
    } else if constexpr (std::is_signed_v<T>) {
        return static_cast<std::uint64_t>(static_cast<std::int64_t>(value)) ^ kSignFlip;
    } else {
        return static_cast<std::uint64_t>(value);
    }
}

// LSD radix sort over uint64 keys, returning the stable permutation.
// All 8 byte histograms are built in one pass; passes where every key shares
// the same byte are skipped.
auto radix_sort(std::vector<std::uint64_t> src_keys) -> Indices {
    const std::size_t rows = src_keys.size();
    std::array<std::array<std::size_t, 256>, 8> hists{};
    for (auto k : src_keys) {
        for (std::size_t p = 0; p < 8; ++p) {
            ++hists[p][(k >> (p * 8U)) & 0xFFU];
        }
    }

    std::vector<std::uint64_t> dst_keys(rows);
    Indices src_idx(rows), dst_idx(rows);
    std::iota(src_idx.begin(), src_idx.end(), std::size_t{0});

    std::array<std::size_t, 256> cnt{};
    for (std::size_t pass = 0; pass < 8; ++pass) {
        const auto& h = hists[pass];
        std::size_t non_zero = 0;
        for (auto c : h) {
            if (c != 0) {
                ++non_zero;
            }
        }
        if (non_zero <= 1) {
            continue;
        }

        auto shift = pass * 8U;
        std::size_t total = 0;
        for (std::size_t b = 0; b < 256; ++b) {
            cnt[b] = total;
            total += h[b];
        }
        for (std::size_t i = 0; i < rows; ++i) {
            std::size_t bucket = (src_keys[i] >> shift) & 0xFFU;
            dst_keys[cnt[bucket]] = src_keys[i];
            dst_idx[cnt[bucket]] = src_idx[i];
            ++cnt[bucket];
        }
        std::swap(src_keys, dst_keys);
        std::swap(src_idx, dst_idx);
    }
    return src_idx;
}

// Stable permutation of a single chunk. Valid values are ordered first
// (ascending) or last (descending); nulls take the other end.
template <typename T>
auto argsort_chunk(const Chunk<T>& chunk, bool reverse) -> Indices {
    Indices valid;
    Indices nulls;
    valid.reserve(chunk.size() - chunk.null_count());
    nulls.reserve(chunk.null_count());
    for (std::size_t i = 0; i < chunk.size(); ++i) {
        (chunk.is_valid(i) ? valid : nulls).push_back(i);
    }

    bool sorted = false;
    if constexpr (radix_sortable_v<T>) {
        if (!reverse) {
            std::vector<std::uint64_t> keys;
            keys.reserve(valid.size());
            for (auto idx : valid) {
                keys.push_back(radix_key<T>(chunk.value(idx)));
            }
            auto order = radix_sort(std::move(keys));
            Indices permuted;
            permuted.reserve(valid.size());
            for (auto pos : order) {
                permuted.push_back(valid[pos]);
            }
            valid = std::move(permuted);
            sorted = true;
        }
    }
    if (!sorted) {
        std::stable_sort(valid.begin(), valid.end(), [&](std::size_t a, std::size_t b) {
            return reverse ? detail::value_less<T>(chunk.value(b), chunk.value(a))
                           : detail::value_less<T>(chunk.value(a), chunk.value(b));
        });
    }

    if (reverse) {
        nulls.insert(nulls.end(), valid.begin(), valid.end());
        return nulls;
    }
    valid.insert(valid.end(), nulls.begin(), nulls.end());
    return valid;
}

// Hash key for uniqueness. Strings are viewed in place; temporal values hash
// by their raw count; floats collapse -0.0 onto 0.0 (NaN is tracked apart).
template <typename T>
auto unique_key(const T& value) {
    if constexpr (std::is_same_v<T, std::string>) {
        return std::string_view(value);
    } else if constexpr (std::is_same_v<T, Date>) {
        return value.days;
    } else if constexpr (is_temporal_v<T>) {
        return value.nanos;
    } else if constexpr (std::is_floating_point_v<T>) {
        return value == T{0} ? T{0} : value;
    } else {
        return value;
    }
}

}  // namespace

auto Series::argsort(bool reverse) const -> Result<std::vector<size_type>> {
    if (!supports(Op::Sort, dtype())) {
        return unsupported(Op::Sort, dtype());
    }
    return std::visit(
        [&](const auto& arr) -> Result<std::vector<size_type>> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (supports<T>(Op::Sort)) {
                auto flat = arr.rechunk();
                return argsort_chunk<T>(flat.chunks().front(), reverse);
            } else {
                return unsupported(Op::Sort, dtype_of_v<T>);
            }
        },
        array_);
}

auto Series::sort(bool reverse) const -> Result<Series> {
    auto order = argsort(reverse);
    if (!order) {
        return std::unexpected(std::move(order.error()));
    }
    return std::visit(
        [&](const auto& arr) -> Series {
            return detail::wrap(name_, detail::gather(arr, std::span<const std::size_t>(*order)));
        },
        array_);
}

auto Series::sort_mut(bool reverse) -> Result<void> {
    auto sorted = sort(reverse);
    if (!sorted) {
        return std::unexpected(std::move(sorted.error()));
    }
    spdlog::debug("sort_mut '{}': {} rows, reverse={}", name_, len(), reverse);
    array_ = std::move(sorted->array_);
    return {};
}

auto Series::arg_unique() const -> Result<std::vector<size_type>> {
    if (!supports(Op::ArgUnique, dtype())) {
        return unsupported(Op::ArgUnique, dtype());
    }
    return std::visit(
        [&](const auto& arr) -> Result<std::vector<size_type>> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (supports<T>(Op::ArgUnique)) {
                using Key = decltype(unique_key(std::declval<const T&>()));
                auto flat = arr.rechunk();
                const auto& chunk = flat.chunks().front();

                std::vector<size_type> firsts;
                robin_hood::unordered_flat_set<Key> seen;
                seen.reserve(chunk.size());
                bool seen_null = false;
                bool seen_nan = false;
                for (size_type i = 0; i < chunk.size(); ++i) {
                    if (!chunk.is_valid(i)) {
                        if (!seen_null) {
                            seen_null = true;
                            firsts.push_back(i);
                        }
                        continue;
                    }
                    if constexpr (std::is_floating_point_v<T>) {
                        if (std::isnan(chunk.value(i))) {
                            if (!seen_nan) {
                                seen_nan = true;
                                firsts.push_back(i);
                            }
                            continue;
                        }
                    }
                    if (seen.insert(unique_key<T>(chunk.value(i))).second) {
                        firsts.push_back(i);
                    }
                }
                return firsts;
            } else {
                return unsupported(Op::ArgUnique, dtype_of_v<T>);
            }
        },
        array_);
}

}  // namespace kestrel
