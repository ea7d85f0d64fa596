#include <kestrel/series/series.hpp>

#include "kernels.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

namespace kestrel {

namespace {

auto out_of_range(std::int64_t index, std::size_t length) -> std::unexpected<Error> {
    return make_error(ErrorKind::IndexOutOfRange,
                      fmt::format("index {} is out of bounds for series of length {}", index,
                                  length));
}

// Truthiness of a Boolean mask; null entries count as false.
auto mask_bits(const Series& mask, std::size_t length, std::string_view what)
    -> Result<std::vector<bool>> {
    const auto* bits = mask.as<bool>();
    if (bits == nullptr) {
        return make_error(ErrorKind::UnsupportedTypeCombination,
                          fmt::format("{}: mask must have dtype 'bool', got '{}'", what,
                                      dtype_code(mask.dtype())));
    }
    if (mask.len() != length) {
        return make_error(ErrorKind::ShapeMismatch,
                          fmt::format("{}: mask length {} does not match series length {}", what,
                                      mask.len(), length));
    }
    std::vector<bool> out;
    out.reserve(length);
    bits->for_each([&](bool v, bool valid) { out.push_back(valid && v); });
    return out;
}

// Positions named by an integer Series. Null indices map to nullopt.
auto index_positions(const Series& indices, std::size_t length)
    -> Result<std::vector<std::optional<std::size_t>>> {
    return std::visit(
        [&](const auto& arr) -> Result<std::vector<std::optional<std::size_t>>> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
                std::vector<std::optional<std::size_t>> out;
                out.reserve(arr.size());
                std::optional<std::unexpected<Error>> failure;
                arr.for_each([&](T v, bool valid) {
                    if (failure.has_value()) {
                        return;
                    }
                    if (!valid) {
                        out.emplace_back(std::nullopt);
                        return;
                    }
                    if (std::cmp_less(v, 0) || std::cmp_greater_equal(v, length)) {
                        failure = out_of_range(static_cast<std::int64_t>(v), length);
                        return;
                    }
                    out.emplace_back(static_cast<std::size_t>(v));
                });
                if (failure.has_value()) {
                    return *failure;
                }
                return out;
            } else {
                return make_error(ErrorKind::UnsupportedTypeCombination,
                                  fmt::format("indices must have an integer dtype, got '{}'",
                                              dtype_code(dtype_of_v<T>)));
            }
        },
        indices.array());
}

// A run of `length` nulls.
template <typename T>
auto null_run(std::size_t length) -> ChunkedArray<T> {
    return ChunkedArray<T>(std::vector<T>(length), Validity(length, false));
}

}  // namespace

// ─── Indexing ─────────────────────────────────────────────────────────────────

auto Series::get(std::int64_t index) const -> Result<AnyValue> {
    if (index < 0 || std::cmp_greater_equal(index, len())) {
        return out_of_range(index, len());
    }
    auto pos = static_cast<size_type>(index);
    return std::visit(
        [&](const auto& arr) -> AnyValue {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            auto value = arr.get(pos);
            if (!value.has_value()) {
                return std::nullopt;
            }
            return Scalar(std::in_place_type<T>, std::move(*value));
        },
        array_);
}

auto Series::filter(const Series& mask) const -> Result<Series> {
    auto bits = mask_bits(mask, len(), "filter");
    if (!bits) {
        return std::unexpected(std::move(bits.error()));
    }
    std::vector<size_type> keep;
    keep.reserve(bits->size());
    for (size_type i = 0; i < bits->size(); ++i) {
        if ((*bits)[i]) {
            keep.push_back(i);
        }
    }
    if (keep.size() == len()) {
        return *this;
    }
    return std::visit(
        [&](const auto& arr) -> Series {
            return detail::wrap(name_, detail::gather(arr, std::span<const size_type>(keep)));
        },
        array_);
}

// ─── Slicing ──────────────────────────────────────────────────────────────────

auto Series::slice(std::int64_t offset, size_type length) const -> Result<Series> {
    if (offset < 0 || std::cmp_greater(offset, len()) ||
        length > len() - static_cast<size_type>(offset)) {
        return make_error(ErrorKind::IndexOutOfRange,
                          fmt::format("slice [{}, +{}) is out of bounds for series of length {}",
                                      offset, length, len()));
    }
    auto start = static_cast<size_type>(offset);
    return std::visit(
        [&](const auto& arr) -> Series { return detail::wrap(name_, arr.slice(start, length)); },
        array_);
}

auto Series::limit(size_type n) const -> Series {
    auto length = std::min(n, len());
    return std::visit(
        [&](const auto& arr) -> Series { return detail::wrap(name_, arr.slice(0, length)); },
        array_);
}

auto Series::head(size_type n) const -> Series {
    return limit(n);
}

auto Series::tail(size_type n) const -> Series {
    auto length = std::min(n, len());
    auto start = len() - length;
    return std::visit(
        [&](const auto& arr) -> Series { return detail::wrap(name_, arr.slice(start, length)); },
        array_);
}

// ─── Gather ───────────────────────────────────────────────────────────────────

auto Series::take(std::span<const size_type> indices) const -> Result<Series> {
    for (auto idx : indices) {
        if (idx >= len()) {
            return out_of_range(static_cast<std::int64_t>(idx), len());
        }
    }
    return std::visit(
        [&](const auto& arr) -> Series { return detail::wrap(name_, detail::gather(arr, indices)); },
        array_);
}

auto Series::take(const Series& indices) const -> Result<Series> {
    auto positions = index_positions(indices, len());
    if (!positions) {
        return std::unexpected(std::move(positions.error()));
    }
    return std::visit(
        [&](const auto& arr) -> Series {
            return detail::wrap(
                name_, detail::gather(arr, std::span<const std::optional<size_type>>(*positions)));
        },
        array_);
}

// ─── Indexed mutation (copy-on-write) ─────────────────────────────────────────

namespace {

// Copy `arr`, then write `value` (possibly null) at every position in
// `positions`. Fails if a non-null value does not convert to T exactly.
template <typename T, typename Positions>
auto write_at(const std::string& name, const ChunkedArray<T>& arr, const Positions& positions,
              const AnyValue& value) -> Result<Series> {
    std::optional<T> converted;
    if (value.has_value()) {
        converted = scalar_cast<T>(*value);
        if (!converted.has_value()) {
            return make_error(ErrorKind::UnsupportedTypeCombination,
                              fmt::format("cannot write a '{}' value into series '{}' of dtype '{}'",
                                          dtype_code(scalar_dtype(*value)), name,
                                          dtype_code(dtype_of_v<T>)));
        }
    }
    auto flat = detail::materialize(arr);
    for (auto pos : positions) {
        if (converted.has_value()) {
            flat.values[pos] = *converted;
            flat.validity[pos] = true;
        } else {
            flat.values[pos] = T{};
            flat.validity[pos] = false;
        }
    }
    return detail::wrap(name, std::move(flat).finish());
}

}  // namespace

auto Series::set(const Series& mask, const AnyValue& value) const -> Result<Series> {
    auto bits = mask_bits(mask, len(), "set");
    if (!bits) {
        return std::unexpected(std::move(bits.error()));
    }
    std::vector<size_type> positions;
    for (size_type i = 0; i < bits->size(); ++i) {
        if ((*bits)[i]) {
            positions.push_back(i);
        }
    }
    return std::visit(
        [&](const auto& arr) { return write_at(name_, arr, positions, value); }, array_);
}

auto Series::set_at_idx(std::span<const size_type> indices, const AnyValue& value) const
    -> Result<Series> {
    for (auto idx : indices) {
        if (idx >= len()) {
            return out_of_range(static_cast<std::int64_t>(idx), len());
        }
    }
    return std::visit(
        [&](const auto& arr) { return write_at(name_, arr, indices, value); }, array_);
}

auto Series::set_at_idx(const Series& indices, const AnyValue& value) const -> Result<Series> {
    auto positions = index_positions(indices, len());
    if (!positions) {
        return std::unexpected(std::move(positions.error()));
    }
    std::vector<size_type> targets;
    targets.reserve(positions->size());
    for (const auto& pos : *positions) {
        if (pos.has_value()) {
            targets.push_back(*pos);
        }
    }
    return set_at_idx(std::span<const size_type>(targets), value);
}

// ─── Shift and zip ────────────────────────────────────────────────────────────

auto Series::shift(std::int64_t periods) const -> Series {
    const auto n = len();
    if (periods == 0 || n == 0) {
        return *this;
    }
    auto magnitude = periods < 0 ? static_cast<std::uint64_t>(-(periods + 1)) + 1
                                 : static_cast<std::uint64_t>(periods);
    if (magnitude >= n) {
        return full_null(name_, dtype(), n);
    }
    auto k = static_cast<size_type>(magnitude);
    return std::visit(
        [&](const auto& arr) -> Series {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if (periods > 0) {
                auto out = null_run<T>(k);
                out.append(arr.slice(0, n - k));
                return detail::wrap(name_, std::move(out));
            }
            auto out = arr.slice(k, n - k);
            out.append(null_run<T>(k));
            return detail::wrap(name_, std::move(out));
        },
        array_);
}

auto Series::zip_with(const Series& mask, const Series& other) const -> Result<Series> {
    auto bits = mask_bits(mask, len(), "zip_with");
    if (!bits) {
        return std::unexpected(std::move(bits.error()));
    }
    if (other.dtype() != dtype()) {
        return make_error(ErrorKind::UnsupportedTypeCombination,
                          fmt::format("zip_with: cannot combine '{}' with '{}'",
                                      dtype_code(dtype()), dtype_code(other.dtype())));
    }
    if (other.len() != len()) {
        return make_error(ErrorKind::ShapeMismatch,
                          fmt::format("zip_with: other length {} does not match series length {}",
                                      other.len(), len()));
    }
    return std::visit(
        [&](const auto& arr) -> Series {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            const auto& alt = *other.as<T>();
            ArrayBuilder<T> builder(len());
            size_type i = 0;
            detail::zip_for_each(arr, alt, [&](const auto& lv, bool lvalid, const auto& rv,
                                               bool rvalid) {
                if ((*bits)[i++]) {
                    lvalid ? builder.push(T(lv)) : builder.push_null();
                } else {
                    rvalid ? builder.push(T(rv)) : builder.push_null();
                }
            });
            return detail::wrap(name_, builder.finish());
        },
        array_);
}

}  // namespace kestrel
