#include <kestrel/series/series.hpp>

#include "kernels.hpp"

#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <type_traits>
#include <utility>

namespace kestrel {

namespace {

template <typename T>
void fill_forward(detail::Materialized<T>& flat) {
    std::optional<std::size_t> last;
    for (std::size_t i = 0; i < flat.values.size(); ++i) {
        if (flat.validity[i]) {
            last = i;
        } else if (last.has_value()) {
            flat.values[i] = flat.values[*last];
            flat.validity[i] = true;
        }
    }
}

template <typename T>
void fill_backward(detail::Materialized<T>& flat) {
    std::optional<std::size_t> next;
    for (std::size_t i = flat.values.size(); i-- > 0;) {
        if (flat.validity[i]) {
            next = i;
        } else if (next.has_value()) {
            flat.values[i] = flat.values[*next];
            flat.validity[i] = true;
        }
    }
}

template <typename T>
void fill_constant(detail::Materialized<T>& flat, const T& value) {
    for (std::size_t i = 0; i < flat.values.size(); ++i) {
        if (!flat.validity[i]) {
            flat.values[i] = value;
            flat.validity[i] = true;
        }
    }
}

// Validity of `arr` as a Boolean array (true where valid), optionally negated.
template <typename T>
auto validity_mask(const ChunkedArray<T>& arr, bool negate) -> ChunkedArray<bool> {
    std::vector<bool> out;
    out.reserve(arr.size());
    for (const auto& chunk : arr.chunks()) {
        for (std::size_t i = 0; i < chunk.size(); ++i) {
            out.push_back(chunk.is_valid(i) != negate);
        }
    }
    return ChunkedArray<bool>(std::move(out));
}

}  // namespace

auto parse_fill_strategy(std::string_view name) -> Result<FillStrategy> {
    if (name == "forward") {
        return FillStrategy::Forward;
    }
    if (name == "backward") {
        return FillStrategy::Backward;
    }
    if (name == "min") {
        return FillStrategy::Min;
    }
    if (name == "max") {
        return FillStrategy::Max;
    }
    if (name == "mean") {
        return FillStrategy::Mean;
    }
    return make_error(ErrorKind::InvalidStrategy,
                      fmt::format("unknown fill strategy '{}' (expected forward, backward, min, "
                                  "max or mean)",
                                  name));
}

auto Series::is_null() const -> Series {
    return std::visit(
        [&](const auto& arr) { return detail::wrap(name_, validity_mask(arr, true)); }, array_);
}

auto Series::is_not_null() const -> Series {
    return std::visit(
        [&](const auto& arr) { return detail::wrap(name_, validity_mask(arr, false)); }, array_);
}

auto Series::fill_none(std::string_view strategy) const -> Result<Series> {
    auto parsed = parse_fill_strategy(strategy);
    if (!parsed) {
        return std::unexpected(std::move(parsed.error()));
    }
    return fill_none(*parsed);
}

auto Series::fill_none(FillStrategy strategy) const -> Result<Series> {
    // The fill value, if the strategy needs one.
    AnyValue fill;
    switch (strategy) {
        case FillStrategy::Forward:
        case FillStrategy::Backward:
            break;
        case FillStrategy::Min:
        case FillStrategy::Max: {
            auto value = strategy == FillStrategy::Min ? min() : max();
            if (!value) {
                return std::unexpected(std::move(value.error()));
            }
            fill = std::move(*value);
            break;
        }
        case FillStrategy::Mean: {
            if (!is_numeric()) {
                return make_error(
                    ErrorKind::UnsupportedTypeCombination,
                    fmt::format("mean fill needs a numeric series, '{}' has dtype '{}'", name_,
                                dtype_code(dtype())));
            }
            auto value = mean();
            if (!value) {
                return std::unexpected(std::move(value.error()));
            }
            if (value->has_value()) {
                // The mean of an integer series truncates toward zero; it lies
                // between the series' min and max, so the whole part fits.
                double mean_value = is_integer(dtype()) ? std::trunc(**value) : **value;
                fill = Scalar(std::in_place_type<double>, mean_value);
            }
            break;
        }
    }

    if (null_count() == 0) {
        return *this;
    }
    bool by_value = strategy != FillStrategy::Forward && strategy != FillStrategy::Backward;
    if (by_value && !fill.has_value()) {
        return *this;  // all null: nothing to fill from
    }

    return std::visit(
        [&](const auto& arr) -> Result<Series> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            auto flat = detail::materialize(arr);
            if (strategy == FillStrategy::Forward) {
                fill_forward(flat);
            } else if (strategy == FillStrategy::Backward) {
                fill_backward(flat);
            } else {
                auto value = scalar_cast<T>(*fill);
                if (!value.has_value()) {
                    return type_mismatch(scalar_dtype(*fill), "fill_none");
                }
                fill_constant(flat, *value);
            }
            return detail::wrap(name_, std::move(flat).finish());
        },
        array_);
}

}  // namespace kestrel
