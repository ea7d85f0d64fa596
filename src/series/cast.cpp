#include <kestrel/series/series.hpp>

#include "kernels.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace kestrel {

namespace {

constexpr std::int64_t kNanosPerDay = 86'400'000'000'000;

template <typename T>
inline constexpr bool is_plain_integer_v = std::is_integral_v<T> && !std::is_same_v<T, bool>;

// Raw count behind a temporal value (days for Date, nanoseconds otherwise).
template <typename T>
auto raw_count(const T& value) -> std::int64_t {
    if constexpr (std::is_same_v<T, Date>) {
        return value.days;
    } else {
        return value.nanos;
    }
}

template <typename T>
auto from_count(std::int64_t count) -> T {
    if constexpr (std::is_same_v<T, Date>) {
        return Date{static_cast<std::int32_t>(count)};
    } else {
        return T{count};
    }
}

auto floor_div(std::int64_t a, std::int64_t b) -> std::int64_t {
    auto q = a / b;
    return (a % b != 0 && (a < 0) != (b < 0)) ? q - 1 : q;
}

/// Whether a cast From -> To exists at all. Individual values may still fail
/// to convert (and become null) at run time.
template <typename From, typename To>
constexpr auto castable() -> bool {
    if constexpr (std::is_same_v<From, To>) {
        return true;
    } else if constexpr (std::is_same_v<From, List> || std::is_same_v<To, List>) {
        return false;
    } else if constexpr (std::is_arithmetic_v<From> && std::is_arithmetic_v<To>) {
        return true;
    } else if constexpr (std::is_same_v<To, std::string>) {
        return true;
    } else if constexpr (std::is_same_v<From, std::string>) {
        return std::is_arithmetic_v<To>;
    } else if constexpr (is_temporal_v<From> && is_temporal_v<To>) {
        return (std::is_same_v<From, Date> && std::is_same_v<To, Timestamp>) ||
               (std::is_same_v<From, Timestamp> && std::is_same_v<To, Date>) ||
               (std::is_same_v<From, Timestamp> && std::is_same_v<To, TimeOfDay>);
    } else if constexpr (is_temporal_v<From>) {
        return is_plain_integer_v<To>;
    } else if constexpr (is_temporal_v<To>) {
        return is_plain_integer_v<From>;
    } else {
        return false;
    }
}

template <typename To>
auto parse_number(const std::string& text) -> std::optional<To> {
    if constexpr (std::is_same_v<To, bool>) {
        if (text == "true") {
            return true;
        }
        if (text == "false") {
            return false;
        }
        return std::nullopt;
    } else {
        To out{};
        const char* first = text.data();
        const char* last = first + text.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        if (ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return out;
    }
}

template <typename From, typename To>
auto convert_value(const From& value) -> std::optional<To> {
    if constexpr (std::is_same_v<From, To>) {
        return value;
    } else if constexpr (std::is_same_v<To, std::string>) {
        return format_scalar(Scalar(std::in_place_type<From>, value));
    } else if constexpr (std::is_same_v<From, std::string>) {
        return parse_number<To>(value);
    } else if constexpr (std::is_same_v<To, bool>) {
        return value != From{0};
    } else if constexpr (std::is_same_v<From, bool>) {
        return static_cast<To>(value ? 1 : 0);
    } else if constexpr (std::is_floating_point_v<To>) {
        return static_cast<To>(value);
    } else if constexpr (std::is_floating_point_v<From>) {
        return float_to_integer<To>(value);
    } else if constexpr (is_plain_integer_v<From> && is_plain_integer_v<To>) {
        if (!std::in_range<To>(value)) {
            return std::nullopt;
        }
        return static_cast<To>(value);
    } else if constexpr (std::is_same_v<From, Date> && std::is_same_v<To, Timestamp>) {
        return Timestamp{static_cast<std::int64_t>(value.days) * kNanosPerDay};
    } else if constexpr (std::is_same_v<From, Timestamp> && std::is_same_v<To, Date>) {
        return Date{static_cast<std::int32_t>(floor_div(value.nanos, kNanosPerDay))};
    } else if constexpr (std::is_same_v<From, Timestamp> && std::is_same_v<To, TimeOfDay>) {
        return TimeOfDay{value.nanos - floor_div(value.nanos, kNanosPerDay) * kNanosPerDay};
    } else if constexpr (is_temporal_v<From>) {
        auto count = raw_count(value);
        if (!std::in_range<To>(count)) {
            return std::nullopt;
        }
        return static_cast<To>(count);
    } else if constexpr (is_temporal_v<To>) {
        if (!std::in_range<std::int64_t>(value)) {
            return std::nullopt;
        }
        if constexpr (std::is_same_v<To, Date>) {
            if (!std::in_range<std::int32_t>(value)) {
                return std::nullopt;
            }
        }
        return from_count<To>(static_cast<std::int64_t>(value));
    } else {
        return std::nullopt;
    }
}

template <typename From, typename To>
auto convert_array(const ChunkedArray<From>& arr) -> ChunkedArray<To> {
    ArrayBuilder<To> builder(arr.size());
    arr.for_each([&](const auto& v, bool valid) {
        if (valid) {
            builder.push(convert_value<From, To>(v));
        } else {
            builder.push_null();
        }
    });
    return builder.finish();
}

}  // namespace

auto Series::cast(DType target) const -> Result<Series> {
    if (target == dtype()) {
        return *this;
    }
    return std::visit(
        [&](const auto& arr) -> Result<Series> {
            using From = typename std::decay_t<decltype(arr)>::value_type;
            return visit_dtype(target, [&]<typename To>(std::type_identity<To>) -> Result<Series> {
                if constexpr (castable<From, To>()) {
                    return detail::wrap(name_, convert_array<From, To>(arr));
                } else {
                    return make_error(ErrorKind::UnsupportedTypeCombination,
                                      fmt::format("cannot cast series '{}' from '{}' to '{}'",
                                                  name_, dtype_code(dtype_of_v<From>),
                                                  dtype_code(dtype_of_v<To>)));
                }
            });
        },
        array_);
}

namespace detail {

auto cast_numeric(const Series& series, DType dtype) -> Series {
    if (!is_numeric(series.dtype()) || !is_numeric(dtype)) {
        throw std::invalid_argument(fmt::format("cast_numeric: '{}' -> '{}' is not numeric",
                                                dtype_code(series.dtype()), dtype_code(dtype)));
    }
    if (series.dtype() == dtype) {
        return series;
    }
    return std::visit(
        [&](const auto& arr) -> Series {
            using From = typename std::decay_t<decltype(arr)>::value_type;
            return visit_dtype(dtype, [&]<typename To>(std::type_identity<To>) -> Series {
                if constexpr (is_numeric_v<From> && is_numeric_v<To>) {
                    return wrap(series.name(), convert_array<From, To>(arr));
                } else {
                    std::unreachable();
                }
            });
        },
        series.array());
}

}  // namespace detail

}  // namespace kestrel
