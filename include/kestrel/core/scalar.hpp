#pragma once

#include <kestrel/core/dtype.hpp>
#include <kestrel/core/time.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace kestrel {

class Series;

/// One element of a List series: a shared, immutable inner Series.
struct List {
    std::shared_ptr<const Series> values;

    /// Element-wise equality of the inner series; nulls compare equal.
    friend auto operator==(const List& lhs, const List& rhs) -> bool;
};

/// A single non-null value of any dtype. Alternatives are in DType order.
using Scalar = std::variant<std::int8_t, std::int16_t, std::int32_t, std::int64_t, std::uint8_t,
                            std::uint16_t, std::uint32_t, std::uint64_t, float, double, bool,
                            std::string, Date, Timestamp, TimeOfDay, Duration, List>;

/// A possibly-null value; nullopt is null.
using AnyValue = std::optional<Scalar>;

[[nodiscard]] inline auto scalar_dtype(const Scalar& value) noexcept -> DType {
    return static_cast<DType>(value.index());
}

/// Render a scalar for display (dates as YYYY-MM-DD, lists as [a, b]).
[[nodiscard]] auto format_scalar(const Scalar& value) -> std::string;

/// Like format_scalar, with "null" for nullopt.
[[nodiscard]] auto format_value(const AnyValue& value) -> std::string;

template <typename T>
inline constexpr bool is_numeric_v = std::is_arithmetic_v<T> && !std::is_same_v<T, bool>;

template <typename T>
inline constexpr bool is_temporal_v =
    std::is_same_v<T, Date> || std::is_same_v<T, Timestamp> || std::is_same_v<T, TimeOfDay> ||
    std::is_same_v<T, Duration>;

/// Float to integer with truncation toward zero; NaN, infinities and
/// out-of-range values give nullopt.
template <typename To, typename From>
[[nodiscard]] auto float_to_integer(From value) -> std::optional<To> {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    const double v = static_cast<double>(value);
    const double limit = std::ldexp(1.0, std::numeric_limits<To>::digits);
    const double lower = std::is_signed_v<To> ? -limit : -1.0;
    if (v >= limit || v < lower || (!std::is_signed_v<To> && v <= lower)) {
        return std::nullopt;
    }
    return static_cast<To>(v);
}

/// Convert a scalar to physical type T without changing its value.
///
/// Numbers and booleans convert among numeric types and bool only when T
/// holds the value: integers must be in range, floats going to an integer
/// type must be finite and whole, and a bool takes only 0 or 1. Floats going
/// to a narrower float round, but finite values beyond its range fail.
/// Every other type only converts to itself.
template <typename T>
[[nodiscard]] auto scalar_cast(const Scalar& value) -> std::optional<T> {
    return std::visit(
        [](const auto& v) -> std::optional<T> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, T>) {
                return v;
            } else if constexpr (!std::is_arithmetic_v<V> || !std::is_arithmetic_v<T>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<V, bool>) {
                return static_cast<T>(v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, bool>) {
                if (v == V{0}) {
                    return false;
                }
                if (v == V{1}) {
                    return true;
                }
                return std::nullopt;
            } else if constexpr (std::is_floating_point_v<T>) {
                if constexpr (std::is_floating_point_v<V> && sizeof(V) > sizeof(T)) {
                    if (std::isfinite(v) && std::fabs(v) > std::numeric_limits<T>::max()) {
                        return std::nullopt;
                    }
                }
                return static_cast<T>(v);
            } else if constexpr (std::is_floating_point_v<V>) {
                if (std::trunc(v) != v) {
                    return std::nullopt;
                }
                return float_to_integer<T>(v);
            } else {
                if (!std::in_range<T>(v)) {
                    return std::nullopt;
                }
                return static_cast<T>(v);
            }
        },
        value);
}

}  // namespace kestrel
