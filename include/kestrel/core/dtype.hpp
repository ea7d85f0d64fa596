#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace kestrel {

/// Logical value type of a Series.
///
/// The enumerator order is load-bearing: it matches the alternative order of
/// `Scalar` and `AnyArray`, so `static_cast<DType>(variant.index())` is the
/// dtype of any value or array.
enum class DType : std::uint8_t {
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float32,
    Float64,
    Boolean,
    Utf8,
    Date32,
    Datetime,
    Time64,
    Duration,
    List,
};

inline constexpr std::size_t kNumDTypes = 17;

/// Canonical short code ("i64", "f32", "str", ...).
[[nodiscard]] constexpr auto dtype_code(DType dtype) noexcept -> std::string_view {
    switch (dtype) {
        case DType::Int8:
            return "i8";
        case DType::Int16:
            return "i16";
        case DType::Int32:
            return "i32";
        case DType::Int64:
            return "i64";
        case DType::UInt8:
            return "u8";
        case DType::UInt16:
            return "u16";
        case DType::UInt32:
            return "u32";
        case DType::UInt64:
            return "u64";
        case DType::Float32:
            return "f32";
        case DType::Float64:
            return "f64";
        case DType::Boolean:
            return "bool";
        case DType::Utf8:
            return "str";
        case DType::Date32:
            return "date32";
        case DType::Datetime:
            return "datetime";
        case DType::Time64:
            return "time64ns";
        case DType::Duration:
            return "duration_ns";
        case DType::List:
            return "list";
    }
    return "unknown";
}

/// Human-readable name ("Int64", "Utf8", ...).
[[nodiscard]] auto dtype_name(DType dtype) noexcept -> std::string_view;

[[nodiscard]] constexpr auto is_integer(DType dtype) noexcept -> bool {
    return dtype <= DType::UInt64;
}

[[nodiscard]] constexpr auto is_signed_integer(DType dtype) noexcept -> bool {
    return dtype <= DType::Int64;
}

[[nodiscard]] constexpr auto is_float(DType dtype) noexcept -> bool {
    return dtype == DType::Float32 || dtype == DType::Float64;
}

[[nodiscard]] constexpr auto is_numeric(DType dtype) noexcept -> bool {
    return is_integer(dtype) || is_float(dtype);
}

[[nodiscard]] constexpr auto is_temporal(DType dtype) noexcept -> bool {
    return dtype >= DType::Date32 && dtype <= DType::Duration;
}

/// Width in bits of a numeric dtype, 0 for everything else.
[[nodiscard]] constexpr auto numeric_bits(DType dtype) noexcept -> unsigned {
    switch (dtype) {
        case DType::Int8:
        case DType::UInt8:
            return 8;
        case DType::Int16:
        case DType::UInt16:
            return 16;
        case DType::Int32:
        case DType::UInt32:
        case DType::Float32:
            return 32;
        case DType::Int64:
        case DType::UInt64:
        case DType::Float64:
            return 64;
        default:
            return 0;
    }
}

/// Smallest numeric dtype both operands widen to without losing sign or
/// magnitude class. Only meaningful when both inputs are numeric.
[[nodiscard]] auto numeric_supertype(DType lhs, DType rhs) noexcept -> DType;

}  // namespace kestrel
