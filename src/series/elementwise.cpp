#include <kestrel/series/series.hpp>

#include "kernels.hpp"

#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace kestrel {

namespace {

auto kernel_op(ArithmeticOp op) -> Op {
    switch (op) {
        case ArithmeticOp::Add:
            return Op::Add;
        case ArithmeticOp::Sub:
            return Op::Sub;
        case ArithmeticOp::Mul:
            return Op::Mul;
        case ArithmeticOp::Div:
            return Op::Div;
        case ArithmeticOp::FloorDiv:
            return Op::FloorDiv;
    }
    return Op::Add;
}

auto is_division(ArithmeticOp op) -> bool {
    return op == ArithmeticOp::Div || op == ArithmeticOp::FloorDiv;
}

auto kernel_op(CompareOp op) -> Op {
    return (op == CompareOp::Eq || op == CompareOp::Ne) ? Op::Equal : Op::Compare;
}

// Flip a comparison operator (swap lhs and rhs).
auto flip_cmp(CompareOp op) -> CompareOp {
    switch (op) {
        case CompareOp::Lt:
            return CompareOp::Gt;
        case CompareOp::Le:
            return CompareOp::Ge;
        case CompareOp::Gt:
            return CompareOp::Lt;
        case CompareOp::Ge:
            return CompareOp::Le;
        default:
            return op;  // Eq, Ne are symmetric
    }
}

auto mismatch(std::string_view what, DType lhs, DType rhs) -> std::unexpected<Error> {
    return make_error(ErrorKind::UnsupportedTypeCombination,
                      fmt::format("cannot {} '{}' with '{}'", what, dtype_code(lhs),
                                  dtype_code(rhs)));
}

auto length_mismatch(std::string_view what, std::size_t lhs, std::size_t rhs)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::ShapeMismatch,
                      fmt::format("{}: operand lengths differ ({} vs {})", what, lhs, rhs));
}

// ─── Comparison kernels ───────────────────────────────────────────────────────

template <typename T>
auto apply_compare(CompareOp op, const T& l, const T& r) -> bool {
    if constexpr (supports<T>(Op::Compare)) {
        switch (op) {
            case CompareOp::Lt:
                return l < r;
            case CompareOp::Le:
                return l <= r;
            case CompareOp::Gt:
                return l > r;
            case CompareOp::Ge:
                return l >= r;
            default:
                break;
        }
    }
    return op == CompareOp::Eq ? l == r : !(l == r);
}

template <typename T>
auto compare_arrays(CompareOp op, const ChunkedArray<T>& lhs, const ChunkedArray<T>& rhs)
    -> ChunkedArray<bool> {
    ArrayBuilder<bool> builder(lhs.size());
    detail::zip_for_each(lhs, rhs, [&](const auto& lv, bool lvalid, const auto& rv, bool rvalid) {
        if (lvalid && rvalid) {
            builder.push(apply_compare<T>(op, lv, rv));
        } else {
            builder.push_null();
        }
    });
    return builder.finish();
}

// The scalar is hoisted out of the loop; no broadcast allocation.
template <typename T>
auto compare_scalar(CompareOp op, const ChunkedArray<T>& lhs, const T& rhs) -> ChunkedArray<bool> {
    ArrayBuilder<bool> builder(lhs.size());
    lhs.for_each([&](const auto& v, bool valid) {
        if (valid) {
            builder.push(apply_compare<T>(op, v, rhs));
        } else {
            builder.push_null();
        }
    });
    return builder.finish();
}

// ─── Arithmetic kernels ───────────────────────────────────────────────────────

template <typename T>
auto apply_arith(ArithmeticOp op, T l, T r) -> T {
    if constexpr (std::is_floating_point_v<T>) {
        switch (op) {
            case ArithmeticOp::Add:
                return l + r;
            case ArithmeticOp::Sub:
                return l - r;
            case ArithmeticOp::Mul:
                return l * r;
            case ArithmeticOp::Div:
                return l / r;
            case ArithmeticOp::FloorDiv:
                return std::floor(l / r);
        }
    } else {
        // Unsigned wrap-around arithmetic, at least `unsigned` wide so that
        // small types never promote to signed int.
        using W = std::conditional_t<(sizeof(T) < sizeof(unsigned)), unsigned,
                                     std::make_unsigned_t<T>>;
        switch (op) {
            case ArithmeticOp::Add:
                return static_cast<T>(static_cast<W>(l) + static_cast<W>(r));
            case ArithmeticOp::Sub:
                return static_cast<T>(static_cast<W>(l) - static_cast<W>(r));
            case ArithmeticOp::Mul:
                return static_cast<T>(static_cast<W>(l) * static_cast<W>(r));
            case ArithmeticOp::Div:
            case ArithmeticOp::FloorDiv:
                // Series division runs in floating point; kept total for completeness.
                return r == 0 ? T{0} : static_cast<T>(l / r);
        }
    }
    return T{};
}

template <typename T>
auto arith_arrays(ArithmeticOp op, const ChunkedArray<T>& lhs, const ChunkedArray<T>& rhs)
    -> ChunkedArray<T> {
    ArrayBuilder<T> builder(lhs.size());
    detail::zip_for_each(lhs, rhs, [&](T lv, bool lvalid, T rv, bool rvalid) {
        if (lvalid && rvalid) {
            builder.push(apply_arith<T>(op, lv, rv));
        } else {
            builder.push_null();
        }
    });
    return builder.finish();
}

template <typename T>
auto arith_scalar(ArithmeticOp op, const ChunkedArray<T>& series, T scalar, ScalarSide side)
    -> ChunkedArray<T> {
    ArrayBuilder<T> builder(series.size());
    series.for_each([&](T v, bool valid) {
        if (!valid) {
            builder.push_null();
        } else if (side == ScalarSide::Right) {
            builder.push(apply_arith<T>(op, v, scalar));
        } else {
            builder.push(apply_arith<T>(op, scalar, v));
        }
    });
    return builder.finish();
}

// Both operands already share a dtype.
auto compare_same(CompareOp op, const Series& lhs, const Series& rhs) -> Series {
    return std::visit(
        [&](const auto& larr) -> Series {
            using ArrT = std::decay_t<decltype(larr)>;
            using T = typename ArrT::value_type;
            return detail::wrap(lhs.name(), compare_arrays<T>(op, larr, *rhs.as<T>()));
        },
        lhs.array());
}

// Integer operands of different dtypes compared at their own types.
auto compare_integers(CompareOp op, const Series& lhs, const Series& rhs) -> Series {
    ArrayBuilder<bool> builder(lhs.len());
    detail::visit_integers(lhs, rhs, [&](const auto& larr, const auto& rarr) {
        detail::zip_for_each(larr, rarr, [&](auto lv, bool lvalid, auto rv, bool rvalid) {
            if (lvalid && rvalid) {
                builder.push(detail::integer_compare(op, lv, rv));
            } else {
                builder.push_null();
            }
        });
    });
    return detail::wrap(lhs.name(), builder.finish());
}

// True when the scalar converts to `dtype` without changing its value.
auto scalar_fits(const Scalar& value, DType dtype) -> bool {
    return visit_dtype(dtype, [&]<typename T>(std::type_identity<T>) {
        return scalar_cast<T>(value).has_value();
    });
}

}  // namespace

// ─── Comparison ───────────────────────────────────────────────────────────────

auto Series::compare(CompareOp op, const Series& other) const -> Result<Series> {
    if (len() != other.len()) {
        return length_mismatch("compare", len(), other.len());
    }
    if (is_integer(dtype()) && is_integer(other.dtype()) && dtype() != other.dtype()) {
        return compare_integers(op, *this, other);
    }
    if (is_numeric() && other.is_numeric()) {
        auto target = numeric_supertype(dtype(), other.dtype());
        return compare_same(op, detail::cast_numeric(*this, target),
                            detail::cast_numeric(other, target));
    }
    if (dtype() != other.dtype()) {
        return mismatch("compare", dtype(), other.dtype());
    }
    if (!supports(kernel_op(op), dtype())) {
        return unsupported(kernel_op(op), dtype());
    }
    return compare_same(op, *this, other);
}

auto Series::compare(CompareOp op, const Scalar& other, ScalarSide side) const
    -> Result<Series> {
    if (side == ScalarSide::Left) {
        op = flip_cmp(op);
    }
    if (!supports(kernel_op(op), dtype())) {
        return unsupported(kernel_op(op), dtype());
    }
    DType sdt = scalar_dtype(other);
    bool numeric_pair = is_numeric() && kestrel::is_numeric(sdt);
    if (!numeric_pair && sdt != dtype()) {
        return mismatch("compare", dtype(), sdt);
    }
    if (is_integer(dtype()) && kestrel::is_integer(sdt)) {
        ArrayBuilder<bool> builder(len());
        std::visit(
            [&](const auto& arr, const auto& rhs) {
                using T = typename std::decay_t<decltype(arr)>::value_type;
                using S = std::decay_t<decltype(rhs)>;
                if constexpr (detail::is_integer_v<T> && detail::is_integer_v<S>) {
                    arr.for_each([&](T v, bool valid) {
                        if (valid) {
                            builder.push(detail::integer_compare(op, v, rhs));
                        } else {
                            builder.push_null();
                        }
                    });
                }
            },
            array_, other);
        return detail::wrap(name_, builder.finish());
    }
    // Other numeric pairs compare in the supertype, which holds both sides.
    std::optional<Series> widened;
    if (numeric_pair && sdt != dtype()) {
        auto target = numeric_supertype(dtype(), sdt);
        if (target != dtype()) {
            widened = detail::cast_numeric(*this, target);
        }
    }
    const Series& lhs = widened.has_value() ? *widened : *this;
    return std::visit(
        [&](const auto& arr) -> Result<Series> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            auto rhs = scalar_cast<T>(other);
            if (!rhs.has_value()) {
                return mismatch("compare", dtype(), sdt);
            }
            return detail::wrap(name_, compare_scalar<T>(op, arr, *rhs));
        },
        lhs.array());
}

auto Series::compare(CompareOp op, const std::vector<AnyValue>& other) const -> Result<Series> {
    auto rhs = from_list("", other);
    if (!rhs) {
        return std::unexpected(std::move(rhs.error()));
    }
    return compare(op, *rhs);
}

// ─── Arithmetic ───────────────────────────────────────────────────────────────

auto Series::arithmetic(ArithmeticOp op, const Series& other) const -> Result<Series> {
    auto kind = kernel_op(op);
    if (len() != other.len()) {
        return length_mismatch(op_name(kind), len(), other.len());
    }
    if (!supports(kind, dtype())) {
        return unsupported(kind, dtype());
    }
    if (!supports(kind, other.dtype())) {
        return unsupported(kind, other.dtype());
    }
    DType target = numeric_supertype(dtype(), other.dtype());
    if (is_division(op)) {
        bool narrow = dtype() == DType::Float32 && other.dtype() == DType::Float32;
        target = narrow ? DType::Float32 : DType::Float64;
    }
    auto lhs = detail::cast_numeric(*this, target);
    auto rhs = detail::cast_numeric(other, target);
    return std::visit(
        [&](const auto& larr) -> Result<Series> {
            using T = typename std::decay_t<decltype(larr)>::value_type;
            if constexpr (supports<T>(Op::Add)) {
                return detail::wrap(name_, arith_arrays<T>(op, larr, *rhs.as<T>()));
            } else {
                return unsupported(kind, dtype_of_v<T>);
            }
        },
        lhs.array());
}

auto Series::arithmetic(ArithmeticOp op, const Scalar& other, ScalarSide side) const
    -> Result<Series> {
    auto kind = kernel_op(op);
    if (!supports(kind, dtype())) {
        return unsupported(kind, dtype());
    }
    DType sdt = scalar_dtype(other);
    if (!kestrel::is_numeric(sdt)) {
        return mismatch(op_name(kind), dtype(), sdt);
    }
    DType target = dtype();
    if (is_division(op)) {
        target = dtype() == DType::Float32 ? DType::Float32 : DType::Float64;
    }
    // A scalar the target cannot hold exactly promotes the whole operation.
    if (!scalar_fits(other, target)) {
        target = is_integer(target) && kestrel::is_integer(sdt) ? numeric_supertype(target, sdt)
                                                                : DType::Float64;
        if (!scalar_fits(other, target)) {
            target = DType::Float64;
        }
    }
    auto lhs = detail::cast_numeric(*this, target);
    return std::visit(
        [&](const auto& arr) -> Result<Series> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (supports<T>(Op::Add)) {
                auto scalar = scalar_cast<T>(other);
                if (!scalar.has_value()) {
                    return mismatch(op_name(kind), dtype(), sdt);
                }
                return detail::wrap(name_, arith_scalar<T>(op, arr, *scalar, side));
            } else {
                return unsupported(kind, dtype_of_v<T>);
            }
        },
        lhs.array());
}

auto Series::arithmetic(ArithmeticOp op, const std::vector<AnyValue>& other) const
    -> Result<Series> {
    auto rhs = from_list("", other);
    if (!rhs) {
        return std::unexpected(std::move(rhs.error()));
    }
    return arithmetic(op, *rhs);
}

}  // namespace kestrel
