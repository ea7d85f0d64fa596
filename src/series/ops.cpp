#include <kestrel/series/ops.hpp>

#include <utility>

namespace kestrel {

namespace {

auto unwrap(Result<Series> result) -> Series {
    if (!result) {
        throw SeriesException(std::move(result.error()));
    }
    return std::move(*result);
}

}  // namespace

auto operator+(const Series& lhs, const Series& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Add, rhs));
}

auto operator-(const Series& lhs, const Series& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Sub, rhs));
}

auto operator*(const Series& lhs, const Series& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Mul, rhs));
}

auto operator/(const Series& lhs, const Series& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Div, rhs));
}

auto operator+(const Series& lhs, const Scalar& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Add, rhs));
}

auto operator-(const Series& lhs, const Scalar& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Sub, rhs));
}

auto operator*(const Series& lhs, const Scalar& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Mul, rhs));
}

auto operator/(const Series& lhs, const Scalar& rhs) -> Series {
    return unwrap(lhs.arithmetic(ArithmeticOp::Div, rhs));
}

auto operator+(const Scalar& lhs, const Series& rhs) -> Series {
    return unwrap(rhs.arithmetic(ArithmeticOp::Add, lhs, ScalarSide::Left));
}

auto operator-(const Scalar& lhs, const Series& rhs) -> Series {
    return unwrap(rhs.arithmetic(ArithmeticOp::Sub, lhs, ScalarSide::Left));
}

auto operator*(const Scalar& lhs, const Series& rhs) -> Series {
    return unwrap(rhs.arithmetic(ArithmeticOp::Mul, lhs, ScalarSide::Left));
}

auto operator/(const Scalar& lhs, const Series& rhs) -> Series {
    return unwrap(rhs.arithmetic(ArithmeticOp::Div, lhs, ScalarSide::Left));
}

}  // namespace kestrel
