#pragma once

#include <kestrel/series/series.hpp>

namespace kestrel {

// ─── Operator sugar ───────────────────────────────────────────────────────────
//  Thin wrappers over Series::arithmetic. A failed operation throws
//  SeriesException carrying the Error, since operators cannot return Result.

[[nodiscard]] auto operator+(const Series& lhs, const Series& rhs) -> Series;
[[nodiscard]] auto operator-(const Series& lhs, const Series& rhs) -> Series;
[[nodiscard]] auto operator*(const Series& lhs, const Series& rhs) -> Series;
[[nodiscard]] auto operator/(const Series& lhs, const Series& rhs) -> Series;

[[nodiscard]] auto operator+(const Series& lhs, const Scalar& rhs) -> Series;
[[nodiscard]] auto operator-(const Series& lhs, const Scalar& rhs) -> Series;
[[nodiscard]] auto operator*(const Series& lhs, const Scalar& rhs) -> Series;
[[nodiscard]] auto operator/(const Series& lhs, const Scalar& rhs) -> Series;

[[nodiscard]] auto operator+(const Scalar& lhs, const Series& rhs) -> Series;
[[nodiscard]] auto operator-(const Scalar& lhs, const Series& rhs) -> Series;
[[nodiscard]] auto operator*(const Scalar& lhs, const Series& rhs) -> Series;
[[nodiscard]] auto operator/(const Scalar& lhs, const Series& rhs) -> Series;

}  // namespace kestrel
