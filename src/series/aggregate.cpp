#include <kestrel/series/series.hpp>

#include "kernels.hpp"

#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

namespace kestrel {

namespace {

// Accumulator for sum: integers wrap in 64 unsigned bits, floats sum in double.
template <typename T>
using sum_acc_t = std::conditional_t<std::is_floating_point_v<T>, double, std::uint64_t>;

// Booleans report sums and extrema as UInt32.
template <typename T>
auto reduced(T value) -> Scalar {
    if constexpr (std::is_same_v<T, bool>) {
        return Scalar(std::in_place_type<std::uint32_t>, value ? 1U : 0U);
    } else {
        return Scalar(std::in_place_type<T>, std::move(value));
    }
}

template <typename T>
auto extremum(const ChunkedArray<T>& arr, bool want_max) -> AnyValue {
    std::optional<T> best;
    arr.for_each([&](const auto& v, bool valid) {
        if (!valid) {
            return;
        }
        if (!best.has_value() || (want_max ? detail::value_less<T>(*best, v)
                                           : detail::value_less<T>(v, *best))) {
            best = v;
        }
    });
    if (!best.has_value()) {
        return std::nullopt;
    }
    return reduced<T>(std::move(*best));
}

}  // namespace

auto Series::sum() const -> Result<AnyValue> {
    if (!supports(Op::Sum, dtype())) {
        return unsupported(Op::Sum, dtype());
    }
    return std::visit(
        [&](const auto& arr) -> Result<AnyValue> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (std::is_same_v<T, bool>) {
                std::uint32_t count = 0;
                bool any = false;
                arr.for_each([&](bool v, bool valid) {
                    if (valid) {
                        any = true;
                        count += v ? 1U : 0U;
                    }
                });
                if (!any) {
                    return AnyValue{};
                }
                return AnyValue{Scalar(std::in_place_type<std::uint32_t>, count)};
            } else if constexpr (supports<T>(Op::Sum)) {
                sum_acc_t<T> acc{};
                bool any = false;
                arr.for_each([&](T v, bool valid) {
                    if (valid) {
                        any = true;
                        acc += static_cast<sum_acc_t<T>>(v);
                    }
                });
                if (!any) {
                    return AnyValue{};
                }
                return AnyValue{Scalar(std::in_place_type<T>, static_cast<T>(acc))};
            } else {
                return unsupported(Op::Sum, dtype_of_v<T>);
            }
        },
        array_);
}

auto Series::min() const -> Result<AnyValue> {
    if (!supports(Op::Min, dtype())) {
        return unsupported(Op::Min, dtype());
    }
    return std::visit(
        [&](const auto& arr) -> Result<AnyValue> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (supports<T>(Op::Min)) {
                return extremum<T>(arr, false);
            } else {
                return unsupported(Op::Min, dtype_of_v<T>);
            }
        },
        array_);
}

auto Series::max() const -> Result<AnyValue> {
    if (!supports(Op::Max, dtype())) {
        return unsupported(Op::Max, dtype());
    }
    return std::visit(
        [&](const auto& arr) -> Result<AnyValue> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (supports<T>(Op::Max)) {
                return extremum<T>(arr, true);
            } else {
                return unsupported(Op::Max, dtype_of_v<T>);
            }
        },
        array_);
}

auto Series::mean() const -> Result<std::optional<double>> {
    if (!supports(Op::Mean, dtype())) {
        return unsupported(Op::Mean, dtype());
    }
    return std::visit(
        [&](const auto& arr) -> Result<std::optional<double>> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (supports<T>(Op::Mean)) {
                double acc = 0.0;
                size_type count = 0;
                arr.for_each([&](T v, bool valid) {
                    if (valid) {
                        acc += static_cast<double>(v);
                        ++count;
                    }
                });
                if (count == 0) {
                    return std::optional<double>{};
                }
                return std::optional<double>(acc / static_cast<double>(count));
            } else {
                return unsupported(Op::Mean, dtype_of_v<T>);
            }
        },
        array_);
}

}  // namespace kestrel
