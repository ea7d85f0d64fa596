#pragma once

#include <kestrel/core/chunked_array.hpp>
#include <kestrel/core/dtype.hpp>
#include <kestrel/core/error.hpp>
#include <kestrel/core/scalar.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace kestrel {

// ─── Physical type mapping ────────────────────────────────────────────────────
//  One physical C++ type per DType, in DType order.

using PhysicalTypes =
    std::tuple<std::int8_t, std::int16_t, std::int32_t, std::int64_t, std::uint8_t, std::uint16_t,
               std::uint32_t, std::uint64_t, float, double, bool, std::string, Date, Timestamp,
               TimeOfDay, Duration, List>;

static_assert(std::tuple_size_v<PhysicalTypes> == kNumDTypes);

template <DType D>
using physical_t = std::tuple_element_t<static_cast<std::size_t>(D), PhysicalTypes>;

namespace detail {

template <typename T, typename Tuple>
struct type_index;

template <typename T, typename... Ts>
struct type_index<T, std::tuple<Ts...>> {
    static constexpr std::size_t value = [] {
        constexpr std::array<bool, sizeof...(Ts)> matches{std::is_same_v<T, Ts>...};
        for (std::size_t i = 0; i < matches.size(); ++i) {
            if (matches[i]) {
                return i;
            }
        }
        return matches.size();
    }();
};

}  // namespace detail

template <typename T>
inline constexpr bool is_physical_v =
    detail::type_index<T, PhysicalTypes>::value < std::tuple_size_v<PhysicalTypes>;

template <typename T>
    requires is_physical_v<T>
inline constexpr DType dtype_of_v = static_cast<DType>(detail::type_index<T, PhysicalTypes>::value);

/// Type-erased storage of a Series: one ChunkedArray per physical type.
using AnyArray =
    std::variant<ChunkedArray<std::int8_t>, ChunkedArray<std::int16_t>,
                 ChunkedArray<std::int32_t>, ChunkedArray<std::int64_t>,
                 ChunkedArray<std::uint8_t>, ChunkedArray<std::uint16_t>,
                 ChunkedArray<std::uint32_t>, ChunkedArray<std::uint64_t>, ChunkedArray<float>,
                 ChunkedArray<double>, ChunkedArray<bool>, ChunkedArray<std::string>,
                 ChunkedArray<Date>, ChunkedArray<Timestamp>, ChunkedArray<TimeOfDay>,
                 ChunkedArray<Duration>, ChunkedArray<List>>;

static_assert(std::variant_size_v<AnyArray> == kNumDTypes);

[[nodiscard]] inline auto array_dtype(const AnyArray& array) noexcept -> DType {
    return static_cast<DType>(array.index());
}

/// Invoke f(std::type_identity<T>{}) for the physical type T of `dtype`.
template <typename F>
decltype(auto) visit_dtype(DType dtype, F&& f) {
    switch (dtype) {
        case DType::Int8:
            return f(std::type_identity<std::int8_t>{});
        case DType::Int16:
            return f(std::type_identity<std::int16_t>{});
        case DType::Int32:
            return f(std::type_identity<std::int32_t>{});
        case DType::Int64:
            return f(std::type_identity<std::int64_t>{});
        case DType::UInt8:
            return f(std::type_identity<std::uint8_t>{});
        case DType::UInt16:
            return f(std::type_identity<std::uint16_t>{});
        case DType::UInt32:
            return f(std::type_identity<std::uint32_t>{});
        case DType::UInt64:
            return f(std::type_identity<std::uint64_t>{});
        case DType::Float32:
            return f(std::type_identity<float>{});
        case DType::Float64:
            return f(std::type_identity<double>{});
        case DType::Boolean:
            return f(std::type_identity<bool>{});
        case DType::Utf8:
            return f(std::type_identity<std::string>{});
        case DType::Date32:
            return f(std::type_identity<Date>{});
        case DType::Datetime:
            return f(std::type_identity<Timestamp>{});
        case DType::Time64:
            return f(std::type_identity<TimeOfDay>{});
        case DType::Duration:
            return f(std::type_identity<Duration>{});
        case DType::List:
            return f(std::type_identity<List>{});
    }
    std::unreachable();
}

/// An empty single-chunk array of `dtype`.
[[nodiscard]] auto make_empty_array(DType dtype) -> AnyArray;

// ─── Kernel table ─────────────────────────────────────────────────────────────
//  Which (operation, physical type) pairs have a kernel. Kernels test this with
//  `if constexpr (supports<T>(op))` and report a miss through `unsupported()`.

enum class Op : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    FloorDiv,
    Compare,
    Equal,
    Sum,
    Min,
    Max,
    Mean,
    Sort,
    ArgUnique,
    DenseView,
    Cast,
};

inline constexpr std::size_t kNumOps = 15;

[[nodiscard]] constexpr auto op_name(Op op) noexcept -> std::string_view {
    switch (op) {
        case Op::Add:
            return "add";
        case Op::Sub:
            return "sub";
        case Op::Mul:
            return "mul";
        case Op::Div:
            return "div";
        case Op::FloorDiv:
            return "floordiv";
        case Op::Compare:
            return "compare";
        case Op::Equal:
            return "equal";
        case Op::Sum:
            return "sum";
        case Op::Min:
            return "min";
        case Op::Max:
            return "max";
        case Op::Mean:
            return "mean";
        case Op::Sort:
            return "sort";
        case Op::ArgUnique:
            return "arg_unique";
        case Op::DenseView:
            return "dense_view";
        case Op::Cast:
            return "cast";
    }
    return "unknown";
}

template <typename T>
[[nodiscard]] constexpr auto supports(Op op) noexcept -> bool {
    constexpr bool numeric = is_numeric_v<T>;
    constexpr bool boolean = std::is_same_v<T, bool>;
    constexpr bool text = std::is_same_v<T, std::string>;
    constexpr bool temporal = is_temporal_v<T>;
    switch (op) {
        case Op::Add:
        case Op::Sub:
        case Op::Mul:
        case Op::Div:
        case Op::FloorDiv:
            return numeric;
        case Op::Equal:
            return true;
        case Op::Compare:
        case Op::Min:
        case Op::Max:
        case Op::Sort:
        case Op::ArgUnique:
        case Op::Cast:
            return numeric || boolean || text || temporal;
        case Op::Sum:
        case Op::Mean:
            return numeric || boolean;
        case Op::DenseView:
            return numeric || temporal;
    }
    return false;
}

namespace detail {

template <std::size_t... Is>
constexpr auto make_kernel_table(std::index_sequence<Is...>) {
    std::array<std::array<bool, kNumOps>, kNumDTypes> table{};
    auto fill_row = [&table]<typename T>(std::size_t row, std::type_identity<T>) {
        for (std::size_t op = 0; op < kNumOps; ++op) {
            table[row][op] = supports<T>(static_cast<Op>(op));
        }
    };
    (fill_row(Is, std::type_identity<std::tuple_element_t<Is, PhysicalTypes>>{}), ...);
    return table;
}

}  // namespace detail

inline constexpr auto kKernelTable =
    detail::make_kernel_table(std::make_index_sequence<kNumDTypes>{});

/// Runtime query of the kernel table.
[[nodiscard]] constexpr auto supports(Op op, DType dtype) noexcept -> bool {
    return kKernelTable[static_cast<std::size_t>(dtype)][static_cast<std::size_t>(op)];
}

/// The error every kernel returns on a dispatch miss.
[[nodiscard]] auto unsupported(Op op, DType dtype) -> std::unexpected<Error>;

}  // namespace kestrel
