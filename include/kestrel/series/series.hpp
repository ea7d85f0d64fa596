#pragma once

#include <kestrel/core/chunked_array.hpp>
#include <kestrel/core/dispatch.hpp>
#include <kestrel/core/dtype.hpp>
#include <kestrel/core/error.hpp>
#include <kestrel/core/scalar.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kestrel {

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

enum class ArithmeticOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    FloorDiv,
};

/// Which side of a binary operation the scalar operand sits on.
/// `Right` is `series OP scalar`, `Left` is `scalar OP series`.
enum class ScalarSide : std::uint8_t {
    Right,
    Left,
};

enum class FillStrategy : std::uint8_t {
    Forward,
    Backward,
    Min,
    Max,
    Mean,
};

/// Parse "forward", "backward", "min", "max" or "mean".
[[nodiscard]] auto parse_fill_strategy(std::string_view name) -> Result<FillStrategy>;

/// Read-only, single-chunk view of a Series' element memory.
///
/// Null slots are exposed as whatever placeholder the buffer holds, so the view
/// carries no null information. Valid until the owning Series is next mutated.
struct DenseView {
    const void* data = nullptr;
    std::size_t length = 0;
    DType dtype = DType::Int64;
    std::size_t element_size = 0;

    template <typename T>
    [[nodiscard]] auto as() const -> std::span<const T> {
        return {static_cast<const T*>(data), length};
    }
};

/// A named, typed, chunked column of possibly-null values.
///
/// Every operation dispatches on the runtime dtype to a kernel monomorphized
/// for the physical type. Operations that can fail return Result<T>.
class Series {
   public:
    using size_type = std::size_t;

    Series(std::string name, AnyArray array);

    /// Dense path: one chunk, no nulls.
    template <typename T>
        requires is_physical_v<T>
    Series(std::string name, std::vector<T> values)
        : name_(std::move(name)), array_(ChunkedArray<T>(std::move(values))) {}

    template <typename T>
        requires is_physical_v<T>
    Series(std::string name, std::initializer_list<T> values)
        : Series(std::move(name), std::vector<T>(values)) {}

    /// Adopt `other`'s storage under a new name. No element data is copied.
    Series(std::string name, const Series& other);

    template <typename K, typename V, typename... Rest>
    Series(std::string name, const std::map<K, V, Rest...>& mapping) = delete;
    template <typename K, typename V, typename... Rest>
    Series(std::string name, const std::unordered_map<K, V, Rest...>& mapping) = delete;

    /// Nullable path: dtype inferred from the first non-null value and widened
    /// to Int64, Float64, Utf8 or Boolean. A u64 value above INT64_MAX does not
    /// fit the widened Int64 and is rejected with ConstructionRejected.
    [[nodiscard]] static auto from_list(std::string name, const std::vector<AnyValue>& values)
        -> Result<Series>;

    /// Nullable path with an explicit dtype; every value must convert to it
    /// exactly (see scalar_cast), so 2.5, NaN or 1e30 never land in Int64.
    [[nodiscard]] static auto from_list(std::string name, const std::vector<AnyValue>& values,
                                        DType dtype) -> Result<Series>;

    /// Dense path for runtime-typed input; all values must share one dtype.
    [[nodiscard]] static auto from_scalars(std::string name, const std::vector<Scalar>& values)
        -> Result<Series>;

    [[nodiscard]] static auto full_null(std::string name, DType dtype, size_type length)
        -> Series;

    // ─── Metadata ─────────────────────────────────────────────────────────────

    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    void rename(std::string name) { name_ = std::move(name); }

    [[nodiscard]] auto dtype() const noexcept -> DType { return array_dtype(array_); }
    [[nodiscard]] auto len() const noexcept -> size_type;
    [[nodiscard]] auto is_empty() const noexcept -> bool { return len() == 0; }
    [[nodiscard]] auto n_chunks() const noexcept -> size_type;
    [[nodiscard]] auto null_count() const noexcept -> size_type;
    [[nodiscard]] auto is_numeric() const noexcept -> bool { return kestrel::is_numeric(dtype()); }
    [[nodiscard]] auto is_float() const noexcept -> bool { return kestrel::is_float(dtype()); }

    [[nodiscard]] auto array() const noexcept -> const AnyArray& { return array_; }

    /// Typed storage, or nullptr if T is not this Series' physical type.
    template <typename T>
    [[nodiscard]] auto as() const noexcept -> const ChunkedArray<T>* {
        return std::get_if<ChunkedArray<T>>(&array_);
    }

    [[nodiscard]] auto clone() const -> Series { return *this; }

    // ─── Chunk management ─────────────────────────────────────────────────────

    /// Append `other`'s chunks. Dtypes must match.
    [[nodiscard]] auto append(const Series& other) -> Result<void>;

    [[nodiscard]] auto rechunk() const -> Series;
    void rechunk_mut();

    /// Rechunk in place, then expose the single chunk's memory. Null
    /// information is dropped (a warning is logged when nulls are present).
    [[nodiscard]] auto unsafe_dense_view() -> Result<DenseView>;

    // ─── Elementwise ──────────────────────────────────────────────────────────

    [[nodiscard]] auto compare(CompareOp op, const Series& other) const -> Result<Series>;
    [[nodiscard]] auto compare(CompareOp op, const Scalar& other,
                               ScalarSide side = ScalarSide::Right) const -> Result<Series>;
    [[nodiscard]] auto compare(CompareOp op, const std::vector<AnyValue>& other) const
        -> Result<Series>;

    [[nodiscard]] auto arithmetic(ArithmeticOp op, const Series& other) const -> Result<Series>;
    [[nodiscard]] auto arithmetic(ArithmeticOp op, const Scalar& other,
                                  ScalarSide side = ScalarSide::Right) const -> Result<Series>;
    [[nodiscard]] auto arithmetic(ArithmeticOp op, const std::vector<AnyValue>& other) const
        -> Result<Series>;

    template <typename Rhs>
    [[nodiscard]] auto eq(const Rhs& other) const -> Result<Series> {
        return compare(CompareOp::Eq, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto ne(const Rhs& other) const -> Result<Series> {
        return compare(CompareOp::Ne, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto lt(const Rhs& other) const -> Result<Series> {
        return compare(CompareOp::Lt, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto le(const Rhs& other) const -> Result<Series> {
        return compare(CompareOp::Le, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto gt(const Rhs& other) const -> Result<Series> {
        return compare(CompareOp::Gt, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto ge(const Rhs& other) const -> Result<Series> {
        return compare(CompareOp::Ge, other);
    }

    template <typename Rhs>
    [[nodiscard]] auto add(const Rhs& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Add, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto sub(const Rhs& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Sub, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto mul(const Rhs& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Mul, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto div(const Rhs& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Div, other);
    }
    template <typename Rhs>
    [[nodiscard]] auto floordiv(const Rhs& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::FloorDiv, other);
    }

    // Reflected forms: the scalar is the left operand.
    [[nodiscard]] auto radd(const Scalar& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Add, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rsub(const Scalar& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Sub, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rmul(const Scalar& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Mul, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rdiv(const Scalar& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::Div, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rfloordiv(const Scalar& other) const -> Result<Series> {
        return arithmetic(ArithmeticOp::FloorDiv, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rlt(const Scalar& other) const -> Result<Series> {
        return compare(CompareOp::Lt, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rgt(const Scalar& other) const -> Result<Series> {
        return compare(CompareOp::Gt, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rle(const Scalar& other) const -> Result<Series> {
        return compare(CompareOp::Le, other, ScalarSide::Left);
    }
    [[nodiscard]] auto rge(const Scalar& other) const -> Result<Series> {
        return compare(CompareOp::Ge, other, ScalarSide::Left);
    }

    // ─── Indexing, filtering, slicing ─────────────────────────────────────────

    [[nodiscard]] auto get(std::int64_t index) const -> Result<AnyValue>;
    [[nodiscard]] auto filter(const Series& mask) const -> Result<Series>;
    [[nodiscard]] auto slice(std::int64_t offset, size_type length) const -> Result<Series>;
    [[nodiscard]] auto limit(size_type n) const -> Series;
    [[nodiscard]] auto head(size_type n = 10) const -> Series;
    [[nodiscard]] auto tail(size_type n = 10) const -> Series;
    [[nodiscard]] auto take(std::span<const size_type> indices) const -> Result<Series>;
    /// Gather by an integer Series; a null index yields a null element.
    [[nodiscard]] auto take(const Series& indices) const -> Result<Series>;

    /// New Series with `value` written wherever `mask` is true.
    [[nodiscard]] auto set(const Series& mask, const AnyValue& value) const -> Result<Series>;
    /// New Series with `value` written at every position in `indices`.
    [[nodiscard]] auto set_at_idx(std::span<const size_type> indices, const AnyValue& value) const
        -> Result<Series>;
    [[nodiscard]] auto set_at_idx(const Series& indices, const AnyValue& value) const
        -> Result<Series>;

    [[nodiscard]] auto shift(std::int64_t periods) const -> Series;
    [[nodiscard]] auto zip_with(const Series& mask, const Series& other) const -> Result<Series>;

    // ─── Sorting, uniqueness, reductions ──────────────────────────────────────

    [[nodiscard]] auto sort(bool reverse = false) const -> Result<Series>;
    [[nodiscard]] auto sort_mut(bool reverse = false) -> Result<void>;
    [[nodiscard]] auto argsort(bool reverse = false) const -> Result<std::vector<size_type>>;
    [[nodiscard]] auto arg_unique() const -> Result<std::vector<size_type>>;

    [[nodiscard]] auto sum() const -> Result<AnyValue>;
    [[nodiscard]] auto min() const -> Result<AnyValue>;
    [[nodiscard]] auto max() const -> Result<AnyValue>;
    [[nodiscard]] auto mean() const -> Result<std::optional<double>>;

    // ─── Nulls ────────────────────────────────────────────────────────────────

    [[nodiscard]] auto is_null() const -> Series;
    [[nodiscard]] auto is_not_null() const -> Series;
    [[nodiscard]] auto fill_none(FillStrategy strategy) const -> Result<Series>;
    [[nodiscard]] auto fill_none(std::string_view strategy) const -> Result<Series>;

    // ─── Conversion ───────────────────────────────────────────────────────────

    [[nodiscard]] auto cast(DType dtype) const -> Result<Series>;

    /// Map each valid element through f; nulls stay null. T must be this
    /// Series' physical type; the output dtype follows f's return type.
    template <typename T, typename F>
        requires std::invocable<F&, const T&>
    [[nodiscard]] auto apply(F&& f) const -> Result<Series>;

    /// Hand the rechunked, dense input to f(std::span<const T>, std::span<T>)
    /// to fill the output. Validity is carried over from the input.
    template <typename T, typename F>
        requires std::invocable<F&, std::span<const T>, std::span<T>>
    [[nodiscard]] auto apply_dense(F&& f) -> Result<Series>;

    [[nodiscard]] auto to_list() const -> std::vector<AnyValue>;

    /// Contiguous copy of the values; nulls become value-initialized.
    template <typename T>
    [[nodiscard]] auto to_vector() const -> Result<std::vector<T>>;

    [[nodiscard]] auto series_equal(const Series& other, bool null_equal = false) const -> bool;

    [[nodiscard]] auto to_string() const -> std::string;

   private:
    [[nodiscard]] auto type_mismatch(DType requested, std::string_view what) const
        -> std::unexpected<Error>;

    std::string name_;
    AnyArray array_;
};

auto operator<<(std::ostream& out, const Series& series) -> std::ostream&;

// ─── Template definitions ─────────────────────────────────────────────────────

template <typename T, typename F>
    requires std::invocable<F&, const T&>
auto Series::apply(F&& f) const -> Result<Series> {
    using U = std::remove_cvref_t<std::invoke_result_t<F&, const T&>>;
    static_assert(is_physical_v<U>, "apply: function must return a Series element type");
    const auto* src = as<T>();
    if (src == nullptr) {
        return type_mismatch(dtype_of_v<T>, "apply");
    }
    ArrayBuilder<U> builder(src->size());
    src->for_each([&](const auto& v, bool valid) {
        if (valid) {
            builder.push(f(v));
        } else {
            builder.push_null();
        }
    });
    return Series(name_, AnyArray{builder.finish()});
}

template <typename T, typename F>
    requires std::invocable<F&, std::span<const T>, std::span<T>>
auto Series::apply_dense(F&& f) -> Result<Series> {
    static_assert(!std::is_same_v<T, bool>, "apply_dense: bool storage is bit-packed");
    if (as<T>() == nullptr) {
        return type_mismatch(dtype_of_v<T>, "apply_dense");
    }
    auto view = unsafe_dense_view();
    if (!view) {
        return std::unexpected(std::move(view.error()));
    }
    const auto& chunk = as<T>()->chunks().front();
    std::vector<T> out(view->length);
    f(view->as<T>(), std::span<T>(out));
    std::optional<Validity> validity;
    if (chunk.has_nulls()) {
        validity.emplace(chunk.size());
        for (size_type i = 0; i < chunk.size(); ++i) {
            (*validity)[i] = chunk.is_valid(i);
        }
    }
    return Series(name_, AnyArray{ChunkedArray<T>(std::move(out), std::move(validity))});
}

template <typename T>
auto Series::to_vector() const -> Result<std::vector<T>> {
    const auto* src = as<T>();
    if (src == nullptr) {
        return type_mismatch(dtype_of_v<T>, "to_vector");
    }
    std::vector<T> out;
    out.reserve(src->size());
    src->for_each([&](const auto& v, bool valid) { out.push_back(valid ? T(v) : T{}); });
    return out;
}

}  // namespace kestrel

template <>
struct fmt::formatter<kestrel::Series> : fmt::formatter<std::string> {
    auto format(const kestrel::Series& series, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(series.to_string(), ctx);
    }
};
