#include <kestrel/series/series.hpp>

#include "kernels.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <type_traits>
#include <utility>

namespace kestrel {

namespace {

// Widened dtype a nullable-path element infers to, if any.
auto inferred_dtype(const Scalar& value) -> std::optional<DType> {
    return std::visit(
        [](const auto& v) -> std::optional<DType> {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, bool>) {
                return DType::Boolean;
            } else if constexpr (std::is_integral_v<V>) {
                return DType::Int64;
            } else if constexpr (std::is_floating_point_v<V>) {
                return DType::Float64;
            } else if constexpr (std::is_same_v<V, std::string>) {
                return DType::Utf8;
            } else {
                return std::nullopt;
            }
        },
        value);
}

}  // namespace

auto operator==(const List& lhs, const List& rhs) -> bool {
    if (lhs.values == nullptr || rhs.values == nullptr) {
        return lhs.values == rhs.values;
    }
    return lhs.values->series_equal(*rhs.values, true);
}

// ─── Construction ─────────────────────────────────────────────────────────────

Series::Series(std::string name, AnyArray array) : name_(std::move(name)), array_(std::move(array)) {}

Series::Series(std::string name, const Series& other) : name_(std::move(name)), array_(other.array_) {}

auto Series::from_list(std::string name, const std::vector<AnyValue>& values) -> Result<Series> {
    std::optional<DType> dtype;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!values[i].has_value()) {
            continue;
        }
        auto inferred = inferred_dtype(*values[i]);
        if (!inferred.has_value()) {
            return make_error(ErrorKind::DtypeInferenceFailure,
                              fmt::format("cannot infer a dtype from element {} of dtype '{}'", i,
                                          dtype_code(scalar_dtype(*values[i]))));
        }
        // Only u64 can overflow the widened i64.
        if (*inferred == DType::Int64 && !scalar_cast<std::int64_t>(*values[i]).has_value()) {
            return make_error(ErrorKind::ConstructionRejected,
                              fmt::format("element {} ({}) does not fit the inferred '{}'", i,
                                          format_scalar(*values[i]), dtype_code(DType::Int64)));
        }
        if (!dtype.has_value()) {
            dtype = inferred;
        } else if (*dtype != *inferred) {
            return make_error(ErrorKind::ConstructionRejected,
                              fmt::format("element {} is '{}' but the series infers '{}'", i,
                                          dtype_code(*inferred), dtype_code(*dtype)));
        }
    }
    if (!dtype.has_value()) {
        return make_error(ErrorKind::DtypeInferenceFailure,
                          "cannot infer a dtype from a sequence without non-null values");
    }
    return from_list(std::move(name), values, *dtype);
}

auto Series::from_list(std::string name, const std::vector<AnyValue>& values, DType dtype)
    -> Result<Series> {
    return visit_dtype(dtype, [&]<typename T>(std::type_identity<T>) -> Result<Series> {
        ArrayBuilder<T> builder(values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (!values[i].has_value()) {
                builder.push_null();
                continue;
            }
            auto converted = scalar_cast<T>(*values[i]);
            if (!converted.has_value()) {
                return make_error(ErrorKind::ConstructionRejected,
                                  fmt::format("element {} of dtype '{}' does not convert to '{}'",
                                              i, dtype_code(scalar_dtype(*values[i])),
                                              dtype_code(dtype)));
            }
            builder.push(std::move(*converted));
        }
        return detail::wrap(std::move(name), builder.finish());
    });
}

auto Series::from_scalars(std::string name, const std::vector<Scalar>& values) -> Result<Series> {
    if (values.empty()) {
        return make_error(ErrorKind::DtypeInferenceFailure,
                          "cannot infer a dtype from an empty sequence");
    }
    DType dtype = scalar_dtype(values.front());
    return visit_dtype(dtype, [&]<typename T>(std::type_identity<T>) -> Result<Series> {
        std::vector<T> out;
        out.reserve(values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            const auto* v = std::get_if<T>(&values[i]);
            if (v == nullptr) {
                return make_error(
                    ErrorKind::ConstructionRejected,
                    fmt::format("mixed element dtypes: element {} is '{}', expected '{}'", i,
                                dtype_code(scalar_dtype(values[i])), dtype_code(dtype)));
            }
            out.push_back(*v);
        }
        return Series(std::move(name), std::move(out));
    });
}

auto Series::full_null(std::string name, DType dtype, size_type length) -> Series {
    if (length == 0) {
        return Series(std::move(name), make_empty_array(dtype));
    }
    return visit_dtype(dtype, [&]<typename T>(std::type_identity<T>) -> Series {
        return detail::wrap(std::move(name),
                            ChunkedArray<T>(std::vector<T>(length), Validity(length, false)));
    });
}

// ─── Metadata ─────────────────────────────────────────────────────────────────

auto Series::len() const noexcept -> size_type {
    return std::visit([](const auto& arr) { return arr.size(); }, array_);
}

auto Series::n_chunks() const noexcept -> size_type {
    return std::visit([](const auto& arr) { return arr.n_chunks(); }, array_);
}

auto Series::null_count() const noexcept -> size_type {
    return std::visit([](const auto& arr) { return arr.null_count(); }, array_);
}

auto Series::type_mismatch(DType requested, std::string_view what) const
    -> std::unexpected<Error> {
    return make_error(ErrorKind::UnsupportedTypeCombination,
                      fmt::format("{}: requested '{}' but series '{}' has dtype '{}'", what,
                                  dtype_code(requested), name_, dtype_code(dtype())));
}

// ─── Chunk management ─────────────────────────────────────────────────────────

auto Series::append(const Series& other) -> Result<void> {
    if (other.dtype() != dtype()) {
        return make_error(ErrorKind::UnsupportedTypeCombination,
                          fmt::format("cannot append '{}' to series '{}' of dtype '{}'",
                                      dtype_code(other.dtype()), name_, dtype_code(dtype())));
    }
    std::visit(
        [&](auto& arr) {
            using ArrT = std::decay_t<decltype(arr)>;
            arr.append(std::get<ArrT>(other.array_));
        },
        array_);
    spdlog::debug("append '{}': now {} rows in {} chunks", name_, len(), n_chunks());
    return {};
}

auto Series::rechunk() const -> Series {
    return Series(name_, std::visit([](const auto& arr) -> AnyArray { return arr.rechunk(); },
                                    array_));
}

void Series::rechunk_mut() {
    if (n_chunks() == 1) {
        return;
    }
    spdlog::debug("rechunk '{}': {} chunks -> 1", name_, n_chunks());
    array_ = std::visit([](const auto& arr) -> AnyArray { return arr.rechunk(); }, array_);
}

auto Series::unsafe_dense_view() -> Result<DenseView> {
    if (!supports(Op::DenseView, dtype())) {
        return unsupported(Op::DenseView, dtype());
    }
    rechunk_mut();
    if (auto nulls = null_count(); nulls > 0) {
        spdlog::warn("dense view of series '{}' drops {} null value(s)", name_, nulls);
    }
    return std::visit(
        [&](const auto& arr) -> Result<DenseView> {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            if constexpr (supports<T>(Op::DenseView)) {
                const auto& chunk = arr.chunks().front();
                return DenseView{.data = chunk.data(),
                                 .length = chunk.size(),
                                 .dtype = dtype_of_v<T>,
                                 .element_size = sizeof(T)};
            } else {
                return unsupported(Op::DenseView, dtype_of_v<T>);
            }
        },
        array_);
}

// ─── Interchange ──────────────────────────────────────────────────────────────

auto Series::to_list() const -> std::vector<AnyValue> {
    std::vector<AnyValue> out;
    out.reserve(len());
    std::visit(
        [&](const auto& arr) {
            using T = typename std::decay_t<decltype(arr)>::value_type;
            arr.for_each([&](const auto& v, bool valid) {
                if (valid) {
                    out.emplace_back(Scalar(std::in_place_type<T>, v));
                } else {
                    out.emplace_back(std::nullopt);
                }
            });
        },
        array_);
    return out;
}

auto Series::series_equal(const Series& other, bool null_equal) const -> bool {
    if (len() != other.len()) {
        return false;
    }
    if (dtype() != other.dtype()) {
        if (!is_numeric() || !other.is_numeric()) {
            return false;
        }
        if (is_integer(dtype()) && is_integer(other.dtype())) {
            bool equal = true;
            detail::visit_integers(*this, other, [&](const auto& lhs, const auto& rhs) {
                detail::zip_for_each(lhs, rhs, [&](auto lv, bool lvalid, auto rv, bool rvalid) {
                    if (!equal) {
                        return;
                    }
                    if (!lvalid || !rvalid) {
                        equal = null_equal && !lvalid && !rvalid;
                        return;
                    }
                    equal = std::cmp_equal(lv, rv);
                });
            });
            return equal;
        }
        auto target = numeric_supertype(dtype(), other.dtype());
        return detail::cast_numeric(*this, target)
            .series_equal(detail::cast_numeric(other, target), null_equal);
    }
    bool equal = true;
    std::visit(
        [&](const auto& lhs) {
            using ArrT = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<ArrT>(other.array_);
            detail::zip_for_each(lhs, rhs, [&](const auto& lv, bool lvalid, const auto& rv,
                                               bool rvalid) {
                if (!equal) {
                    return;
                }
                if (!lvalid || !rvalid) {
                    equal = null_equal && !lvalid && !rvalid;
                    return;
                }
                equal = detail::value_equal(lv, rv);
            });
        },
        array_);
    return equal;
}

}  // namespace kestrel
