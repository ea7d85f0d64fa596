#include <kestrel/kestrel.hpp>

#include <fmt/core.h>

auto main() -> int {
    using kestrel::AnyValue;
    using kestrel::Scalar;
    using kestrel::Series;

    // Dense path: a column of prices
    Series prices("price", {100.5, 200.3, 50.0, 175.8, 320.1});

    fmt::print("=== Series operations ===\n");
    fmt::print("{}: {} elements, dtype {}\n", prices.name(), prices.len(),
               kestrel::dtype_code(prices.dtype()));

    // Filter: keep prices above 100
    auto mask = prices.gt(Scalar(100.0));
    if (!mask) {
        fmt::print("error: {}\n", mask.error().format());
        return 1;
    }
    auto expensive = prices.filter(*mask);
    if (!expensive) {
        fmt::print("error: {}\n", expensive.error().format());
        return 1;
    }
    fmt::print("prices > 100: {} elements\n", expensive->len());

    // Transform: convert to basis points
    auto bps = prices * Scalar(100.0);
    fmt::print("first price in bps: {}\n", kestrel::format_value(*bps.get(0)));

    // Nullable path with a forward fill
    fmt::print("\n=== Nulls ===\n");
    auto volumes = Series::from_list("volume", {AnyValue{Scalar(std::int64_t{10})}, std::nullopt,
                                                AnyValue{Scalar(std::int64_t{30})}});
    if (!volumes) {
        fmt::print("error: {}\n", volumes.error().format());
        return 1;
    }
    fmt::print("{} nulls before fill\n", volumes->null_count());
    auto filled = volumes->fill_none("forward");
    if (!filled) {
        fmt::print("error: {}\n", filled.error().format());
        return 1;
    }
    fmt::print("{}\n", *filled);

    // Sorting keeps nulls at the end
    fmt::print("\n=== Sorting ===\n");
    auto sorted = volumes->sort();
    if (!sorted) {
        fmt::print("error: {}\n", sorted.error().format());
        return 1;
    }
    fmt::print("{}\n", *sorted);

    return 0;
}
