#include <kestrel/series/series.hpp>

#include "series_test_util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace kestrel;
using namespace kestrel::test;

namespace {

using I64s = std::vector<std::optional<std::int64_t>>;
using Strs = std::vector<std::optional<std::string>>;

auto mask_of(std::vector<AnyValue> bits) -> Series {
    return require_series(Series::from_list("mask", bits, DType::Boolean));
}

auto five() -> Series {
    return Series("s", std::vector<std::int64_t>{1, 2, 3, 4, 5});
}

}  // namespace

// ─── get ──────────────────────────────────────────────────────────────────────

TEST_CASE("get returns an optional scalar", "[series][select]") {
    auto s = require_list({i64(10), kNull, i64(30)});

    REQUIRE(*s.get(0) == i64(10));
    REQUIRE_FALSE(s.get(1)->has_value());
    REQUIRE(*s.get(2) == i64(30));

    auto negative = s.get(-1);
    REQUIRE_FALSE(negative.has_value());
    REQUIRE(negative.error().kind == ErrorKind::IndexOutOfRange);

    auto past_end = s.get(3);
    REQUIRE_FALSE(past_end.has_value());
    REQUIRE(past_end.error().kind == ErrorKind::IndexOutOfRange);

    SECTION("across chunk boundaries") {
        auto c = chunked<std::string>("c", {{"a", "b"}, {"c"}});
        REQUIRE(*c.get(2) == str("c"));
    }
}

// ─── filter ───────────────────────────────────────────────────────────────────

TEST_CASE("filter keeps rows where the mask is true", "[series][select]") {
    auto s = five();

    SECTION("mixed mask, null counts as false") {
        auto out = require_series(s.filter(
            mask_of({boolean(true), boolean(false), kNull, boolean(true), boolean(false)})));
        REQUIRE(values_of<std::int64_t>(out) == I64s{1, 4});
        REQUIRE(out.name() == "s");
    }

    SECTION("all false gives an empty series of the same dtype") {
        auto out = require_series(s.filter(Series("m", {false, false, false, false, false})));
        REQUIRE(out.is_empty());
        REQUIRE(out.dtype() == DType::Int64);
    }

    SECTION("all true gives the input back") {
        auto out = require_series(s.filter(Series("m", {true, true, true, true, true})));
        REQUIRE(out.series_equal(s));
    }

    SECTION("mask must be boolean") {
        auto out = s.filter(s);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::UnsupportedTypeCombination);
    }

    SECTION("mask must match the length") {
        auto out = s.filter(Series("m", {true, false}));
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::ShapeMismatch);
    }
}

// ─── slice / limit / head / tail ──────────────────────────────────────────────

TEST_CASE("slice is a zero-copy window", "[series][select]") {
    auto s = five();

    auto out = require_series(s.slice(1, 3));
    REQUIRE(values_of<std::int64_t>(out) == I64s{2, 3, 4});
    REQUIRE(out.as<std::int64_t>()->chunks()[0].buffer() ==
            s.as<std::int64_t>()->chunks()[0].buffer());

    REQUIRE(require_series(s.slice(5, 0)).is_empty());

    auto negative = s.slice(-1, 1);
    REQUIRE_FALSE(negative.has_value());
    REQUIRE(negative.error().kind == ErrorKind::IndexOutOfRange);

    auto too_long = s.slice(3, 3);
    REQUIRE_FALSE(too_long.has_value());
    REQUIRE(too_long.error().kind == ErrorKind::IndexOutOfRange);

    SECTION("across chunks") {
        auto c = chunked<std::int64_t>("c", {{1, 2}, {3, 4}, {5}});
        auto window = require_series(c.slice(1, 3));
        REQUIRE(window.n_chunks() == 2);
        REQUIRE(values_of<std::int64_t>(window) == I64s{2, 3, 4});
    }
}

TEST_CASE("limit, head and tail truncate", "[series][select]") {
    auto s = five();

    REQUIRE(values_of<std::int64_t>(s.limit(2)) == I64s{1, 2});
    REQUIRE(s.limit(100).len() == 5);
    REQUIRE(s.head().len() == 5);
    REQUIRE(values_of<std::int64_t>(s.head(3)) == I64s{1, 2, 3});
    REQUIRE(values_of<std::int64_t>(s.tail(2)) == I64s{4, 5});
    REQUIRE(s.tail(0).is_empty());

    std::vector<std::int64_t> many(25, 7);
    Series big("b", many);
    REQUIRE(big.head().len() == 10);
    REQUIRE(big.tail().len() == 10);
}

// ─── take ─────────────────────────────────────────────────────────────────────

TEST_CASE("take gathers by position", "[series][select]") {
    Series s("s", {std::string("a"), std::string("b"), std::string("c")});

    std::vector<std::size_t> idx{2, 0, 0};
    auto out = require_series(s.take(idx));
    REQUIRE(values_of<std::string>(out) == Strs{"c", "a", "a"});

    std::vector<std::size_t> bad{0, 3};
    auto rejected = s.take(bad);
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error().kind == ErrorKind::IndexOutOfRange);

    SECTION("by an integer series with nulls") {
        auto indices = require_series(Series::from_list("i", {i64(1), kNull, i64(2)}, DType::UInt32));
        auto gathered = require_series(s.take(indices));
        REQUIRE(values_of<std::string>(gathered) == Strs{"b", std::nullopt, "c"});
    }

    SECTION("negative positions are out of range") {
        auto indices = require_list({i64(0), i64(-1)});
        auto out_of_range = s.take(indices);
        REQUIRE_FALSE(out_of_range.has_value());
        REQUIRE(out_of_range.error().kind == ErrorKind::IndexOutOfRange);
    }

    SECTION("non-integer index series") {
        auto wrong = s.take(Series("f", {1.0}));
        REQUIRE_FALSE(wrong.has_value());
        REQUIRE(wrong.error().kind == ErrorKind::UnsupportedTypeCombination);
    }
}

// ─── set / set_at_idx ─────────────────────────────────────────────────────────

TEST_CASE("set writes through a mask into a new series", "[series][select]") {
    auto s = five();
    auto mask = Series("m", {true, false, true, false, false});

    auto out = require_series(s.set(mask, i64(0)));
    REQUIRE(values_of<std::int64_t>(out) == I64s{0, 2, 0, 4, 5});
    REQUIRE(values_of<std::int64_t>(s) == I64s{1, 2, 3, 4, 5});

    auto nulled = require_series(s.set(mask, kNull));
    REQUIRE(nulled.null_count() == 2);
    REQUIRE(values_of<std::int64_t>(nulled) == I64s{std::nullopt, 2, std::nullopt, 4, 5});

    auto wrong = s.set(mask, str("x"));
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().kind == ErrorKind::UnsupportedTypeCombination);

    SECTION("numeric values convert to the series dtype") {
        Series floats("f", {1.0, 2.0});
        auto written = require_series(floats.set(Series("m", {false, true}), i64(9)));
        REQUIRE(values_of<double>(written) == std::vector<std::optional<double>>{1.0, 9.0});
    }
}

TEST_CASE("set_at_idx writes at positions", "[series][select]") {
    auto s = require_list({i64(1), kNull, i64(3)});

    std::vector<std::size_t> idx{1, 2};
    auto out = require_series(s.set_at_idx(idx, i64(7)));
    REQUIRE(values_of<std::int64_t>(out) == I64s{1, 7, 7});
    REQUIRE(s.null_count() == 1);

    std::vector<std::size_t> bad{5};
    auto rejected = s.set_at_idx(bad, i64(7));
    REQUIRE_FALSE(rejected.has_value());
    REQUIRE(rejected.error().kind == ErrorKind::IndexOutOfRange);

    SECTION("by an integer series") {
        auto indices = require_list({i64(0), kNull});
        auto written = require_series(s.set_at_idx(indices, kNull));
        REQUIRE(values_of<std::int64_t>(written) == I64s{std::nullopt, std::nullopt, 3});
    }
}

// ─── shift / zip_with ─────────────────────────────────────────────────────────

TEST_CASE("shift moves values and fills with null", "[series][select]") {
    Series s("s", std::vector<std::int64_t>{1, 2, 3});

    REQUIRE(values_of<std::int64_t>(s.shift(1)) == I64s{std::nullopt, 1, 2});
    REQUIRE(values_of<std::int64_t>(s.shift(-1)) == I64s{2, 3, std::nullopt});
    REQUIRE(values_of<std::int64_t>(s.shift(0)) == I64s{1, 2, 3});
    REQUIRE(s.shift(5).null_count() == 3);
    REQUIRE(s.shift(-3).null_count() == 3);
    REQUIRE(s.shift(2).len() == 3);
}

TEST_CASE("zip_with picks from self or other", "[series][select]") {
    Series s("s", std::vector<std::int64_t>{1, 2, 3});
    Series other("o", std::vector<std::int64_t>{10, 20, 30});

    auto out = require_series(
        s.zip_with(mask_of({boolean(true), boolean(false), kNull}), other));
    REQUIRE(values_of<std::int64_t>(out) == I64s{1, 20, 30});

    auto wrong = s.zip_with(Series("m", {true, true, true}), Series("f", {1.0, 2.0, 3.0}));
    REQUIRE_FALSE(wrong.has_value());
    REQUIRE(wrong.error().kind == ErrorKind::UnsupportedTypeCombination);

    auto short_other = s.zip_with(Series("m", {true, true, true}),
                                  Series("o", std::vector<std::int64_t>{1}));
    REQUIRE_FALSE(short_other.has_value());
    REQUIRE(short_other.error().kind == ErrorKind::ShapeMismatch);
}
