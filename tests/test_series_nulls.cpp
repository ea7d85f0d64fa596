#include <kestrel/series/series.hpp>

#include "series_test_util.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace kestrel;
using namespace kestrel::test;

namespace {

using I64s = std::vector<std::optional<std::int64_t>>;
using F64s = std::vector<std::optional<double>>;
using Bools = std::vector<std::optional<bool>>;

}  // namespace

TEST_CASE("is_null and is_not_null are dense boolean masks", "[series][nulls]") {
    auto s = require_list({i64(1), kNull, i64(3)});

    auto nulls = s.is_null();
    REQUIRE(nulls.dtype() == DType::Boolean);
    REQUIRE(nulls.null_count() == 0);
    REQUIRE(nulls.name() == "s");
    REQUIRE(values_of<bool>(nulls) == Bools{false, true, false});
    REQUIRE(values_of<bool>(s.is_not_null()) == Bools{true, false, true});

    SECTION("across chunks") {
        auto c = chunked<std::int64_t>("c", {{1}, {2, 3}});
        REQUIRE(values_of<bool>(c.is_null()) == Bools{false, false, false});
    }
}

// ─── Directional fills ────────────────────────────────────────────────────────

TEST_CASE("forward fill carries the last valid value", "[series][nulls]") {
    auto s = require_list({i64(1), kNull, i64(3)});
    auto out = require_series(s.fill_none(FillStrategy::Forward));
    REQUIRE(values_of<std::int64_t>(out) == I64s{1, 1, 3});
    REQUIRE(out.null_count() == 0);

    SECTION("leading nulls stay null") {
        auto lead = require_list({kNull, kNull, i64(2), kNull});
        auto filled = require_series(lead.fill_none(FillStrategy::Forward));
        REQUIRE(values_of<std::int64_t>(filled) == I64s{std::nullopt, std::nullopt, 2, 2});
    }

    SECTION("across chunk boundaries") {
        auto first = require_list({i64(5), kNull});
        REQUIRE(first.append(require_list({kNull, i64(6)})).has_value());
        auto filled = require_series(first.fill_none(FillStrategy::Forward));
        REQUIRE(values_of<std::int64_t>(filled) == I64s{5, 5, 5, 6});
    }
}

TEST_CASE("backward fill carries the next valid value", "[series][nulls]") {
    auto s = require_list({kNull, i64(2), kNull, i64(4), kNull});
    auto out = require_series(s.fill_none(FillStrategy::Backward));
    REQUIRE(values_of<std::int64_t>(out) == I64s{2, 2, 4, 4, std::nullopt});
}

// ─── Value fills ──────────────────────────────────────────────────────────────

TEST_CASE("min, max and mean fills", "[series][nulls]") {
    auto s = require_list({i64(1), kNull, i64(2)});

    REQUIRE(values_of<std::int64_t>(require_series(s.fill_none(FillStrategy::Min))) ==
            I64s{1, 1, 2});
    REQUIRE(values_of<std::int64_t>(require_series(s.fill_none(FillStrategy::Max))) ==
            I64s{1, 2, 2});

    SECTION("integer mean truncates to the series dtype") {
        auto out = require_series(s.fill_none(FillStrategy::Mean));
        REQUIRE(out.dtype() == DType::Int64);
        REQUIRE(values_of<std::int64_t>(out) == I64s{1, 1, 2});

        auto negative = require_list({i64(-1), kNull, i64(-2)});
        auto filled = require_series(negative.fill_none(FillStrategy::Mean));
        REQUIRE(values_of<std::int64_t>(filled) == I64s{-1, -1, -2});
    }

    SECTION("narrow integer mean") {
        auto bytes = require_series(Series::from_list("b", {i64(10), kNull, i64(15)}, DType::UInt8));
        auto out = require_series(bytes.fill_none(FillStrategy::Mean));
        REQUIRE(out.dtype() == DType::UInt8);
        REQUIRE(values_of<std::uint8_t>(out) == std::vector<std::optional<std::uint8_t>>{10, 12, 15});
    }

    SECTION("float mean") {
        auto f = require_list({f64(1.0), kNull, f64(2.0)});
        auto out = values_of<double>(require_series(f.fill_none(FillStrategy::Mean)));
        REQUIRE(*out[1] == Catch::Approx(1.5));
    }

    SECTION("boolean max") {
        auto b = require_list({boolean(false), kNull, boolean(true)});
        auto out = require_series(b.fill_none(FillStrategy::Max));
        REQUIRE(values_of<bool>(out) == Bools{false, true, true});
    }

    SECTION("string min") {
        auto w = require_list({str("pear"), kNull, str("apple")});
        auto out = require_series(w.fill_none(FillStrategy::Min));
        REQUIRE(values_of<std::string>(out) ==
                std::vector<std::optional<std::string>>{"pear", "apple", "apple"});
    }
}

TEST_CASE("mean fill needs a numeric series", "[series][nulls]") {
    auto w = require_list({str("a"), kNull});
    auto out = w.fill_none(FillStrategy::Mean);
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().kind == ErrorKind::UnsupportedTypeCombination);
}

TEST_CASE("fills leave series without usable values alone", "[series][nulls]") {
    auto all_null = require_series(Series::from_list("n", {kNull, kNull}, DType::Float64));
    auto out = require_series(all_null.fill_none(FillStrategy::Mean));
    REQUIRE(out.null_count() == 2);
    REQUIRE(require_series(all_null.fill_none(FillStrategy::Forward)).null_count() == 2);

    Series dense("d", {1.0, 2.0});
    REQUIRE(require_series(dense.fill_none(FillStrategy::Min)).series_equal(dense));
}

// ─── Strategy names ───────────────────────────────────────────────────────────

TEST_CASE("fill strategies parse by name", "[series][nulls]") {
    REQUIRE(*parse_fill_strategy("forward") == FillStrategy::Forward);
    REQUIRE(*parse_fill_strategy("backward") == FillStrategy::Backward);
    REQUIRE(*parse_fill_strategy("min") == FillStrategy::Min);
    REQUIRE(*parse_fill_strategy("max") == FillStrategy::Max);
    REQUIRE(*parse_fill_strategy("mean") == FillStrategy::Mean);

    auto s = require_list({f64(1.0), kNull});
    REQUIRE(values_of<double>(require_series(s.fill_none("forward"))) == F64s{1.0, 1.0});

    auto bad = s.fill_none("sideways");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == ErrorKind::InvalidStrategy);
    REQUIRE(bad.error().message ==
            "unknown fill strategy 'sideways' (expected forward, backward, min, max or mean)");
}
