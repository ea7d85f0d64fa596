#include <kestrel/kestrel.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace {

struct BenchConfig {
    std::size_t rows = 1'000'000;
    std::size_t chunks = 4;
    std::size_t iters = 5;
    std::size_t null_every = 0;  // 0 = no nulls
    std::uint64_t seed = 42;
    bool verbose = false;
    std::string log_level;
};

struct BenchCase {
    std::string name;
    std::function<kestrel::Result<std::size_t>()> run;  // returns a row count
};

// A float or integer column split into `chunks` appended pieces.
auto make_series(const BenchConfig& config, bool integer) -> kestrel::Result<kestrel::Series> {
    std::mt19937_64 rng(config.seed);
    std::uniform_int_distribution<std::int64_t> ints(0, 1'000);
    std::normal_distribution<double> floats(100.0, 15.0);

    const std::size_t chunks = std::max<std::size_t>(config.chunks, 1);
    std::size_t produced = 0;
    std::optional<kestrel::Series> out;
    for (std::size_t c = 0; c < chunks; ++c) {
        std::size_t n = config.rows / chunks + (c < config.rows % chunks ? 1 : 0);
        std::vector<kestrel::AnyValue> values;
        values.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            auto row = produced + i;
            if (config.null_every != 0 && row % config.null_every == 0) {
                values.emplace_back(std::nullopt);
            } else if (integer) {
                values.emplace_back(kestrel::Scalar(ints(rng)));
            } else {
                values.emplace_back(kestrel::Scalar(floats(rng)));
            }
        }
        auto piece = kestrel::Series::from_list(
            integer ? "ints" : "floats", values,
            integer ? kestrel::DType::Int64 : kestrel::DType::Float64);
        if (!piece) {
            return std::unexpected(piece.error());
        }
        if (!out.has_value()) {
            out = std::move(*piece);
        } else if (auto appended = out->append(*piece); !appended) {
            return std::unexpected(appended.error());
        }
        produced += n;
    }
    if (!out.has_value()) {
        return kestrel::Series(integer ? "ints" : "floats", std::vector<std::int64_t>{});
    }
    return std::move(*out);
}

template <typename T>
auto rows_of(const kestrel::Result<T>& result) -> kestrel::Result<std::size_t> {
    if (!result) {
        return std::unexpected(result.error());
    }
    if constexpr (std::is_same_v<T, kestrel::Series>) {
        return result->len();
    } else if constexpr (std::is_same_v<T, std::vector<std::size_t>>) {
        return result->size();
    } else {
        return std::size_t{1};
    }
}

auto run_case(const BenchCase& bench, std::size_t iters) -> int {
    std::size_t last_rows = 0;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iters; ++i) {
        auto result = bench.run();
        if (!result) {
            fmt::print("error: {} failed: {}\n", bench.name, result.error().format());
            return 1;
        }
        last_rows = *result;
    }
    auto end = std::chrono::steady_clock::now();

    auto total_ms =
        std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start).count();
    auto avg_ms = total_ms / static_cast<double>(iters);
    fmt::print("bench {}: iters={}, total_ms={:.3f}, avg_ms={:.3f}, rows={}\n", bench.name, iters,
               total_ms, avg_ms, last_rows);
    return 0;
}

void configure_logging(const BenchConfig& config) {
    std::string level = config.log_level;
    if (level.empty()) {
        if (const char* env = std::getenv("KESTREL_LOG_LEVEL")) {
            level = env;
        }
    }
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (!level.empty()) {
        spdlog::set_level(spdlog::level::from_str(level));
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"kestrel Series benchmark harness"};

    BenchConfig config;
    app.add_option("--rows", config.rows, "Rows per generated series")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--chunks", config.chunks, "Chunks per generated series")
        ->check(CLI::PositiveNumber);
    app.add_option("--iters", config.iters, "Measured iterations")->check(CLI::PositiveNumber);
    app.add_option("--null-every", config.null_every,
                   "Make every Nth row null (0 disables nulls)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--seed", config.seed, "Random seed for data generation");
    app.add_flag("-v,--verbose", config.verbose, "Enable debug logging");
    app.add_option("--log-level", config.log_level,
                   "spdlog level (trace, debug, info, warn, err, critical, off); "
                   "defaults to $KESTREL_LOG_LEVEL");

    CLI11_PARSE(app, argc, argv);
    configure_logging(config);

    auto ints = make_series(config, true);
    auto floats = make_series(config, false);
    if (!ints || !floats) {
        const auto& error = !ints ? ints.error() : floats.error();
        fmt::print("error: failed to generate data: {}\n", error.format());
        return 1;
    }
    spdlog::info("generated {} rows in {} chunks (null every {})", ints->len(), ints->n_chunks(),
                 config.null_every);

    auto mask = floats->gt(kestrel::Scalar(100.0));
    if (!mask) {
        fmt::print("error: failed to build mask: {}\n", mask.error().format());
        return 1;
    }

    std::vector<BenchCase> cases = {
        {"add_scalar", [&] { return rows_of(floats->add(kestrel::Scalar(1.5))); }},
        {"mul_series", [&] { return rows_of(ints->mul(*ints)); }},
        {"compare_scalar", [&] { return rows_of(ints->lt(kestrel::Scalar(std::int64_t{500}))); }},
        {"filter", [&] { return rows_of(floats->filter(*mask)); }},
        {"sort_int", [&] { return rows_of(ints->sort()); }},
        {"sort_float_desc", [&] { return rows_of(floats->sort(true)); }},
        {"arg_unique_int", [&] { return rows_of(ints->arg_unique()); }},
        {"fill_forward", [&] { return rows_of(floats->fill_none(kestrel::FillStrategy::Forward)); }},
        {"sum_float", [&] { return rows_of(floats->sum()); }},
        {"mean_int", [&] { return rows_of(ints->mean()); }},
        {"rechunk", [&] { return rows_of(kestrel::Result<kestrel::Series>(floats->rechunk())); }},
    };

    for (const auto& bench : cases) {
        if (int status = run_case(bench, config.iters); status != 0) {
            return status;
        }
    }
    return 0;
}
