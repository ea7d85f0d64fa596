#include <kestrel/series/series.hpp>

#include <fmt/format.h>

#include <chrono>
#include <cmath>
#include <ostream>
#include <string>
#include <type_traits>

namespace kestrel {

namespace {

constexpr std::size_t kMaxRows = 20;
constexpr std::size_t kEdgeRows = 10;

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<nanoseconds> hms{tp - day};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

auto format_time(TimeOfDay t) -> std::string {
    using namespace std::chrono;
    hh_mm_ss<nanoseconds> hms{nanoseconds{t.nanos}};
    return fmt::format("{:02}:{:02}:{:02}.{:09}", hms.hours().count(), hms.minutes().count(),
                       hms.seconds().count(), hms.subseconds().count());
}

// Keep NaN/Inf explicit and always show a decimal point for whole floats.
template <typename F>
auto format_float(F v) -> std::string {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "inf" : "-inf";
    }
    auto s = fmt::format("{}", v);
    if (s.find_first_of(".e") == std::string::npos) {
        s += ".0";
    }
    return s;
}

auto format_list(const List& list) -> std::string {
    if (list.values == nullptr) {
        return "[]";
    }
    std::string out = "[";
    bool first = true;
    for (const auto& value : list.values->to_list()) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += format_value(value);
    }
    out += "]";
    return out;
}

}  // namespace

auto format_scalar(const Scalar& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_floating_point_v<T>) {
                return format_float(v);
            } else if constexpr (std::is_integral_v<T>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, TimeOfDay>) {
                return format_time(v);
            } else if constexpr (std::is_same_v<T, Duration>) {
                return fmt::format("{}ns", v.nanos);
            } else {
                return format_list(v);
            }
        },
        value);
}

auto format_value(const AnyValue& value) -> std::string {
    return value.has_value() ? format_scalar(*value) : "null";
}

auto Series::to_string() const -> std::string {
    std::string out = fmt::format("Series: '{}' [{}]\n[\n", name_, dtype_code(dtype()));
    auto values = to_list();
    auto emit = [&](std::size_t i) { out += fmt::format("\t{}\n", format_value(values[i])); };
    if (values.size() <= kMaxRows) {
        for (std::size_t i = 0; i < values.size(); ++i) {
            emit(i);
        }
    } else {
        for (std::size_t i = 0; i < kEdgeRows; ++i) {
            emit(i);
        }
        out += "\t...\n";
        for (std::size_t i = values.size() - kEdgeRows; i < values.size(); ++i) {
            emit(i);
        }
    }
    out += "]";
    return out;
}

auto operator<<(std::ostream& out, const Series& series) -> std::ostream& {
    return out << series.to_string();
}

}  // namespace kestrel
