#pragma once

#include <compare>
#include <cstdint>
#include <functional>

namespace kestrel {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Wall-clock time of day in nanoseconds since midnight.
struct TimeOfDay {
    std::int64_t nanos = 0;
    auto operator<=>(const TimeOfDay&) const = default;
};

/// Signed elapsed time in nanoseconds.
struct Duration {
    std::int64_t nanos = 0;
    auto operator<=>(const Duration&) const = default;
};

}  // namespace kestrel

namespace std {

template <>
struct hash<kestrel::Date> {
    auto operator()(const kestrel::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<kestrel::Timestamp> {
    auto operator()(const kestrel::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

template <>
struct hash<kestrel::TimeOfDay> {
    auto operator()(const kestrel::TimeOfDay& t) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(t.nanos);
    }
};

template <>
struct hash<kestrel::Duration> {
    auto operator()(const kestrel::Duration& d) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(d.nanos);
    }
};

}  // namespace std
