#pragma once

#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kestrel {

enum class ErrorKind : std::uint8_t {
    UnsupportedTypeCombination,
    DtypeInferenceFailure,
    ShapeMismatch,
    IndexOutOfRange,
    InvalidStrategy,
    ConstructionRejected,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Error returned by every fallible Series operation.
struct Error {
    ErrorKind kind = ErrorKind::UnsupportedTypeCombination;
    std::string message;

    /// "<kind>: <message>", suitable for logs and exception text.
    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error>;

/// Thrown by the operator overloads in <kestrel/series/ops.hpp>, which have no
/// way to hand an Error back through the return value.
class SeriesException : public std::runtime_error {
   public:
    explicit SeriesException(Error error);

    [[nodiscard]] auto error() const noexcept -> const Error& { return error_; }

   private:
    Error error_;
};

}  // namespace kestrel
