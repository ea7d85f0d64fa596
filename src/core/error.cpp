#include <kestrel/core/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace kestrel {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::UnsupportedTypeCombination:
            return "unsupported type combination";
        case ErrorKind::DtypeInferenceFailure:
            return "dtype inference failure";
        case ErrorKind::ShapeMismatch:
            return "shape mismatch";
        case ErrorKind::IndexOutOfRange:
            return "index out of range";
        case ErrorKind::InvalidStrategy:
            return "invalid strategy";
        case ErrorKind::ConstructionRejected:
            return "construction rejected";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

auto make_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

SeriesException::SeriesException(Error error)
    : std::runtime_error(error.format()), error_(std::move(error)) {}

}  // namespace kestrel
