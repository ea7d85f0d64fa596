#include <kestrel/core/dtype.hpp>

#include <algorithm>

namespace kestrel {

namespace {

auto signed_of_bits(unsigned bits) -> DType {
    switch (bits) {
        case 8:
            return DType::Int8;
        case 16:
            return DType::Int16;
        case 32:
            return DType::Int32;
        default:
            return DType::Int64;
    }
}

auto unsigned_of_bits(unsigned bits) -> DType {
    switch (bits) {
        case 8:
            return DType::UInt8;
        case 16:
            return DType::UInt16;
        case 32:
            return DType::UInt32;
        default:
            return DType::UInt64;
    }
}

}  // namespace

auto dtype_name(DType dtype) noexcept -> std::string_view {
    switch (dtype) {
        case DType::Int8:
            return "Int8";
        case DType::Int16:
            return "Int16";
        case DType::Int32:
            return "Int32";
        case DType::Int64:
            return "Int64";
        case DType::UInt8:
            return "UInt8";
        case DType::UInt16:
            return "UInt16";
        case DType::UInt32:
            return "UInt32";
        case DType::UInt64:
            return "UInt64";
        case DType::Float32:
            return "Float32";
        case DType::Float64:
            return "Float64";
        case DType::Boolean:
            return "Boolean";
        case DType::Utf8:
            return "Utf8";
        case DType::Date32:
            return "Date32";
        case DType::Datetime:
            return "Datetime";
        case DType::Time64:
            return "Time64";
        case DType::Duration:
            return "Duration";
        case DType::List:
            return "List";
    }
    return "Unknown";
}

auto numeric_supertype(DType lhs, DType rhs) noexcept -> DType {
    if (lhs == rhs) {
        return lhs;
    }
    unsigned lbits = numeric_bits(lhs);
    unsigned rbits = numeric_bits(rhs);
    if (is_float(lhs) || is_float(rhs)) {
        // f32 only survives against f32 or small integers; everything else needs f64.
        if (lhs == DType::Float64 || rhs == DType::Float64) {
            return DType::Float64;
        }
        unsigned int_bits = is_float(lhs) ? rbits : lbits;
        return int_bits <= 16 ? DType::Float32 : DType::Float64;
    }
    bool lsigned = is_signed_integer(lhs);
    bool rsigned = is_signed_integer(rhs);
    if (lsigned == rsigned) {
        return lsigned ? signed_of_bits(std::max(lbits, rbits))
                       : unsigned_of_bits(std::max(lbits, rbits));
    }
    // Mixed signedness: a signed type wide enough for the unsigned side. No
    // signed type holds every u64, so u64 against a signed type goes to f64.
    unsigned unsigned_bits = lsigned ? rbits : lbits;
    unsigned signed_bits = lsigned ? lbits : rbits;
    if (unsigned_bits == 64) {
        return DType::Float64;
    }
    return signed_of_bits(std::max(signed_bits, unsigned_bits * 2));
}

}  // namespace kestrel
