#include <kestrel/core/dispatch.hpp>

#include <fmt/format.h>

namespace kestrel {

auto make_empty_array(DType dtype) -> AnyArray {
    return visit_dtype(dtype, []<typename T>(std::type_identity<T>) -> AnyArray {
        return ChunkedArray<T>{};
    });
}

auto unsupported(Op op, DType dtype) -> std::unexpected<Error> {
    return make_error(ErrorKind::UnsupportedTypeCombination,
                      fmt::format("operation '{}' not implemented for dtype '{}'", op_name(op),
                                  dtype_code(dtype)));
}

}  // namespace kestrel
