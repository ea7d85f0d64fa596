#pragma once

/// Convenience umbrella header for the kestrel library.

#include <kestrel/core/chunked_array.hpp>
#include <kestrel/core/dispatch.hpp>
#include <kestrel/core/dtype.hpp>
#include <kestrel/core/error.hpp>
#include <kestrel/core/scalar.hpp>
#include <kestrel/core/time.hpp>
#include <kestrel/series/ops.hpp>
#include <kestrel/series/series.hpp>
