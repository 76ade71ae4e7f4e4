#pragma once

#include <amc/smallvector.hpp>  // IWYU pragma: export
#include <amc/vector.hpp>       // IWYU pragma: export

namespace conneg {

using amc::SmallVector;
using amc::vector;

}  // namespace conneg
