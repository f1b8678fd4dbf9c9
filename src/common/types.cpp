#include "common/types.h"

namespace autoscale {
namespace common {

// Explicit instantiations for the Result types used across the library
template class Result<bool>;
template class Result<std::string>;
template class Result<int>;

} // namespace common
} // namespace autoscale
