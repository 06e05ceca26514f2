#ifndef MORK_UTILS_RESULT_H
#define MORK_UTILS_RESULT_H

#include <tl/expected.hpp>
#include "mork/status.h"

namespace Mork {

template<class T>
using Result = tl::expected<T, Status>;
using Err = tl::unexpected<Status>;

} // namespace Mork

#endif // MORK_UTILS_RESULT_H
