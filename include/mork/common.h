#ifndef MORK_COMMON_H
#define MORK_COMMON_H

#include <cstdint>

namespace Mork {

// Common types.
using Byte = char;
using Size = std::uint64_t;

} // namespace Mork

#endif // MORK_COMMON_H
