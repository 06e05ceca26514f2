#ifndef MORK_READER_POSIX_FILE_H
#define MORK_READER_POSIX_FILE_H

#include <string>
#include "mork/status.h"

namespace Mork {

[[nodiscard]] auto read_whole_file(const std::string &path, std::string &out) -> Status;

} // namespace Mork

#endif // MORK_READER_POSIX_FILE_H
