#ifndef MORK_OPTIONS_H
#define MORK_OPTIONS_H

#include "slice.h"

namespace Mork {

static constexpr Size MINIMUM_LOG_MAX_SIZE {0xA000};
static constexpr Size DEFAULT_MAX_LOG_SIZE {0x100000};
static constexpr Size MAXIMUM_LOG_MAX_SIZE {0xA00000};
static constexpr Size MINIMUM_LOG_MAX_FILES {1};
static constexpr Size DEFAULT_MAX_LOG_FILES {4};
static constexpr Size MAXIMUM_LOG_MAX_FILES {32};

enum class LogLevel {
    TRACE,
    INFO,
    WARN,
    ERROR,
    OFF,
};

enum class LogTarget {
    FILE,
    STDOUT,
    STDERR,
    STDOUT_COLOR,
    STDERR_COLOR,
};

struct Options {
    // Log file used when log_target is LogTarget::FILE.
    Slice log_path {"mork.log"};
    Size max_log_size {DEFAULT_MAX_LOG_SIZE};
    Size max_log_files {DEFAULT_MAX_LOG_FILES};
    LogLevel log_level {LogLevel::OFF};
    LogTarget log_target {};

    // Decode backslash escapes, line continuations and "$XX" hex bytes in
    // literal values. If false, values are stored exactly as scanned.
    bool decode_literals {true};

    // Require the id of a group commit marker to match the id of the group
    // start marker.
    bool check_group_ids {true};
};

} // namespace Mork

#endif // MORK_OPTIONS_H
