#ifndef _BASE_INIT_H_
#define _BASE_INIT_H_

#include "base/defines.hpp"

namespace xferstat {

// Log level
enum class LoggingLevel {
    NONE,
    ERROR,
    WARNING,
    INFO,
    DEBUG,
    VERBOSE
};

// Initializes the process-wide logger, must be called before any
// other xferstat API if log output is wanted.
void Init(LoggingLevel level = LoggingLevel::NONE);
    
} // namespace xferstat

#endif
