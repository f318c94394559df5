#ifndef _AVCPARSE_COMMON_LOGGER_H_
#define _AVCPARSE_COMMON_LOGGER_H_

#include "avcparse/base/defines.hpp"

#include <plog/Log.h>

#include <functional>
#include <string>

namespace avcparse {
namespace logging {

enum class Level { // Values match plog::Severity
    NONE = 0,
    FATAL = 1,
    ERROR = 2,
    WARNING = 3,
    INFO = 4,
    DEBUG = 5,
    VERBOSE = 6
};

// Returns false to let the message fall through to stdout.
using LoggingCallback = std::function<bool(Level level, std::string message)>;

// Parse errors are logged at WARNING, parameter set updates at DEBUG and
// access unit boundaries at VERBOSE.
AVCPARSE_CPP_EXPORT void InitLogger(Level level, LoggingCallback callback = nullptr);
AVCPARSE_CPP_EXPORT void InitLogger(plog::Severity severity, plog::IAppender* appender = nullptr);

} // namespace logging
} // namespace avcparse

#endif
