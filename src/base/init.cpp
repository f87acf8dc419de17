#include "base/init.hpp"
#include "common/logger.hpp"

namespace xferstat {
namespace {

logging::Level ToLoggerLevel(LoggingLevel level) {
    switch (level) {
    case LoggingLevel::NONE:
        return logging::Level::NONE;
    case LoggingLevel::ERROR:
        return logging::Level::ERROR;
    case LoggingLevel::WARNING:
        return logging::Level::WARNING;
    case LoggingLevel::INFO:
        return logging::Level::INFO;
    case LoggingLevel::DEBUG:
        return logging::Level::DEBUG;
    case LoggingLevel::VERBOSE:
        return logging::Level::VERBOSE;
    default:
        return logging::Level::NONE;
    }
}
    
} // namespace

void Init(LoggingLevel level) {
    logging::InitLogger(ToLoggerLevel(level));
}
    
} // namespace xferstat
