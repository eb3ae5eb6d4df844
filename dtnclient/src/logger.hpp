#pragma once

#include <string>
#include <log4cplus/logger.h>

namespace dtnclient {

log4cplus::Logger& core_logger();
log4cplus::Logger& codec_logger();
log4cplus::Logger& transport_logger();
log4cplus::Logger& client_logger();

/// Loads a log4cplus properties file; falls back to a console appender at INFO.
void init_logging(const std::string& config_path);

/// Raises the root logger and every dtnclient logger to DEBUG.
void enable_verbose_logging();

} // namespace dtnclient
