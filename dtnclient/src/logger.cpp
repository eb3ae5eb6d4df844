#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace dtnclient {

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("dtnclient"));
	return logger;
}

log4cplus::Logger& codec_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("dtnclient.codec"));
	return logger;
}

log4cplus::Logger& transport_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("dtnclient.transport"));
	return logger;
}

log4cplus::Logger& client_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("dtnclient.client"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}
	return std::filesystem::current_path() / path;
}

void init_logging(const std::string& config_path) {
	if (!config_path.empty()) {
		std::error_code ec;
		auto resolved = resolve_config_path(config_path);
		if (std::filesystem::exists(resolved, ec)) {
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
		log4cplus::helpers::LogLog::getLogLog()->warn(
			LOG4CPLUS_TEXT("Logging config not found: ") + LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
	}

	log4cplus::BasicConfigurator fallback;
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

void enable_verbose_logging() {
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::DEBUG_LOG_LEVEL);
	// Named loggers may carry their own level from the config file.
	for (log4cplus::Logger* logger : {&core_logger(), &codec_logger(), &transport_logger(), &client_logger()}) {
		logger->setLogLevel(log4cplus::DEBUG_LOG_LEVEL);
	}
}

} // namespace dtnclient
