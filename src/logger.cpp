#include "logger.hpp"

#include <filesystem>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("taskbridge"));
	return logger;
}

log4cplus::Logger& rpc_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("taskbridge.rpc"));
	return logger;
}

log4cplus::Logger& supervisor_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("taskbridge.supervisor"));
	return logger;
}

log4cplus::Logger& process_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("taskbridge.process"));
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
	try {
		auto resolved = resolve_config_path(config_path);
		if (std::filesystem::exists(resolved)) {
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
		    LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	// stdout carries protocol frames, so the fallback appender must log to stderr.
	log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}
