#include "logger.hpp"

#include <filesystem>
#include <memory>

#include <log4cplus/configurator.h>
#include <log4cplus/consoleappender.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/layout.h>

namespace fsagent {

log4cplus::Logger& agent_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("fsagent"));
	return logger;
}

log4cplus::Logger& fs_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("fsagent.fs"));
	return logger;
}

log4cplus::Logger& process_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("fsagent.process"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	return std::filesystem::current_path() / path;
}

// stdout carries the protocol, so every appender we install writes to stderr.
void init_logging(const std::string& config_path) {
	try {
		auto resolved = resolve_config_path(config_path);
		if (!config_path.empty() && std::filesystem::exists(resolved)) {
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	log4cplus::SharedAppenderPtr appender(new log4cplus::ConsoleAppender(true, true));
	appender->setLayout(std::make_unique<log4cplus::PatternLayout>(
		LOG4CPLUS_TEXT("%D{%Y-%m-%d %H:%M:%S.%q} %-5p [%c] %m%n")));
	log4cplus::Logger root = log4cplus::Logger::getRoot();
	root.removeAllAppenders();
	root.addAppender(appender);
	root.setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

} // namespace fsagent
