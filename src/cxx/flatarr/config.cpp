#include "config.hpp"

#include "debug.inl.hpp"

#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>



namespace FLATARR_NAME_NS {

	namespace {

		std::string getenv(const char* nameCstr) {
			static std::mutex mtx;
			auto lock = std::unique_lock(mtx);
			const char* env = std::getenv(nameCstr);
			if(env == nullptr) return "";
			return std::string(env);
		}

	}


	spdlog::level::level_enum logLevelFromEnv(spdlog::logger& logger, spdlog::level::level_enum fallback) {
		auto str = getenv(FLATARR_LOG_LEVEL_ENVVAR);
		if(str.empty()) return fallback;

		// `from_str` maps every unknown name to `off`
		auto r = spdlog::level::from_str(str);
		if(r == spdlog::level::off && str != "off") {
			logger.error(FLATARR_LOG_LEVEL_ENVVAR " = \"{}\" is not a valid log level, using {}", str, spdlog::level::to_string_view(fallback));
			return fallback;
		}
		return r;
	}


	std::shared_ptr<spdlog::logger> createLogger() {
		auto logger = std::make_shared<spdlog::logger>(
			FLATARR_NAME_CSTR,
			std::make_shared<spdlog::sinks::stdout_color_sink_mt>(spdlog::color_mode::automatic) );
		logger->set_pattern("[%^" FLATARR_NAME_CSTR " %L%$] %v");
		logger->set_level(logLevelFromEnv(*logger));
		debug::setLogger(logger);
		return logger;
	}

}
