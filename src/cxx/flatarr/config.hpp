#pragma once

#include "flatarr_fwd.hpp"

#include <memory>

#include <spdlog/logger.h>



#define FLATARR_LOG_LEVEL_ENVVAR FLATARR_NAME_UC_CSTR "_LOG_LEVEL"



namespace FLATARR_NAME_NS {

	#ifdef NDEBUG
		constexpr auto default_log_level = spdlog::level::info;
	#else
		constexpr auto default_log_level = spdlog::level::debug;
	#endif


	/// \brief Reads the log level from the `FLATARR_LOG_LEVEL` environment variable.
	///
	/// Accepts the spdlog level names ("trace", "debug", "info", "warn",
	/// "error", "critical", "off"); an unset variable yields `fallback`,
	/// an invalid one is reported through `logger` and also yields `fallback`.
	///
	spdlog::level::level_enum logLevelFromEnv(spdlog::logger& logger, spdlog::level::level_enum fallback = default_log_level);

	/// \brief Creates a colored stdout logger named after the library,
	///        and installs it as the debug logger.
	std::shared_ptr<spdlog::logger> createLogger();

}
