#pragma once

#include "flatarr_fwd.hpp"

#ifndef NDEBUG
	#include <memory>
	#include <initializer_list>
	#include <fmt/format.h>
	#include <fmt/ranges.h>
	#include <spdlog/logger.h>
#endif



namespace FLATARR_NAME_NS::debug {

	#ifndef NDEBUG
		inline std::shared_ptr<spdlog::logger> logger;
	#endif


	template <typename Logger>
	inline void setLogger(const Logger& l) {
		(void) l;
		#ifndef NDEBUG
			logger = l;
		#endif
	}


	template <typename Extents>
	inline void allocatedGrid(const Extents& extents, size_t slots) {
		(void) extents; (void) slots;
		#ifndef NDEBUG
			if(! logger) return;
			logger->trace("Allocated grid {} ({} slots)", fmt::join(extents, "x"), slots);
		#endif
	}

	template <typename Extents>
	inline void resizedGrid(const Extents& from, const Extents& to, size_t keptSlots) {
		(void) from; (void) to; (void) keptSlots;
		#ifndef NDEBUG
			if(! logger) return;
			logger->debug("Resized grid {} -> {}, {} slots kept", fmt::join(from, "x"), fmt::join(to, "x"), keptSlots);
		#endif
	}

	template <typename Error>
	inline void rejectedAccess(const Error& err) {
		(void) err;
		#ifndef NDEBUG
			if(! logger) return;
			logger->debug("Rejected: {}", err.what());
		#endif
	}

}
