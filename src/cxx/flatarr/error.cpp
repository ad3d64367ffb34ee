#include "error.hpp"

#include "debug.inl.hpp"

#include <limits>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>



namespace FLATARR_NAME_NS {

	InvalidDimensions::InvalidDimensions(std::initializer_list<size_t> extents):
			GridError(fmt::format("invalid grid extents {}", fmt::join(extents, "x"))),
			id_extents(extents)
	{ }


	IndexOutOfBounds::IndexOutOfBounds(size_t offset, size_t length):
			GridError(fmt::format("offset {} is out of bounds (length {})", offset, length)),
			ioob_offset(offset),
			ioob_length(length)
	{ }

	IndexOutOfBounds::IndexOutOfBounds(std::initializer_list<int> coordinates, size_t length):
			GridError(fmt::format("coordinates ({}) are out of bounds (length {})", fmt::join(coordinates, ", "), length)),
			ioob_offset(noOffset),
			ioob_length(length)
	{ }


	InvalidCellSize::InvalidCellSize(float cellSize):
			GridError(fmt::format("invalid grid cell size {}", cellSize)),
			ics_cellSize(cellSize)
	{ }


	size_t checkedSlotCount(std::initializer_list<size_t> extents) {
		size_t r = 1;
		for(size_t ext : extents) {
			if(ext == 0 || r > std::numeric_limits<size_t>::max() / ext) [[unlikely]] {
				auto err = InvalidDimensions(extents);
				debug::rejectedAccess(err);
				throw err;
			}
			r *= ext;
		}
		return r;
	}


	size_t checkedOffset(size_t offset, size_t length) {
		if(offset >= length) [[unlikely]] {
			auto err = IndexOutOfBounds(offset, length);
			debug::rejectedAccess(err);
			throw err;
		}
		return offset;
	}


	void throwCoordinatesOutOfBounds(std::initializer_list<int> coordinates, size_t length) {
		auto err = IndexOutOfBounds(coordinates, length);
		debug::rejectedAccess(err);
		throw err;
	}

}
