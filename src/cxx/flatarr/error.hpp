#pragma once

#include "flatarr_fwd.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>
#include <initializer_list>



namespace FLATARR_NAME_NS {

	/// Base of every error thrown by the containers and the grid helpers;
	/// all of them signal a violated precondition.
	class GridError : public std::logic_error {
	public:
		using std::logic_error::logic_error;
	};


	class InvalidDimensions : public GridError {
	public:
		InvalidDimensions(std::initializer_list<size_t> extents);

		const auto& extents() const noexcept { return id_extents; }

	private:
		std::vector<size_t> id_extents;
	};


	class IndexOutOfBounds : public GridError {
	public:
		static constexpr size_t noOffset = SIZE_MAX;

		IndexOutOfBounds(size_t offset, size_t length);
		IndexOutOfBounds(std::initializer_list<int> coordinates, size_t length);

		size_t offset() const noexcept { return ioob_offset; }
		size_t length() const noexcept { return ioob_length; }

	private:
		size_t ioob_offset;
		size_t ioob_length;
	};


	class InvalidCellSize : public GridError {
	public:
		InvalidCellSize(float cellSize);

		float cellSize() const noexcept { return ics_cellSize; }

	private:
		float ics_cellSize;
	};


	/// \brief Returns the product of the given extents.
	/// \throws InvalidDimensions if any extent is 0, or if the product does not fit a `size_t`.
	size_t checkedSlotCount(std::initializer_list<size_t> extents);

	/// \brief Returns `offset` if it addresses one of `length` slots.
	/// \throws IndexOutOfBounds otherwise.
	size_t checkedOffset(size_t offset, size_t length);

	[[noreturn]] void throwCoordinatesOutOfBounds(std::initializer_list<int> coordinates, size_t length);

}
