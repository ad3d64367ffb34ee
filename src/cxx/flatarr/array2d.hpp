#pragma once

#include "flatarr_fwd.hpp"
#include "index_map.hpp"
#include "cell_iterator.inl.hpp"
#include "error.hpp"
#include "debug.inl.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <memory>
#include <utility>

#include <glm/vec2.hpp>



namespace FLATARR_NAME_NS {

	/// \brief A dense `width * height` grid, stored in one contiguous buffer.
	///
	/// \tparam T The element type; new slots are value-initialized.
	///
	/// Coordinates are mapped to offsets by `idx2d`, so `(x, y)` lives at
	/// `width*x + y`. A coordinate is valid if its offset is lower than
	/// `size()`; negative components are always rejected.
	///
	/// Every violated precondition throws a `GridError`, and leaves the
	/// grid unchanged.
	///
	template <std::default_initializable T>
	class Array2d {
	public:
		using value_type     = T;
		using coord_type     = glm::ivec2;
		using iterator       = CellIterator<T, Layout2d>;
		using const_iterator = CellIterator<const T, Layout2d>;

		Array2d(size_t width, size_t height):
			a2_data(std::make_unique<T[]>(checkedSlotCount({ width, height }))),
			a2_width(width),
			a2_height(height)
		{
			debug::allocatedGrid(std::array { width, height }, size());
		}

		// A moved-from grid has no slots: every access throws, iteration yields nothing.
		Array2d(Array2d&& mv) noexcept:
			a2_data(std::move(mv.a2_data)),
			a2_width(std::exchange(mv.a2_width, 0)),
			a2_height(std::exchange(mv.a2_height, 0))
		{ }

		Array2d& operator=(Array2d&& mv) noexcept {
			if(this == &mv) return *this;
			a2_data = std::move(mv.a2_data);
			a2_width = std::exchange(mv.a2_width, 0);
			a2_height = std::exchange(mv.a2_height, 0);
			return *this;
		}

		const T& get(coord_type v) const { return a2_data[a2_offsetOf(v)]; }
		T&    getMut(coord_type v)       { return a2_data[a2_offsetOf(v)]; }

		void set(coord_type v, T value) {
			a2_data[a2_offsetOf(v)] = std::move(value);
		}

		/// \brief Changes the extents of the grid.
		///
		/// Slots keep their raw offset, not their coordinates: the first
		/// `min(size(), width*height)` slots are carried over as they are,
		/// and any slot past them is value-initialized.
		///
		/// Slots are copied rather than moved when moving a `T` may throw,
		/// so a throwing copy leaves the grid as it was; a move-only `T`
		/// with a throwing move only gets the basic guarantee.
		///
		void resize(size_t width, size_t height) {
			size_t newSize = checkedSlotCount({ width, height });
			size_t keep    = std::min(size(), newSize);
			auto   newData = std::make_unique<T[]>(newSize);
			for(size_t i = 0; i < keep; ++i) newData[i] = std::move_if_noexcept(a2_data[i]);
			debug::resizedGrid(std::array { a2_width, a2_height }, std::array { width, height }, keep);
			a2_data   = std::move(newData);
			a2_width  = width;
			a2_height = height;
		}

		size_t size() const noexcept { return a2_width * a2_height; }

		// Extents are never 0 outside of a moved-from grid, and that one
		// is only good for assignment or `resize`.
		constexpr bool empty() const noexcept { return false; }

		size_t width()  const noexcept { return a2_width; }
		size_t height() const noexcept { return a2_height; }

		T&       operator[](size_t index)       { return a2_data[checkedOffset(index, size())]; }
		const T& operator[](size_t index) const { return a2_data[checkedOffset(index, size())]; }

		iterator       begin()        noexcept { return iterator(a2_data.get(), 0, a2_layout()); }
		iterator       end()          noexcept { return iterator(a2_data.get(), size(), a2_layout()); }
		const_iterator begin()  const noexcept { return const_iterator(a2_data.get(), 0, a2_layout()); }
		const_iterator end()    const noexcept { return const_iterator(a2_data.get(), size(), a2_layout()); }
		const_iterator cbegin() const noexcept { return begin(); }
		const_iterator cend()   const noexcept { return end(); }

	private:
		std::unique_ptr<T[]> a2_data;
		size_t a2_width;
		size_t a2_height;

		Layout2d a2_layout() const noexcept { return Layout2d { a2_width }; }

		size_t a2_offsetOf(coord_type v) const {
			if(v.x < 0 || v.y < 0) [[unlikely]] throwCoordinatesOutOfBounds({ v.x, v.y }, size());
			return checkedOffset(idx2d::toIndexVec(a2_width, v), size());
		}
	};

}
