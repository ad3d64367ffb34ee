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

#include <glm/vec3.hpp>



namespace FLATARR_NAME_NS {

	/// \brief A dense `width * height * depth` grid, stored in one contiguous buffer.
	///
	/// Same contract as `Array2d`, with coordinates mapped by `idx3d`:
	/// `(x, y, z)` lives at `z*width*height + y*width + x`.
	///
	template <std::default_initializable T>
	class Array3d {
	public:
		using value_type     = T;
		using coord_type     = glm::ivec3;
		using iterator       = CellIterator<T, Layout3d>;
		using const_iterator = CellIterator<const T, Layout3d>;

		Array3d(size_t width, size_t height, size_t depth):
			a3_data(std::make_unique<T[]>(checkedSlotCount({ width, height, depth }))),
			a3_width(width),
			a3_height(height),
			a3_depth(depth)
		{
			debug::allocatedGrid(std::array { width, height, depth }, size());
		}

		// A moved-from grid has no slots: every access throws, iteration yields nothing.
		Array3d(Array3d&& mv) noexcept:
			a3_data(std::move(mv.a3_data)),
			a3_width(std::exchange(mv.a3_width, 0)),
			a3_height(std::exchange(mv.a3_height, 0)),
			a3_depth(std::exchange(mv.a3_depth, 0))
		{ }

		Array3d& operator=(Array3d&& mv) noexcept {
			if(this == &mv) return *this;
			a3_data = std::move(mv.a3_data);
			a3_width = std::exchange(mv.a3_width, 0);
			a3_height = std::exchange(mv.a3_height, 0);
			a3_depth = std::exchange(mv.a3_depth, 0);
			return *this;
		}

		const T& get(coord_type v) const { return a3_data[a3_offsetOf(v)]; }
		T&    getMut(coord_type v)       { return a3_data[a3_offsetOf(v)]; }

		void set(coord_type v, T value) {
			a3_data[a3_offsetOf(v)] = std::move(value);
		}

		/// Same as `Array2d::resize`: slots keep their raw offset.
		void resize(size_t width, size_t height, size_t depth) {
			size_t newSize = checkedSlotCount({ width, height, depth });
			size_t keep    = std::min(size(), newSize);
			auto   newData = std::make_unique<T[]>(newSize);
			for(size_t i = 0; i < keep; ++i) newData[i] = std::move_if_noexcept(a3_data[i]);
			debug::resizedGrid(std::array { a3_width, a3_height, a3_depth }, std::array { width, height, depth }, keep);
			a3_data   = std::move(newData);
			a3_width  = width;
			a3_height = height;
			a3_depth  = depth;
		}

		size_t size() const noexcept { return a3_width * a3_height * a3_depth; }
		constexpr bool empty() const noexcept { return false; }

		size_t width()  const noexcept { return a3_width; }
		size_t height() const noexcept { return a3_height; }
		size_t depth()  const noexcept { return a3_depth; }

		T&       operator[](size_t index)       { return a3_data[checkedOffset(index, size())]; }
		const T& operator[](size_t index) const { return a3_data[checkedOffset(index, size())]; }

		iterator       begin()        noexcept { return iterator(a3_data.get(), 0, a3_layout()); }
		iterator       end()          noexcept { return iterator(a3_data.get(), size(), a3_layout()); }
		const_iterator begin()  const noexcept { return const_iterator(a3_data.get(), 0, a3_layout()); }
		const_iterator end()    const noexcept { return const_iterator(a3_data.get(), size(), a3_layout()); }
		const_iterator cbegin() const noexcept { return begin(); }
		const_iterator cend()   const noexcept { return end(); }

	private:
		std::unique_ptr<T[]> a3_data;
		size_t a3_width;
		size_t a3_height;
		size_t a3_depth;

		Layout3d a3_layout() const noexcept { return Layout3d { a3_width, a3_height }; }

		size_t a3_offsetOf(coord_type v) const {
			if(v.x < 0 || v.y < 0 || v.z < 0) [[unlikely]] throwCoordinatesOutOfBounds({ v.x, v.y, v.z }, size());
			return checkedOffset(idx3d::toIndexVec(a3_width, a3_height, v), size());
		}
	};

}
