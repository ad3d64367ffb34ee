#pragma once

#include "flatarr_fwd.hpp"
#include "index_map.hpp"

#include <cstddef>
#include <iterator>



namespace FLATARR_NAME_NS {

	struct Layout2d {
		using coord_type = glm::ivec2;
		size_t width;

		constexpr coord_type coordsOf(size_t index) const noexcept { return idx2d::fromIndexVec(width, index); }
	};


	struct Layout3d {
		using coord_type = glm::ivec3;
		size_t width;
		size_t height;

		constexpr coord_type coordsOf(size_t index) const noexcept { return idx3d::fromIndexVec(width, height, index); }
	};


	/// \brief A slot of a grid, paired with the coordinates it maps to.
	///
	/// `value` refers to the slot itself, so it can be modified through
	/// structured bindings:
	///
	///     for(auto [pos, value] : grid) value = pos.x;
	///
	template <typename T, typename Coord>
	struct Cell {
		Coord position;
		T&    value;
	};


	/// \brief Forward iterator over the slots of a grid, in raw offset order.
	///
	/// The iterator only holds the base address of the buffer and the
	/// offset of the current slot; every dereference addresses exactly one
	/// slot and derives its coordinates from the offset alone.
	/// Any operation that reallocates the grid invalidates it.
	///
	template <typename T, typename Layout>
	class CellIterator {
	public:
		using coord_type       = typename Layout::coord_type;
		using value_type       = Cell<T, coord_type>;
		using reference        = value_type;
		using difference_type  = ptrdiff_t;
		using iterator_concept = std::forward_iterator_tag;

		constexpr CellIterator() noexcept: ci_base(nullptr), ci_cursor(0), ci_layout { } { }

		constexpr CellIterator(T* base, size_t cursor, Layout layout) noexcept:
			ci_base(base),
			ci_cursor(cursor),
			ci_layout(layout)
		{ }

		constexpr value_type operator*() const noexcept {
			return value_type { ci_layout.coordsOf(ci_cursor), ci_base[ci_cursor] };
		}

		constexpr CellIterator& operator++() noexcept { ++ ci_cursor; return *this; }
		constexpr CellIterator  operator++(int) noexcept { auto r = *this; ++ ci_cursor; return r; }

		constexpr bool operator==(const CellIterator& r) const noexcept {
			return (ci_base == r.ci_base) && (ci_cursor == r.ci_cursor);
		}

		constexpr size_t offset() const noexcept { return ci_cursor; }

	private:
		T*     ci_base;
		size_t ci_cursor;
		Layout ci_layout;
	};

}
