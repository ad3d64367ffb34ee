#pragma once

#include "flatarr_fwd.hpp"

#include <cstddef>
#include <utility>
#include <tuple>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>



namespace FLATARR_NAME_NS {

	/// \brief Row-major mapping between 2D coordinates and linear offsets.
	///
	/// `index = width*x + y`: the *second* coordinate varies fastest.
	/// The caller guarantees `width > 0`; no bound is enforced on `x` or `y`,
	/// bound checking is up to the container.
	///
	///     auto i = idx2d::toIndex(2, 1, 1);         // 3
	///     auto [x, y] = idx2d::fromIndex(2, i);     // (1, 1)
	///
	namespace idx2d {

		constexpr size_t toIndex(size_t width, size_t x, size_t y) noexcept {
			return (width * x) + y;
		}

		constexpr std::pair<size_t, size_t> fromIndex(size_t width, size_t index) noexcept {
			return { index / width, index % width };
		}

		constexpr size_t toIndexVec(size_t width, glm::ivec2 v) noexcept {
			return toIndex(width, size_t(v.x), size_t(v.y));
		}

		constexpr glm::ivec2 fromIndexVec(size_t width, size_t index) noexcept {
			auto [x, y] = fromIndex(width, index);
			return glm::ivec2(int(x), int(y));
		}

	}


	/// \brief Mapping between 3D coordinates and linear offsets.
	///
	/// `index = z*maxX*maxY + y*maxX + x`: the *first* coordinate varies
	/// fastest, which is the opposite of `idx2d`.
	/// Data laid out by either formula depends on it, so the two are not unified.
	///
	namespace idx3d {

		constexpr size_t toIndex(size_t maxX, size_t maxY, size_t x, size_t y, size_t z) noexcept {
			return (z * maxX * maxY) + (y * maxX) + x;
		}

		constexpr std::tuple<size_t, size_t, size_t> fromIndex(size_t maxX, size_t maxY, size_t index) noexcept {
			size_t plane = maxX * maxY;
			size_t z     = index / plane;
			size_t rem   = index - (z * plane);
			return { rem % maxX, rem / maxX, z };
		}

		constexpr size_t toIndexVec(size_t maxX, size_t maxY, glm::ivec3 v) noexcept {
			return toIndex(maxX, maxY, size_t(v.x), size_t(v.y), size_t(v.z));
		}

		constexpr glm::ivec3 fromIndexVec(size_t maxX, size_t maxY, size_t index) noexcept {
			auto [x, y, z] = fromIndex(maxX, maxY, index);
			return glm::ivec3(int(x), int(y), int(z));
		}

	}

}
