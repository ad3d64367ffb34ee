#pragma once

#include "flatarr_fwd.hpp"

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>



namespace FLATARR_NAME_NS {

	/// \brief Snaps each component down to the nearest lower multiple of `cellSize`.
	/// \throws InvalidCellSize if `cellSize` is not strictly positive.
	glm::vec2 quantizeToGrid(glm::vec2 v, float cellSize);
	glm::vec3 quantizeToGrid(glm::vec3 v, float cellSize);

	/// \brief Returns the coordinates of the grid cell that contains `v`.
	///
	///     mapToGridVec2({ 128.0f, 0.0f }, 64.0f) == glm::ivec2(2, 0)
	///
	glm::ivec2 mapToGridVec2(glm::vec2 v, float cellSize);

	/// \brief Returns the snapped position of `v`, truncated to integers.
	///
	/// Unlike `mapToGridVec2`, the result is *not* divided by `cellSize`:
	///
	///     mapToGridVec3({ 35.8277f, 7.987278f, 2.0993f }, 4.0f) == glm::ivec3(32, 4, 0)
	///
	glm::ivec3 mapToGridVec3(glm::vec3 v, float cellSize);

}
