#include "grid_snap.hpp"

#include "error.hpp"
#include "debug.inl.hpp"

#include <cmath>
#include <limits>



namespace FLATARR_NAME_NS {

	namespace {

		float checkedCellSize(float cellSize) {
			if(! (cellSize > 0.0f)) [[unlikely]] {
				auto err = InvalidCellSize(cellSize);
				debug::rejectedAccess(err);
				throw err;
			}
			return cellSize;
		}

		float snap(float x, float cellSize) {
			return std::floor(x / cellSize) * cellSize;
		}

		// Saturates out-of-range values; NaN maps to 0.
		int toGridCoord(float x) {
			using limits = std::numeric_limits<int>;
			constexpr float upper = -float(limits::min()); // 2^31, exact
			if(std::isnan(x)) [[unlikely]] return 0;
			if(x >= upper)    [[unlikely]] return limits::max();
			if(x < -upper)    [[unlikely]] return limits::min();
			return int(x);
		}

	}


	glm::vec2 quantizeToGrid(glm::vec2 v, float cellSize) {
		checkedCellSize(cellSize);
		return glm::vec2(snap(v.x, cellSize), snap(v.y, cellSize));
	}


	glm::vec3 quantizeToGrid(glm::vec3 v, float cellSize) {
		checkedCellSize(cellSize);
		return glm::vec3(snap(v.x, cellSize), snap(v.y, cellSize), snap(v.z, cellSize));
	}


	glm::ivec2 mapToGridVec2(glm::vec2 v, float cellSize) {
		auto q = quantizeToGrid(v, cellSize);
		return glm::ivec2(toGridCoord(q.x / cellSize), toGridCoord(q.y / cellSize));
	}


	glm::ivec3 mapToGridVec3(glm::vec3 v, float cellSize) {
		auto q = quantizeToGrid(v, cellSize);
		return glm::ivec3(toGridCoord(q.x), toGridCoord(q.y), toGridCoord(q.z));
	}

}
