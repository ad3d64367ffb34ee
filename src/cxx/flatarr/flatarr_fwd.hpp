#pragma once

#include <cstddef>



#ifndef FLATARR_NAME_NS
	#define FLATARR_NAME_NS flatarr
#endif

#ifndef FLATARR_NAME_CSTR
	#define FLATARR_NAME_CSTR "flatarr"
#endif

#ifndef FLATARR_NAME_UC_CSTR
	#define FLATARR_NAME_UC_CSTR "FLATARR"
#endif



namespace FLATARR_NAME_NS {

	class GridError;
	class InvalidDimensions;
	class IndexOutOfBounds;
	class InvalidCellSize;

	struct Layout2d;
	struct Layout3d;

	template <typename T, typename Coord> struct Cell;
	template <typename T, typename Layout> class CellIterator;

}
