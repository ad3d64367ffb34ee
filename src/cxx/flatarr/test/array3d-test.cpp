#include "test_util.inl.hpp"

#include <flatarr/array3d.hpp>

#include <cstdint>
#include <utility>



namespace {

	using namespace flatarr_test;
	using fa::Array3d;


	void testConstruction() {
		auto grid = Array3d<uint64_t>(2, 3, 4);
		expect(grid.size() == 24, "size() is {}, expected 24", grid.size());
		expect(grid.depth() == 4, "depth() is {}", grid.depth());
		expect(! grid.empty(), "a constructed grid should never be empty");
		for(auto [pos, value] : std::as_const(grid)) {
			expect(value == 0, "({}, {}, {}) is {} after construction", pos.x, pos.y, pos.z, value);
		}

		expectThrow<fa::InvalidDimensions>("2x2x0 grid", []() { auto g = Array3d<int>(2, 2, 0); });
		expectThrow<fa::InvalidDimensions>("0x2x2 grid", []() { auto g = Array3d<int>(0, 2, 2); });
		expectThrow<fa::InvalidDimensions>("huge grid",  []() { auto g = Array3d<int>(SIZE_MAX / 2, 2, 2); });
	}


	void testGetSet() {
		auto grid = Array3d<size_t>(4, 4, 4);
		expect(grid.size() == 64, "size() is {}, expected 64", grid.size());

		auto pos = glm::ivec3(0, 0, 0);
		expect(grid.get(pos) == 0, "(0, 0, 0) is not default");
		grid.set(pos, 1);
		expect(grid.get(pos) == 1, "(0, 0, 0) should be 1, is {}", grid.get(pos));

		pos = glm::ivec3(3, 3, 3);
		expect(grid.get(pos) == 0, "(3, 3, 3) is not default");
		grid.set(pos, 64);
		expect(grid.get(pos) == 64, "(3, 3, 3) should be 64, is {}", grid.get(pos));
		expect(grid[63] == 64, "(3, 3, 3) should be the last slot");

		grid.getMut({ 1, 2, 3 }) = 9;
		expect(grid[(3 * 16) + (2 * 4) + 1] == 9, "getMut modified the wrong slot");
	}


	void testFlatIndex() {
		auto grid = Array3d<size_t>(2, 2, 2);
		for(size_t i = 0; i < grid.size(); ++i) {
			grid[i] = i;
			expect(grid[i] == i, "flat slot {} is {}", i, grid[i]);
		}
		expect(grid.get({ 1, 0, 0 }) == 1, "(1, 0, 0) should be at offset 1");
		expect(grid.get({ 0, 0, 1 }) == 4, "(0, 0, 1) should be at offset 4");
		expectThrow<fa::IndexOutOfBounds>("flat index == size", [&]() { (void) grid[8]; });
	}


	void testBounds() {
		auto grid = Array3d<int>(2, 3, 2);
		expectThrow<fa::IndexOutOfBounds>("z past the end", [&]() { (void) grid.get({ 0, 0, 2 }); });
		expectThrow<fa::IndexOutOfBounds>("set past the end", [&]() { grid.set({ 9, 9, 9 }, 1); });
		expectThrow<fa::IndexOutOfBounds>("negative z", [&]() { grid.getMut({ 1, 1, -1 }) = 1; });
		for(auto [pos, value] : grid) {
			expect(value == 0, "a rejected access modified ({}, {}, {})", pos.x, pos.y, pos.z);
		}
	}


	void testResize() {
		auto grid = Array3d<size_t>(2, 2, 2);
		expect(grid.size() == 8, "size() is {}, expected 8", grid.size());
		for(size_t i = 0; i < grid.size(); ++i) grid[i] = i + 1;

		grid.resize(3, 3, 3);
		expect(grid.size() == 27, "size() is {} after growing, expected 27", grid.size());
		for(size_t i = 0; i < 8; ++i)  expect(grid[i] == i + 1, "slot {} was not retained ({})", i, grid[i]);
		for(size_t i = 8; i < 27; ++i) expect(grid[i] == 0, "slot {} is not default after growing ({})", i, grid[i]);

		grid.resize(1, 1, 3);
		expect(grid.size() == 3, "size() is {} after shrinking, expected 3", grid.size());
		expect(grid[2] == 3, "shrinking did not retain the leading slots");

		expectThrow<fa::InvalidDimensions>("resize to 0 depth", [&]() { grid.resize(1, 1, 0); });
		expect(grid.size() == 3 && grid.depth() == 3, "a rejected resize modified the grid");
	}


	void testIteration() {
		auto grid = Array3d<int>(2, 3, 4);
		size_t count = 0;
		for(auto it = grid.begin(); it != grid.end(); ++it) {
			auto [pos, value] = *it;
			expect(it.offset() == count, "iteration skipped offset {}", count);
			expect(pos == fa::idx3d::fromIndexVec(2, 3, count),
				"offset {} yielded ({}, {}, {})", count, pos.x, pos.y, pos.z );
			value = int(count);
			++ count;
		}
		expect(count == grid.size(), "iteration yielded {} cells instead of {}", count, grid.size());

		for(int z = 0; z < 4; ++z)
		for(int y = 0; y < 3; ++y)
		for(int x = 0; x < 2; ++x) {
			auto expected = int(fa::idx3d::toIndex(2, 3, x, y, z));
			auto v = grid.get({ x, y, z });
			expect(v == expected, "({}, {}, {}) is {} after mutable iteration, expected {}", x, y, z, v, expected);
		}
	}


	void testMove() {
		auto grid = Array3d<int>(2, 2, 2);
		grid.set({ 1, 1, 1 }, 7);
		auto moved = std::move(grid);
		expect(moved.get({ 1, 1, 1 }) == 7, "moving the grid lost its data");

		expect(grid.size() == 0, "a moved-from grid has size() {}", grid.size());
		expectThrow<fa::IndexOutOfBounds>("flat access to a moved-from grid", [&]() { (void) grid[0]; });
		expectThrow<fa::IndexOutOfBounds>("get on a moved-from grid", [&]() { (void) grid.get({ 0, 0, 0 }); });
		size_t count = 0;
		for(auto cell : grid) { (void) cell; ++ count; }
		expect(count == 0, "a moved-from grid yielded {} cells", count);

		grid = std::move(moved);
		expect(grid.size() == 8 && grid[7] == 7, "move assignment lost the data");
		expect(moved.size() == 0, "a moved-from grid has size() {} after move assignment", moved.size());
	}

}



int main() {
	init();
	fa::debug::setLogger(spdlog::default_logger());
	testConstruction();
	testGetSet();
	testFlatIndex();
	testBounds();
	testResize();
	testIteration();
	testMove();
	return finish("array3d-test");
}
