#include <stdexcept>
#include <vector>

#include "celldiff/cell_registry.hpp"
#include "test_support.hpp"

using namespace celldiff;

namespace {

static Cell make_cell(int x, int y, int z, float rate) {
    Cell c;
    c.position = VoxelCoord{x, y, z};
    c.production_rate = rate;
    return c;
}

// Every cell's voxel holds its index and every other voxel is empty.
static void requireOccupancyMatches(const CellRegistry& reg, const char* ctx) {
    const GridDimensions& dims = reg.dimensions();
    std::vector<int> expected(voxel_count(dims), EMPTY_VOXEL);
    for (std::size_t i = 0; i < reg.cells().size(); ++i) {
        expected[to_index(dims, reg.cells()[i].position)] = static_cast<int>(i);
    }
    REQUIRE(reg.occupancy().size() == expected.size(), ctx << ": occupancy size");
    for (std::size_t v = 0; v < expected.size(); ++v) {
        REQUIRE(reg.occupancy()[v] == expected[v], ctx << ": voxel " << v);
    }
}

static void runEmptyRegistryIsAllEmpty() {
    CellRegistry reg(GridDimensions{3, 4, 5});
    REQUIRE(reg.empty(), "new registry has no cells");
    REQUIRE(reg.occupancy().size() == 60, "occupancy covers the grid");
    for (int v : reg.occupancy()) {
        REQUIRE(v == EMPTY_VOXEL, "all voxels empty");
    }
    REQUIRE(reg.flatten().empty(), "no records");
    std::cout << "[PASS] empty registry\n";
}

static void runSetAndAddRebuildOccupancy() {
    CellRegistry reg(GridDimensions{4, 4, 4});
    reg.set_cells({make_cell(1, 1, 1, 6.0f), make_cell(3, 0, 2, 2.0f)});
    requireOccupancyMatches(reg, "set_cells");
    REQUIRE(reg.occupant(VoxelCoord{1, 1, 1}) == 0, "first cell index");
    REQUIRE(reg.occupant(VoxelCoord{3, 0, 2}) == 1, "second cell index");

    reg.add_cells({make_cell(0, 3, 3, 1.0f)});
    REQUIRE(reg.size() == 3, "add appends");
    requireOccupancyMatches(reg, "add_cells");
    REQUIRE(reg.occupant(VoxelCoord{0, 3, 3}) == 2, "appended cell takes the next index");

    // Replacing drops the old stamps entirely.
    reg.set_cells({make_cell(2, 2, 2, 1.0f)});
    requireOccupancyMatches(reg, "set_cells replace");
    REQUIRE(!reg.is_occupied(VoxelCoord{1, 1, 1}), "old position cleared");
    std::cout << "[PASS] set_cells/add_cells rebuild occupancy\n";
}

static void runRemoveAndMoveLeaveNoStaleEntries() {
    CellRegistry reg(GridDimensions{5, 5, 5});
    reg.set_cells({make_cell(0, 0, 0, 1.0f), make_cell(1, 0, 0, 2.0f), make_cell(2, 0, 0, 3.0f)});

    reg.remove_cell(0);
    requireOccupancyMatches(reg, "remove_cell");
    REQUIRE(!reg.is_occupied(VoxelCoord{0, 0, 0}), "removed cell's voxel is empty");
    REQUIRE(reg.occupant(VoxelCoord{1, 0, 0}) == 0, "later cells shift down");
    REQUIRE(reg.occupant(VoxelCoord{2, 0, 0}) == 1, "later cells shift down");

    reg.move_cell(1, VoxelCoord{4, 4, 4});
    requireOccupancyMatches(reg, "move_cell");
    REQUIRE(!reg.is_occupied(VoxelCoord{2, 0, 0}), "old voxel cleared after move");
    REQUIRE(reg.occupant(VoxelCoord{4, 4, 4}) == 1, "new voxel stamped after move");

    REQUIRE_THROWS(reg.remove_cell(7), std::out_of_range, "remove out of range");
    REQUIRE_THROWS((reg.move_cell(2, VoxelCoord{0, 0, 0})), std::out_of_range, "move out of range");

    reg.clear();
    REQUIRE(reg.empty(), "clear empties");
    requireOccupancyMatches(reg, "clear");
    std::cout << "[PASS] remove/move/clear leave no stale entries\n";
}

static void runFlattenKeepsRegistryOrder() {
    CellRegistry reg(GridDimensions{4, 4, 4});
    reg.set_cells({make_cell(3, 2, 1, 5.0f), make_cell(0, 1, 2, 0.5f)});
    const std::vector<CellRecord> records = reg.flatten();
    REQUIRE(records.size() == 2, "one record per cell");
    REQUIRE(records[0].x == 3 && records[0].y == 2 && records[0].z == 1, "record 0 position");
    REQUIRE(records[0].production_rate == 5.0f, "record 0 rate");
    REQUIRE(records[1].x == 0 && records[1].y == 1 && records[1].z == 2, "record 1 position");
    REQUIRE(records[1].production_rate == 0.5f, "record 1 rate");

    for (std::size_t i = 0; i < records.size(); ++i) {
        const int occ = reg.occupancy()[to_index(reg.dimensions(), records[i].x, records[i].y, records[i].z)];
        REQUIRE(occ == static_cast<int>(i), "occupancy value references the record index");
    }
    std::cout << "[PASS] flatten order matches occupancy values\n";
}

static void runPreconditionViolationsStayInsideTheMap() {
    CellRegistry reg(GridDimensions{3, 3, 3});
    // Out-of-range cell: kept in the list, never stamped.
    reg.set_cells({make_cell(5, 0, 0, 1.0f), make_cell(1, 1, 1, 1.0f)});
    REQUIRE(reg.size() == 2, "out-of-range cell kept");
    REQUIRE(reg.occupant(VoxelCoord{1, 1, 1}) == 1, "in-range cell stamped");
    int stamped = 0;
    for (int v : reg.occupancy()) {
        if (v != EMPTY_VOXEL) ++stamped;
    }
    REQUIRE(stamped == 1, "only the in-range cell is stamped");
    REQUIRE(reg.occupant(VoxelCoord{5, 0, 0}) == EMPTY_VOXEL, "lookup outside the grid is empty");

    // Overlap: the later cell wins the voxel.
    reg.set_cells({make_cell(2, 2, 2, 1.0f), make_cell(2, 2, 2, 4.0f)});
    REQUIRE(reg.occupant(VoxelCoord{2, 2, 2}) == 1, "later overlapping cell wins");
    std::cout << "[PASS] precondition violations never write outside the map\n";
}

static void runIntersectionCheck() {
    const std::vector<Cell> cells = {make_cell(1, 2, 3, 1.0f), make_cell(0, 0, 0, 1.0f)};
    REQUIRE(check_intersection(cells, VoxelCoord{1, 2, 3}), "taken voxel");
    REQUIRE(!check_intersection(cells, VoxelCoord{3, 2, 1}), "free voxel");
    REQUIRE(!check_intersection({}, VoxelCoord{0, 0, 0}), "no cells");

    const std::vector<int> occ = build_occupancy_map(GridDimensions{2, 2, 2}, {make_cell(1, 1, 1, 1.0f)});
    REQUIRE(occ.size() == 8 && occ[7] == 0 && occ[0] == EMPTY_VOXEL, "free-standing occupancy builder");
    std::cout << "[PASS] intersection check\n";
}

static void runInvalidDimensionsRejected() {
    REQUIRE_THROWS((CellRegistry(GridDimensions{0, 2, 2})), std::invalid_argument, "zero dimension");
    std::cout << "[PASS] registry rejects invalid dimensions\n";
}

} // namespace

int main() {
    runEmptyRegistryIsAllEmpty();
    runSetAndAddRebuildOccupancy();
    runRemoveAndMoveLeaveNoStaleEntries();
    runFlattenKeepsRegistryOrder();
    runPreconditionViolationsStayInsideTheMap();
    runIntersectionCheck();
    runInvalidDimensionsRejected();
    return 0;
}
