#pragma once

#include <cstddef>
#include <vector>

#include "celldiff/grid.hpp"

namespace celldiff {

// Occupancy value of a voxel that holds no cell.
constexpr int EMPTY_VOXEL = -1;

// A biological cell: a point source of the diffusing substance and an impermeable obstacle.
struct Cell {
    VoxelCoord position;
    float production_rate = 0.0f; // amount produced per unit time, >= 0
};

// Dense per-cell record consumed by the stepper. Record i is the cell with occupancy value i.
struct CellRecord {
    int x = 0;
    int y = 0;
    int z = 0;
    float production_rate = 0.0f;
};

// Owns the ordered cell set of one grid and the occupancy map derived from it.
// Every mutation rebuilds the occupancy map in full (clear, then stamp), so no stale
// entries survive a removal or a move.
//
// Two cells on the same voxel is a caller precondition violation and is not checked by
// set_cells/add_cells: the later cell wins the voxel. Use is_occupied() before inserting.
// Cells outside the grid are kept in the list but never stamped.
class CellRegistry {
public:
    explicit CellRegistry(const GridDimensions& dims);
    CellRegistry(const GridDimensions& dims, std::vector<Cell> cells);

    void set_cells(std::vector<Cell> cells);
    void add_cells(const std::vector<Cell>& cells);
    void remove_cell(std::size_t index);        // throws std::out_of_range
    void move_cell(std::size_t index, const VoxelCoord& position); // throws std::out_of_range
    void clear();

    bool is_occupied(const VoxelCoord& position) const;
    int occupant(const VoxelCoord& position) const; // EMPTY_VOXEL when free or outside

    std::vector<CellRecord> flatten() const;

    const std::vector<Cell>& cells() const { return cells_; }
    const std::vector<int>& occupancy() const { return occupancy_; }
    const GridDimensions& dimensions() const { return dims_; }
    std::size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }

private:
    void rebuild_occupancy();

    GridDimensions dims_;
    std::vector<Cell> cells_;
    std::vector<int> occupancy_;
};

// Linear scan used by placement code to reject a position that is already taken.
bool check_intersection(const std::vector<Cell>& cells, const VoxelCoord& position);

// Occupancy map for an arbitrary cell list, built the same way the registry builds its own.
std::vector<int> build_occupancy_map(const GridDimensions& dims, const std::vector<Cell>& cells);

} // namespace celldiff
