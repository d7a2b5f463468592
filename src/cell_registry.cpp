#include "celldiff/cell_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace celldiff {

std::vector<int> build_occupancy_map(const GridDimensions& dims, const std::vector<Cell>& cells) {
    std::vector<int> occupancy(voxel_count(dims), EMPTY_VOXEL); // clear
    for (std::size_t i = 0; i < cells.size(); ++i) {           // stamp
        const VoxelCoord& p = cells[i].position;
        if (!contains(dims, p)) {
            continue;
        }
        occupancy[to_index(dims, p)] = static_cast<int>(i);
    }
    return occupancy;
}

bool check_intersection(const std::vector<Cell>& cells, const VoxelCoord& position) {
    return std::any_of(cells.begin(), cells.end(),
                       [&](const Cell& c) { return c.position == position; });
}

CellRegistry::CellRegistry(const GridDimensions& dims) : CellRegistry(dims, {}) {}

CellRegistry::CellRegistry(const GridDimensions& dims, std::vector<Cell> cells)
    : dims_(dims), cells_(std::move(cells)) {
    validate_dimensions(dims_);
    rebuild_occupancy();
}

void CellRegistry::set_cells(std::vector<Cell> cells) {
    cells_ = std::move(cells);
    rebuild_occupancy();
}

void CellRegistry::add_cells(const std::vector<Cell>& cells) {
    cells_.insert(cells_.end(), cells.begin(), cells.end());
    rebuild_occupancy();
}

void CellRegistry::remove_cell(std::size_t index) {
    if (index >= cells_.size()) {
        throw std::out_of_range("remove_cell: index " + std::to_string(index) + " out of range (" +
                                std::to_string(cells_.size()) + " cells)");
    }
    // Later cells shift down by one, so every occupancy value after `index` changes.
    cells_.erase(cells_.begin() + static_cast<std::ptrdiff_t>(index));
    rebuild_occupancy();
}

void CellRegistry::move_cell(std::size_t index, const VoxelCoord& position) {
    if (index >= cells_.size()) {
        throw std::out_of_range("move_cell: index " + std::to_string(index) + " out of range (" +
                                std::to_string(cells_.size()) + " cells)");
    }
    cells_[index].position = position;
    rebuild_occupancy();
}

void CellRegistry::clear() {
    cells_.clear();
    rebuild_occupancy();
}

bool CellRegistry::is_occupied(const VoxelCoord& position) const {
    return occupant(position) != EMPTY_VOXEL;
}

int CellRegistry::occupant(const VoxelCoord& position) const {
    if (!contains(dims_, position)) {
        return EMPTY_VOXEL;
    }
    return occupancy_[to_index(dims_, position)];
}

std::vector<CellRecord> CellRegistry::flatten() const {
    std::vector<CellRecord> records;
    records.reserve(cells_.size());
    for (const Cell& c : cells_) {
        records.push_back(CellRecord{c.position.x, c.position.y, c.position.z, c.production_rate});
    }
    return records;
}

void CellRegistry::rebuild_occupancy() {
    occupancy_ = build_occupancy_map(dims_, cells_);
}

} // namespace celldiff
