#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "celldiff/cell_registry.hpp"
#include "celldiff/grid.hpp"

namespace celldiff {

// Initial concentration field. All zero, or (random_start) a radial falloff from the grid
// center plus uniform noise in [0, 0.3), with values below 0.1 cut to zero.
std::vector<float> generate_initial_field(const GridDimensions& dims, bool random_start, std::uint32_t seed);

// Draws up to `count` cells at uniformly random voxels that are free of both `existing` and
// the cells drawn so far. Gives up after MAX_PLACEMENT_ATTEMPTS draws in total, so fewer
// than `count` cells may come back on a crowded grid.
// Production rates are ((u / 0.5) + 0.5) * 1000 for u uniform in [0, 1).
constexpr int MAX_PLACEMENT_ATTEMPTS = 1000;
std::vector<Cell> place_random_cells(const std::vector<Cell>& existing,
                                     const GridDimensions& dims,
                                     int count,
                                     std::uint32_t seed);

struct FieldStats {
    double total = 0.0; // sum over all voxels
    float min = 0.0f;
    float max = 0.0f;
};

FieldStats field_statistics(const std::vector<float>& field);

// Writes z-slice `z_slice` of the field as text (one row per y, x values separated by spaces)
// to <frame_dir>/frame_<step>_slice_<z_slice>.txt, creating the directory if needed.
// Returns false, with a message on std::cerr, when the slice or the file is unusable.
bool save_slice_to_file(const std::vector<float>& field, const GridDimensions& dims,
                        int step, int z_slice, const std::string& frame_dir);

} // namespace celldiff
