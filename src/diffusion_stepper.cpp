#include "celldiff/diffusion_stepper.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <stdexcept>
#include <string>

#include "celldiff/parallel.hpp"

namespace celldiff {

namespace {

inline void accumulate(float* output, std::size_t idx, float value) {
    std::atomic_ref<float> slot(output[idx]);
    slot.fetch_add(value, std::memory_order_relaxed);
}

// Case A: voxel holds cell `cell_idx`; distribute its production to open neighbors.
void produce_from_cell(const StepBindings& b, int x, int y, int z, int cell_idx) {
    std::int64_t neighbors[NUM_FACE_NEIGHBORS];
    int num_open = NUM_FACE_NEIGHBORS;
    for (int f = 0; f < NUM_FACE_NEIGHBORS; ++f) {
        neighbors[f] = face_neighbor_index(b.dims, x, y, z, f);
        // Only in-bounds occupied neighbors close a direction; walls stay in the divisor.
        if (neighbors[f] != OUT_OF_BOUNDS && b.occupancy[neighbors[f]] != EMPTY_VOXEL) {
            --num_open;
        }
    }
    if (num_open == 0) {
        return; // fully enclosed by other cells: nothing produced this step
    }

    const float per_neighbor = b.cells[cell_idx].production_rate * b.params.delta_time / static_cast<float>(num_open);
    for (int f = 0; f < NUM_FACE_NEIGHBORS; ++f) {
        if (neighbors[f] == OUT_OF_BOUNDS || b.occupancy[neighbors[f]] != EMPTY_VOXEL) {
            continue;
        }
        accumulate(b.output, static_cast<std::size_t>(neighbors[f]), per_neighbor);
    }
}

// Case B: empty voxel; 7-point Laplacian over open neighbors only.
void diffuse_empty(const StepBindings& b, int x, int y, int z, std::size_t idx) {
    float sum = 0.0f;
    int num_open = 0;
    for (int f = 0; f < NUM_FACE_NEIGHBORS; ++f) {
        const std::int64_t n = face_neighbor_index(b.dims, x, y, z, f);
        if (n == OUT_OF_BOUNDS) {
            ++num_open; // absorbing wall: open, contributes 0
        } else if (b.occupancy[n] == EMPTY_VOXEL) {
            sum += b.input[n];
            ++num_open;
        }
        // occupied neighbor: impermeable, excluded
    }
    const float center = b.input[idx];
    const float diffusion = b.params.combined_constant * (sum - static_cast<float>(num_open) * center);
    accumulate(b.output, idx, center + diffusion);
}

} // namespace

void validate_constants(const SimulationConstants& constants) {
    if (!std::isfinite(constants.diffusion_constant) || constants.diffusion_constant < 0.0f) {
        throw std::invalid_argument("Diffusion constant must be finite and >= 0, got " +
                                    std::to_string(constants.diffusion_constant));
    }
    if (!std::isfinite(constants.delta_time) || constants.delta_time <= 0.0f) {
        throw std::invalid_argument("Delta time must be finite and > 0, got " +
                                    std::to_string(constants.delta_time));
    }
    if (!std::isfinite(constants.delta_space) || constants.delta_space <= 0.0f) {
        throw std::invalid_argument("Delta space must be finite and > 0, got " +
                                    std::to_string(constants.delta_space));
    }
}

float combined_constant(const SimulationConstants& constants) {
    return constants.diffusion_constant * constants.delta_time / (constants.delta_space * constants.delta_space);
}

StepParams make_step_params(const SimulationConstants& constants) {
    StepParams p;
    p.combined_constant = combined_constant(constants);
    p.delta_time = constants.delta_time;
    return p;
}

void diffuse_voxel(const StepBindings& b, int x, int y, int z) {
    if (!contains(b.dims, x, y, z)) {
        return; // lane of a partial block
    }
    const std::size_t idx = to_index(b.dims, x, y, z);
    const int cell_idx = b.occupancy[idx];
    if (cell_idx != EMPTY_VOXEL) {
        produce_from_cell(b, x, y, z, cell_idx);
    } else {
        diffuse_empty(b, x, y, z, idx);
    }
}

void run_diffusion_pass(const StepBindings& b) {
    dispatch_lanes(dispatch_blocks(b.dims), [&b](int x, int y, int z) { diffuse_voxel(b, x, y, z); });
}

void step_field(const GridDimensions& dims,
                const std::vector<float>& input,
                std::vector<float>& output,
                const std::vector<int>& occupancy,
                const std::vector<CellRecord>& cells,
                const StepParams& params) {
    const std::size_t n = voxel_count(dims);
    if (input.size() != n || occupancy.size() != n) {
        throw std::invalid_argument("step_field: field and occupancy must have " + std::to_string(n) + " voxels");
    }
    for (int v : occupancy) {
        if (v != EMPTY_VOXEL && (v < 0 || static_cast<std::size_t>(v) >= cells.size())) {
            throw std::invalid_argument("step_field: occupancy value " + std::to_string(v) +
                                        " does not reference one of " + std::to_string(cells.size()) + " cells");
        }
    }
    output.assign(n, 0.0f);

    StepBindings b;
    b.dims = dims;
    b.input = input.data();
    b.output = output.data();
    b.occupancy = occupancy.data();
    b.cells = cells.data();
    b.params = params;
    run_diffusion_pass(b);
}

} // namespace celldiff
