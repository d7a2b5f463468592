#pragma once

#include <cstddef>
#include <vector>

#include "celldiff/cell_registry.hpp"
#include "celldiff/grid.hpp"

namespace celldiff {

// --- Simulation constants ---

struct SimulationConstants {
    float diffusion_constant = 1.0f; // >= 0
    float delta_time = 1.0f / 60.0f;  // > 0
    float delta_space = 1.0f;         // > 0
};

// Throws std::invalid_argument when a constant is out of range or not finite.
void validate_constants(const SimulationConstants& constants);

// diffusion_constant * delta_time / delta_space^2
float combined_constant(const SimulationConstants& constants);

// Per-step uniforms, derived once whenever the constants change.
struct StepParams {
    float combined_constant = 0.0f;
    float delta_time = 0.0f;
};

StepParams make_step_params(const SimulationConstants& constants);

// Everything one diffusion pass reads and writes. `output` must be zeroed before the pass:
// both cases accumulate into it.
struct StepBindings {
    GridDimensions dims;
    const float* input = nullptr;
    float* output = nullptr;
    const int* occupancy = nullptr;
    const CellRecord* cells = nullptr;
    StepParams params;
};

// Explicit (forward Euler) 7-point update of a single lane.
//
// Occupied voxel (Case A): the cell's production for this step, production_rate * dt,
// is split evenly over 6 minus the number of in-bounds occupied neighbors and added to the
// output of every in-bounds empty neighbor. Out-of-bounds directions stay in the divisor
// but receive nothing. When every direction is blocked by another cell nothing is produced.
// The occupied voxel's own output slot is never written.
//
// Empty voxel (Case B): out-of-bounds neighbors count as open with value 0, occupied
// neighbors are excluded from the Laplacian, and input + combined * (sum - open * center)
// is added to the output slot.
//
// Lanes outside the grid return immediately. All writes are atomic additions, so lanes may
// run concurrently and in any order.
void diffuse_voxel(const StepBindings& b, int x, int y, int z);

// One full pass over the grid on the calling thread's OpenMP team, in 8x8x8 blocks.
// Does not clear the output; see StepBindings.
void run_diffusion_pass(const StepBindings& b);

// Convenience for callers holding plain containers: zeroes `output`, then runs one pass.
// Throws std::invalid_argument on size mismatch.
void step_field(const GridDimensions& dims,
                const std::vector<float>& input,
                std::vector<float>& output,
                const std::vector<int>& occupancy,
                const std::vector<CellRecord>& cells,
                const StepParams& params);

} // namespace celldiff
