#pragma once

#include <omp.h> // For OpenMP

#include "celldiff/grid.hpp"

namespace celldiff {

// Runs `kernel(x, y, z)` for every lane of every block in `blocks`, each block spanning
// BLOCK_SIZE lanes per axis. Lanes past the grid edge in partial blocks are still invoked;
// the kernel is responsible for bounds-checking them.
template <typename Kernel>
void dispatch_lanes(const GridDimensions& blocks, const Kernel& kernel) {
    #pragma omp parallel for collapse(3) // Parallelize over the block grid
    for (int bz = 0; bz < blocks.z; ++bz) {
        for (int by = 0; by < blocks.y; ++by) {
            for (int bx = 0; bx < blocks.x; ++bx) {
                const int x0 = bx * BLOCK_SIZE;
                const int y0 = by * BLOCK_SIZE;
                const int z0 = bz * BLOCK_SIZE;
                for (int lz = 0; lz < BLOCK_SIZE; ++lz) {
                    for (int ly = 0; ly < BLOCK_SIZE; ++ly) {
                        for (int lx = 0; lx < BLOCK_SIZE; ++lx) {
                            kernel(x0 + lx, y0 + ly, z0 + lz);
                        }
                    }
                }
            } // end bx
        } // end by
    } // end bz
}

} // namespace celldiff
