#include "celldiff/grid.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace celldiff {

void validate_dimensions(const GridDimensions& dims) {
    if (dims.x <= 0 || dims.y <= 0 || dims.z <= 0) {
        throw std::invalid_argument("Grid dimensions must be positive, got " +
                                    std::to_string(dims.x) + "x" + std::to_string(dims.y) + "x" +
                                    std::to_string(dims.z));
    }
    if (voxel_count(dims) > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("Grid " + std::to_string(dims.x) + "x" + std::to_string(dims.y) + "x" +
                                    std::to_string(dims.z) + " has too many voxels");
    }
}

VoxelCoord from_index(const GridDimensions& dims, std::size_t idx) {
    const std::size_t plane = static_cast<std::size_t>(dims.x) * static_cast<std::size_t>(dims.y);
    VoxelCoord c;
    c.z = static_cast<int>(idx / plane);
    const std::size_t rem = idx % plane;
    c.y = static_cast<int>(rem / static_cast<std::size_t>(dims.x));
    c.x = static_cast<int>(rem % static_cast<std::size_t>(dims.x));
    return c;
}

std::int64_t neighbor_index(const GridDimensions& dims, std::size_t idx, Axis axis, int direction) {
    if (idx >= voxel_count(dims) || (direction != -1 && direction != 1)) {
        return OUT_OF_BOUNDS;
    }
    VoxelCoord c = from_index(dims, idx);
    switch (axis) {
        case Axis::X: c.x += direction; break;
        case Axis::Y: c.y += direction; break;
        case Axis::Z: c.z += direction; break;
    }
    if (!contains(dims, c)) {
        return OUT_OF_BOUNDS;
    }
    return static_cast<std::int64_t>(to_index(dims, c));
}

std::int64_t face_neighbor_index(const GridDimensions& dims, int x, int y, int z, int face) {
    if (face < 0 || face >= NUM_FACE_NEIGHBORS) {
        return OUT_OF_BOUNDS;
    }
    const int nx = x + FACE_DX[face];
    const int ny = y + FACE_DY[face];
    const int nz = z + FACE_DZ[face];
    if (!contains(dims, nx, ny, nz)) {
        return OUT_OF_BOUNDS;
    }
    return static_cast<std::int64_t>(to_index(dims, nx, ny, nz));
}

GridDimensions dispatch_blocks(const GridDimensions& dims, int block_size) {
    if (block_size <= 0) {
        throw std::invalid_argument("Block size must be positive");
    }
    GridDimensions blocks;
    blocks.x = (dims.x + block_size - 1) / block_size;
    blocks.y = (dims.y + block_size - 1) / block_size;
    blocks.z = (dims.z + block_size - 1) / block_size;
    return blocks;
}

} // namespace celldiff
