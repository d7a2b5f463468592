#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace celldiff {

// --- Grid geometry ---
// Linear index convention shared by the field, the occupancy map and the stencil:
//     idx = x + y * dim_x + z * dim_x * dim_y

struct GridDimensions {
    int x = 0;
    int y = 0;
    int z = 0;
};

struct VoxelCoord {
    int x = 0;
    int y = 0;
    int z = 0;
};

inline bool operator==(const VoxelCoord& a, const VoxelCoord& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const VoxelCoord& a, const VoxelCoord& b) {
    return !(a == b);
}

enum class Axis : int { X = 0, Y = 1, Z = 2 };

// Sentinel returned for neighbors outside the lattice.
constexpr std::int64_t OUT_OF_BOUNDS = -1;

// Side length of a dispatch block along each axis (8x8x8 lanes per block).
constexpr int BLOCK_SIZE = 8;

// The six face neighbors, in the order -x, +x, -y, +y, -z, +z.
constexpr int NUM_FACE_NEIGHBORS = 6;
constexpr std::array<int, NUM_FACE_NEIGHBORS> FACE_DX = {-1, 1, 0, 0, 0, 0};
constexpr std::array<int, NUM_FACE_NEIGHBORS> FACE_DY = {0, 0, -1, 1, 0, 0};
constexpr std::array<int, NUM_FACE_NEIGHBORS> FACE_DZ = {0, 0, 0, 0, -1, 1};

// Throws std::invalid_argument for non-positive dimensions or a voxel count that does not fit
// a 32-bit signed index (occupancy values and lane ids are int).
void validate_dimensions(const GridDimensions& dims);

inline std::size_t voxel_count(const GridDimensions& dims) {
    return static_cast<std::size_t>(dims.x) * static_cast<std::size_t>(dims.y) * static_cast<std::size_t>(dims.z);
}

inline bool contains(const GridDimensions& dims, int x, int y, int z) {
    return x >= 0 && y >= 0 && z >= 0 && x < dims.x && y < dims.y && z < dims.z;
}

inline bool contains(const GridDimensions& dims, const VoxelCoord& c) {
    return contains(dims, c.x, c.y, c.z);
}

// Helper to get 1D index from 3D coordinates (x fastest).
inline std::size_t to_index(const GridDimensions& dims, int x, int y, int z) {
    return static_cast<std::size_t>(x)
         + static_cast<std::size_t>(dims.x) * (static_cast<std::size_t>(y)
         + static_cast<std::size_t>(dims.y) * static_cast<std::size_t>(z));
}

inline std::size_t to_index(const GridDimensions& dims, const VoxelCoord& c) {
    return to_index(dims, c.x, c.y, c.z);
}

VoxelCoord from_index(const GridDimensions& dims, std::size_t idx);

// Index of the face neighbor one step along `axis` in `direction` (-1 or +1),
// or OUT_OF_BOUNDS when that neighbor lies outside the grid. Never throws.
std::int64_t neighbor_index(const GridDimensions& dims, std::size_t idx, Axis axis, int direction);

// Same lookup by coordinates and face number (0..5, see FACE_D*).
std::int64_t face_neighbor_index(const GridDimensions& dims, int x, int y, int z, int face);

// Number of blocks per axis needed to cover the grid (ceiling division).
GridDimensions dispatch_blocks(const GridDimensions& dims, int block_size = BLOCK_SIZE);

} // namespace celldiff
