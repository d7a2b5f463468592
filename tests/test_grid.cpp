#include <stdexcept>

#include "celldiff/grid.hpp"
#include "test_support.hpp"

using namespace celldiff;

namespace {

static void runIndexConventionXFastest() {
    const GridDimensions dims{4, 3, 2};
    REQUIRE(voxel_count(dims) == 24, "voxel count");
    REQUIRE(to_index(dims, 0, 0, 0) == 0, "origin");
    REQUIRE(to_index(dims, 1, 0, 0) == 1, "x stride 1");
    REQUIRE(to_index(dims, 0, 1, 0) == 4, "y stride dimX");
    REQUIRE(to_index(dims, 0, 0, 1) == 12, "z stride dimX*dimY");
    REQUIRE(to_index(dims, 3, 2, 1) == 23, "last voxel");

    for (std::size_t i = 0; i < voxel_count(dims); ++i) {
        const VoxelCoord c = from_index(dims, i);
        REQUIRE(contains(dims, c), "from_index stays in bounds");
        REQUIRE(to_index(dims, c) == i, "from_index inverts to_index");
    }
    std::cout << "[PASS] index convention x + y*dimX + z*dimX*dimY\n";
}

static void runNeighborLookupReturnsSentinelOutside() {
    const GridDimensions dims{4, 3, 2};
    const std::size_t corner = to_index(dims, 0, 0, 0);
    REQUIRE(neighbor_index(dims, corner, Axis::X, -1) == OUT_OF_BOUNDS, "-x of corner");
    REQUIRE(neighbor_index(dims, corner, Axis::Y, -1) == OUT_OF_BOUNDS, "-y of corner");
    REQUIRE(neighbor_index(dims, corner, Axis::Z, -1) == OUT_OF_BOUNDS, "-z of corner");
    REQUIRE(neighbor_index(dims, corner, Axis::X, 1) == static_cast<std::int64_t>(to_index(dims, 1, 0, 0)), "+x of corner");
    REQUIRE(neighbor_index(dims, corner, Axis::Y, 1) == static_cast<std::int64_t>(to_index(dims, 0, 1, 0)), "+y of corner");
    REQUIRE(neighbor_index(dims, corner, Axis::Z, 1) == static_cast<std::int64_t>(to_index(dims, 0, 0, 1)), "+z of corner");

    const std::size_t far = to_index(dims, 3, 2, 1);
    REQUIRE(neighbor_index(dims, far, Axis::X, 1) == OUT_OF_BOUNDS, "+x at dimX-1");
    REQUIRE(neighbor_index(dims, far, Axis::Y, 1) == OUT_OF_BOUNDS, "+y at dimY-1");
    REQUIRE(neighbor_index(dims, far, Axis::Z, 1) == OUT_OF_BOUNDS, "+z at dimZ-1");

    // x wrap must not leak into the next row
    const std::size_t row_end = to_index(dims, 3, 0, 0);
    REQUIRE(neighbor_index(dims, row_end, Axis::X, 1) == OUT_OF_BOUNDS, "no wrap across rows");

    REQUIRE(neighbor_index(dims, voxel_count(dims), Axis::X, 1) == OUT_OF_BOUNDS, "index past the grid");
    REQUIRE(neighbor_index(dims, corner, Axis::X, 2) == OUT_OF_BOUNDS, "direction other than +-1");

    for (int f = 0; f < NUM_FACE_NEIGHBORS; ++f) {
        REQUIRE(face_neighbor_index(dims, 1, 1, 0, f) ==
                    (f == 4 ? OUT_OF_BOUNDS : static_cast<std::int64_t>(to_index(dims, 1 + FACE_DX[f], 1 + FACE_DY[f], FACE_DZ[f]))),
                "face neighbor " << f);
    }
    REQUIRE(face_neighbor_index(dims, 1, 1, 0, 6) == OUT_OF_BOUNDS, "face number past 5");
    std::cout << "[PASS] out-of-bounds neighbors map to the sentinel\n";
}

static void runDispatchBlocksUseCeilingDivision() {
    const GridDimensions exact = dispatch_blocks(GridDimensions{16, 8, 24});
    REQUIRE(exact.x == 2 && exact.y == 1 && exact.z == 3, "exact multiples");

    const GridDimensions partial = dispatch_blocks(GridDimensions{9, 1, 17});
    REQUIRE(partial.x == 2 && partial.y == 1 && partial.z == 3, "partial blocks are still dispatched");

    REQUIRE_THROWS((dispatch_blocks(GridDimensions{4, 4, 4}, 0)), std::invalid_argument, "zero block size");
    std::cout << "[PASS] dispatch block counts (ceiling division)\n";
}

static void runDimensionValidation() {
    validate_dimensions(GridDimensions{1, 1, 1});
    REQUIRE_THROWS((validate_dimensions(GridDimensions{0, 4, 4})), std::invalid_argument, "zero x");
    REQUIRE_THROWS((validate_dimensions(GridDimensions{4, -1, 4})), std::invalid_argument, "negative y");
    REQUIRE_THROWS((validate_dimensions(GridDimensions{4, 4, 0})), std::invalid_argument, "zero z");
    REQUIRE_THROWS((validate_dimensions(GridDimensions{4096, 4096, 4096})), std::invalid_argument, "too many voxels");
    std::cout << "[PASS] dimension validation\n";
}

} // namespace

int main() {
    runIndexConventionXFastest();
    runNeighborLookupReturnsSentinelOutside();
    runDispatchBlocksUseCeilingDivision();
    runDimensionValidation();
    return 0;
}
