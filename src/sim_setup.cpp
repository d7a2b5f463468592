#include "celldiff/sim_setup.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem> // For directory operations (C++17)
#include <fstream>
#include <iostream>
#include <random>

namespace celldiff {

std::vector<float> generate_initial_field(const GridDimensions& dims, bool random_start, std::uint32_t seed) {
    validate_dimensions(dims);
    std::vector<float> field(voxel_count(dims), 0.0f);
    if (!random_start) {
        return field;
    }

    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> noise(0.0f, 0.3f);
    const float cx = dims.x / 2.0f;
    const float cy = dims.y / 2.0f;
    const float cz = dims.z / 2.0f;
    const float radius = dims.x / 2.0f;

    for (int z = 0; z < dims.z; ++z) {
        for (int y = 0; y < dims.y; ++y) {
            for (int x = 0; x < dims.x; ++x) {
                const float dx = x - cx;
                const float dy = y - cy;
                const float dz = z - cz;
                const float distance = std::sqrt(dx * dx + dy * dy + dz * dz);
                float val = std::max(0.0f, 1.0f - distance / radius) + noise(rng);
                if (val < 0.1f) {
                    val = 0.0f;
                }
                field[to_index(dims, x, y, z)] = val;
            }
        }
    }
    return field;
}

std::vector<Cell> place_random_cells(const std::vector<Cell>& existing,
                                     const GridDimensions& dims,
                                     int count,
                                     std::uint32_t seed) {
    validate_dimensions(dims);
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist_x(0, dims.x - 1);
    std::uniform_int_distribution<int> dist_y(0, dims.y - 1);
    std::uniform_int_distribution<int> dist_z(0, dims.z - 1);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    std::vector<Cell> taken = existing;
    std::vector<Cell> placed;
    int attempts = 0;

    for (int i = 0; i < count && attempts < MAX_PLACEMENT_ATTEMPTS; ++i) {
        VoxelCoord pos;
        bool intersects = true;
        // Keep drawing until a free voxel turns up or the attempt budget runs out
        do {
            pos = VoxelCoord{dist_x(rng), dist_y(rng), dist_z(rng)};
            intersects = check_intersection(taken, pos);
            ++attempts;
        } while (intersects && attempts < MAX_PLACEMENT_ATTEMPTS);

        if (!intersects) {
            Cell cell;
            cell.position = pos;
            cell.production_rate = ((unit(rng) / 0.5f) + 0.5f) * 1000.0f;
            taken.push_back(cell);
            placed.push_back(cell);
        }
    }
    return placed;
}

FieldStats field_statistics(const std::vector<float>& field) {
    FieldStats stats;
    if (field.empty()) {
        return stats;
    }
    stats.min = field.front();
    stats.max = field.front();
    for (float v : field) {
        stats.total += v;
        stats.min = std::min(stats.min, v);
        stats.max = std::max(stats.max, v);
    }
    return stats;
}

bool save_slice_to_file(const std::vector<float>& field, const GridDimensions& dims,
                        int step, int z_slice, const std::string& frame_dir) {
    if (z_slice < 0 || z_slice >= dims.z) {
        std::cerr << "Error: Invalid z_slice index " << z_slice << std::endl;
        return false;
    }
    if (field.size() != voxel_count(dims)) {
        std::cerr << "Error: Field size " << field.size() << " does not match grid" << std::endl;
        return false;
    }

    if (!std::filesystem::exists(frame_dir)) {
        try {
            std::filesystem::create_directories(frame_dir);
        } catch (const std::exception& e) {
            std::cerr << "Error creating directory '" << frame_dir << "': " << e.what() << std::endl;
            return false;
        }
    }

    std::string filename = frame_dir + "/frame_" + std::to_string(step) + "_slice_" + std::to_string(z_slice) + ".txt";
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        std::cerr << "Error opening file for writing: " << filename << std::endl;
        return false;
    }

    // Write the 2D slice (y rows, x columns)
    for (int y = 0; y < dims.y; ++y) {
        for (int x = 0; x < dims.x; ++x) {
            outfile << field[to_index(dims, x, y, z_slice)] << (x == dims.x - 1 ? "" : " ");
        }
        outfile << "\n";
    }
    return static_cast<bool>(outfile);
}

} // namespace celldiff
