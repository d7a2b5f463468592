// celldiff_sim: headless driver for the cell diffusion engine.
// Builds a grid, scatters producing cells, runs frames of N steps followed by one
// readback, and dumps z-slices of the field as text for external plotting.

#include <chrono>
#include <iomanip> // For formatting output
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <omp.h> // For OpenMP

#include "celldiff/diffusion_engine.hpp"
#include "celldiff/sim_setup.hpp"

using namespace celldiff;

// --- Parameters ---
struct SimulationParams {
    GridDimensions dims{128, 128, 128};
    float diffusion_constant = 1.0f;
    float delta_time = 1.0f / 60.0f;
    int frames = 100;
    int iterations_per_frame = 10;
    int num_cells = 10;
    bool random_start = false;
    std::uint32_t seed = 42;
    int frame_interval = 10;
    std::string frame_dir = "diffusion_frames";
    int z_slice = -1; // -1: middle of the grid
};

// --key=value parser; unknown flags are an error so typos do not run silently.
SimulationParams parse_args(int argc, char** argv) {
    SimulationParams p;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value_of = [&a](const std::string& key) { return a.substr(key.size()); };

        if (a.rfind("--x=", 0) == 0) p.dims.x = std::stoi(value_of("--x="));
        else if (a.rfind("--y=", 0) == 0) p.dims.y = std::stoi(value_of("--y="));
        else if (a.rfind("--z=", 0) == 0) p.dims.z = std::stoi(value_of("--z="));
        else if (a.rfind("--frames=", 0) == 0) p.frames = std::stoi(value_of("--frames="));
        else if (a.rfind("--iterations=", 0) == 0) p.iterations_per_frame = std::stoi(value_of("--iterations="));
        else if (a.rfind("--diffusion=", 0) == 0) p.diffusion_constant = std::stof(value_of("--diffusion="));
        else if (a.rfind("--dt=", 0) == 0) p.delta_time = std::stof(value_of("--dt="));
        else if (a.rfind("--cells=", 0) == 0) p.num_cells = std::stoi(value_of("--cells="));
        else if (a == "--random-start") p.random_start = true;
        else if (a.rfind("--seed=", 0) == 0) p.seed = static_cast<std::uint32_t>(std::stoul(value_of("--seed=")));
        else if (a.rfind("--frame-interval=", 0) == 0) p.frame_interval = std::stoi(value_of("--frame-interval="));
        else if (a.rfind("--frame-dir=", 0) == 0) p.frame_dir = value_of("--frame-dir=");
        else if (a.rfind("--z-slice=", 0) == 0) p.z_slice = std::stoi(value_of("--z-slice="));
        else throw std::invalid_argument("Unknown option: " + a);
    }
    if (p.frames < 0 || p.iterations_per_frame < 0 || p.num_cells < 0) {
        throw std::invalid_argument("frames, iterations and cells must be >= 0");
    }
    if (p.frame_interval <= 0) {
        throw std::invalid_argument("frame-interval must be > 0");
    }
    if (p.z_slice < 0) {
        p.z_slice = p.dims.z / 2;
    }
    return p;
}

void print_setup(const SimulationParams& p) {
    std::cout << std::string(30, '-') << std::endl;
    std::cout << "Simulation Setup (C++ / OpenMP):" << std::endl;
    std::cout << "  Grid Dimensions:        " << p.dims.x << "x" << p.dims.y << "x" << p.dims.z << std::endl;
    std::cout << "  Diffusion Constant:     " << p.diffusion_constant << std::endl;
    std::cout << "  Delta Time:             " << p.delta_time << std::endl;
    std::cout << "  Combined Constant:      "
              << combined_constant(SimulationConstants{p.diffusion_constant, p.delta_time, 1.0f}) << std::endl;
    std::cout << "  Frames x Iterations:    " << p.frames << " x " << p.iterations_per_frame << std::endl;
    std::cout << "  Cells:                  " << p.num_cells << std::endl;
    std::cout << "  Random Start:           " << (p.random_start ? "yes" : "no") << std::endl;
    std::cout << "  Seed:                   " << p.seed << std::endl;
    std::cout << "  Output Slice z:         " << p.z_slice << std::endl;
    std::cout << "  Output Frame Dir:       " << p.frame_dir << std::endl;
    std::cout << "  OpenMP Threads:         " << omp_get_max_threads() << std::endl;
    std::cout << std::string(30, '-') << std::endl;
}

// --- Main Simulation Loop ---
void simulate_diffusion(const SimulationParams& p) {
    std::cout << "Initializing concentration field..." << std::endl;
    std::vector<float> initial = generate_initial_field(p.dims, p.random_start, p.seed);

    DiffusionEngine engine(p.dims, initial, p.diffusion_constant, p.delta_time);
    initial.clear();
    initial.shrink_to_fit();

    std::vector<Cell> cells = place_random_cells(engine.cells(), p.dims, p.num_cells, p.seed + 1);
    if (static_cast<int>(cells.size()) < p.num_cells) {
        std::cerr << "Warning: placed only " << cells.size() << " of " << p.num_cells
                  << " cells after " << MAX_PLACEMENT_ATTEMPTS << " attempts" << std::endl;
    }
    engine.add_cells(cells);
    std::cout << "Placed " << cells.size() << " cells." << std::endl;

    std::cout << "Saving slice data every " << p.frame_interval << " frames to '" << p.frame_dir << "/'" << std::endl;

    auto start_time = std::chrono::high_resolution_clock::now();
    for (int frame = 0; frame < p.frames; ++frame) {
        engine.step(p.iterations_per_frame);
        std::vector<float> field = engine.read_results().get();

        if (frame % p.frame_interval == 0 || frame == p.frames - 1) {
            FieldStats stats = field_statistics(field);
            auto current_time = std::chrono::high_resolution_clock::now();
            std::chrono::duration<double> elapsed = current_time - start_time;

            std::cout << "\nFrame " << frame << " [" << std::fixed << std::setprecision(2) << elapsed.count() << "s]: "
                      << "steps=" << engine.steps_submitted()
                      << ", total=" << std::setprecision(4) << stats.total
                      << ", min=" << stats.min << ", max=" << stats.max;

            if (!save_slice_to_file(field, p.dims, frame, p.z_slice, p.frame_dir)) {
                std::cerr << "Warning: Failed to save frame data at frame " << frame << std::endl;
            }
        } else {
            std::cout << "." << std::flush;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> total_elapsed = end_time - start_time;
    std::cout << "\n\nSimulation finished " << engine.steps_submitted() << " steps in "
              << std::fixed << std::setprecision(2) << total_elapsed.count() << " seconds." << std::endl;

    engine.dispose();
}

// --- Main Execution Logic ---
int main(int argc, char** argv) {
    try {
        SimulationParams params = parse_args(argc, argv);
        print_setup(params);

        std::cout << "\nStarting C++/OpenMP diffusion for " << params.frames << " frames..." << std::endl;
        simulate_diffusion(params);

        std::cout << "\nSimulation completed." << std::endl;
        std::cout << "Frame data saved in: " << params.frame_dir << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nProgram finished." << std::endl;
    return 0;
}
