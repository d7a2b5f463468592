#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "celldiff/cell_registry.hpp"
#include "celldiff/compute_device.hpp"
#include "celldiff/diffusion_stepper.hpp"
#include "celldiff/grid.hpp"

namespace celldiff {

// Thrown by every DiffusionEngine call made after dispose().
class engine_disposed : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// -----------------------------------------------------------------------------
// DiffusionEngine
//
// Owns the field buffers and advances them on a ComputeDevice:
//   INPUT   - field the next step reads
//   OUTPUT  - pass target, cleared before every step, then copied back to INPUT
//   STAGING - host-mappable copy target used only by read_results()
//
// step() only submits work. read_results() returns a future for a snapshot of
// OUTPUT as of every step submitted before the call. At most one read is in
// flight: callers arriving while one is pending share its future.
//
// Cell data (occupancy map + flattened records) is an immutable snapshot that
// set_cells()/add_cells() replace wholesale. Each step binds the snapshot and
// constants current at submission, so later changes never reach a queued step.
// -----------------------------------------------------------------------------
class DiffusionEngine {
public:
    using FieldFuture = std::shared_future<std::vector<float>>;

    // Throws std::invalid_argument for bad dimensions, a field of the wrong length or
    // out-of-range constants, and std::runtime_error when no compute device is available.
    DiffusionEngine(const GridDimensions& dims,
                    const std::vector<float>& initial_field,
                    float diffusion_constant,
                    float delta_time,
                    std::vector<Cell> cells = {},
                    const DeviceLimits& limits = DeviceLimits());
    ~DiffusionEngine();

    DiffusionEngine(const DiffusionEngine&) = delete;
    DiffusionEngine& operator=(const DiffusionEngine&) = delete;

    void step();
    void step(int count);

    FieldFuture read_results();

    void set_cells(std::vector<Cell> cells);
    void add_cells(const std::vector<Cell>& cells);
    void set_constants(float diffusion_constant, float delta_time);
    void set_delta_time(float delta_time);

    // Blocks until every submitted step has executed; rethrows a device failure.
    void wait_idle();

    // The queue steps and reads are submitted to. Extra commands submitted here run in
    // order with them.
    ComputeQueue& queue();

    // Waits for outstanding work, then releases all buffers and the device. Any further call,
    // dispose() included, throws engine_disposed. Rethrows a device failure recorded by the
    // drained work after the buffers are released.
    void dispose();
    bool disposed() const { return disposed_.load(); }

    const GridDimensions& dimensions() const { return dims_; }
    SimulationConstants constants() const;
    std::vector<Cell> cells() const;
    std::uint64_t steps_submitted() const;

private:
    struct CellBindings {
        std::vector<int> occupancy;
        std::vector<CellRecord> records;
    };

    void require_alive(const char* op) const;
    void rebind_cells_locked();
    void run_readback(std::promise<std::vector<float>> promise,
                      std::shared_future<void> work_done,
                      BufferHandle staging);
    void clear_pending_read();
    std::exception_ptr release();

    const GridDimensions dims_;
    std::unique_ptr<ComputeDevice> device_;
    BufferHandle input_;
    BufferHandle output_;
    BufferHandle staging_;

    mutable std::mutex mutex_;
    CellRegistry registry_;
    std::shared_ptr<const CellBindings> bindings_;
    SimulationConstants constants_;
    StepParams params_;
    std::uint64_t steps_submitted_ = 0;

    FieldFuture pending_read_;     // single-slot cache of the in-flight read
    std::future<void> read_task_;  // host side of the current or last read
    std::atomic<bool> disposed_{false};
};

} // namespace celldiff
