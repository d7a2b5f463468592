#include "celldiff/diffusion_engine.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace celldiff {

DiffusionEngine::DiffusionEngine(const GridDimensions& dims,
                                 const std::vector<float>& initial_field,
                                 float diffusion_constant,
                                 float delta_time,
                                 std::vector<Cell> cells,
                                 const DeviceLimits& limits)
    : dims_(dims),
      registry_(dims, std::move(cells)) { // validates dims
    if (initial_field.size() != voxel_count(dims_)) {
        throw std::invalid_argument("Initial field has " + std::to_string(initial_field.size()) +
                                    " values, grid needs " + std::to_string(voxel_count(dims_)));
    }
    constants_.diffusion_constant = diffusion_constant;
    constants_.delta_time = delta_time;
    validate_constants(constants_);
    params_ = make_step_params(constants_);

    device_ = ComputeDevice::create(limits);

    const std::size_t n = voxel_count(dims_);
    input_ = device_->create_buffer(n, BUFFER_STORAGE | BUFFER_COPY_DST);
    output_ = device_->create_buffer(n, BUFFER_STORAGE | BUFFER_COPY_SRC | BUFFER_COPY_DST);
    staging_ = device_->create_buffer(n, BUFFER_COPY_DST | BUFFER_MAP_READ);

    // OUTPUT starts as the initial field too, so a read before the first step returns it.
    device_->queue().write_buffer(input_, initial_field);
    device_->queue().write_buffer(output_, initial_field);

    rebind_cells_locked(); // not shared yet, no lock needed
}

DiffusionEngine::~DiffusionEngine() {
    if (disposed_.exchange(true)) {
        return;
    }
    std::exception_ptr error = release();
    if (error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            std::cerr << "Warning: device work failed before engine teardown: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Warning: device work failed before engine teardown: unknown error" << std::endl;
        }
    }
}

void DiffusionEngine::require_alive(const char* op) const {
    if (disposed_.load()) {
        throw engine_disposed(std::string("DiffusionEngine::") + op + " called after dispose()");
    }
}

void DiffusionEngine::rebind_cells_locked() {
    // Replace the whole snapshot; steps already queued keep the one they captured.
    auto bindings = std::make_shared<CellBindings>();
    bindings->occupancy = registry_.occupancy();
    bindings->records = registry_.flatten();
    bindings_ = std::move(bindings);
}

// --- Stepping ---

void DiffusionEngine::step() {
    require_alive("step");

    // The clear, the pass and the copy back reach the queue as one unit, so a read
    // submitted from another thread lands before or after the whole step.
    std::lock_guard<std::mutex> lock(mutex_);
    std::shared_ptr<const CellBindings> bindings = bindings_;
    const StepParams params = params_;

    ComputeQueue& queue = device_->queue();
    queue.clear_buffer(output_);

    const GridDimensions dims = dims_;
    BufferHandle input = input_;
    BufferHandle output = output_;
    queue.submit([dims, input, output, bindings, params]() {
        StepBindings b;
        b.dims = dims;
        b.input = input->device_data();
        b.output = output->device_data();
        b.occupancy = bindings->occupancy.data();
        b.cells = bindings->records.data();
        b.params = params;
        run_diffusion_pass(b);
    });

    // Sequenced after this pass and before the next one on the same queue.
    queue.copy_buffer_to_buffer(output_, input_);
    ++steps_submitted_;
}

void DiffusionEngine::step(int count) {
    require_alive("step");
    if (count < 0) {
        throw std::invalid_argument("step count must be >= 0, got " + std::to_string(count));
    }
    for (int i = 0; i < count; ++i) {
        step();
    }
}

// --- Readback ---

DiffusionEngine::FieldFuture DiffusionEngine::read_results() {
    require_alive("read_results");

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_read_.valid()) {
        return pending_read_; // attach to the read already in flight
    }

    ComputeQueue& queue = device_->queue();
    queue.copy_buffer_to_buffer(output_, staging_);
    std::shared_future<void> work_done = queue.on_submitted_work_done();

    std::promise<std::vector<float>> promise;
    pending_read_ = promise.get_future().share();
    FieldFuture result = pending_read_;

    // The previous task, if any, has already cleared the slot and is about to finish.
    read_task_ = std::async(std::launch::async, &DiffusionEngine::run_readback, this,
                            std::move(promise), std::move(work_done), staging_);
    return result;
}

void DiffusionEngine::run_readback(std::promise<std::vector<float>> promise,
                                   std::shared_future<void> work_done,
                                   BufferHandle staging) {
    try {
        work_done.get();                              // all prior steps and the staging copy ran
        staging->map_async(device_->queue()).get();   // staging is host-accessible
        const float* mapped = staging->mapped_range();
        std::vector<float> snapshot(mapped, mapped + staging->size());
        staging->unmap();
        clear_pending_read();
        promise.set_value(std::move(snapshot));
    } catch (...) {
        if (staging->map_state() == MapState::Mapped) {
            staging->unmap();
        }
        clear_pending_read();
        promise.set_exception(std::current_exception());
    }
}

void DiffusionEngine::clear_pending_read() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_read_ = FieldFuture();
}

// --- Mutation ---

void DiffusionEngine::set_cells(std::vector<Cell> cells) {
    require_alive("set_cells");
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.set_cells(std::move(cells));
    rebind_cells_locked();
}

void DiffusionEngine::add_cells(const std::vector<Cell>& cells) {
    require_alive("add_cells");
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.add_cells(cells);
    rebind_cells_locked();
}

void DiffusionEngine::set_constants(float diffusion_constant, float delta_time) {
    require_alive("set_constants");
    SimulationConstants updated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        updated = constants_;
    }
    updated.diffusion_constant = diffusion_constant;
    updated.delta_time = delta_time;
    validate_constants(updated);

    std::lock_guard<std::mutex> lock(mutex_);
    constants_ = updated;
    params_ = make_step_params(constants_);
}

void DiffusionEngine::set_delta_time(float delta_time) {
    require_alive("set_delta_time");
    float diffusion_constant;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        diffusion_constant = constants_.diffusion_constant;
    }
    set_constants(diffusion_constant, delta_time);
}

void DiffusionEngine::wait_idle() {
    require_alive("wait_idle");
    device_->queue().wait_idle();
}

ComputeQueue& DiffusionEngine::queue() {
    require_alive("queue");
    return device_->queue();
}

SimulationConstants DiffusionEngine::constants() const {
    require_alive("constants");
    std::lock_guard<std::mutex> lock(mutex_);
    return constants_;
}

std::vector<Cell> DiffusionEngine::cells() const {
    require_alive("cells");
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.cells();
}

std::uint64_t DiffusionEngine::steps_submitted() const {
    require_alive("steps_submitted");
    std::lock_guard<std::mutex> lock(mutex_);
    return steps_submitted_;
}

// --- Teardown ---

void DiffusionEngine::dispose() {
    if (disposed_.exchange(true)) {
        throw engine_disposed("DiffusionEngine::dispose called after dispose()");
    }
    std::exception_ptr error = release();
    if (error) {
        std::rethrow_exception(error);
    }
}

std::exception_ptr DiffusionEngine::release() {
    std::future<void> read_task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        read_task = std::move(read_task_);
    }
    if (read_task.valid()) {
        read_task.wait(); // its outcome lives in the shared read future
    }

    std::exception_ptr error;
    std::shared_future<void> drained = device_->queue().on_submitted_work_done();
    drained.wait();
    try {
        drained.get();
    } catch (...) {
        error = std::current_exception(); // handed back to dispose()/the destructor
    }

    input_->destroy();
    output_->destroy();
    staging_->destroy();
    input_.reset();
    output_.reset();
    staging_.reset();
    device_.reset(); // joins the queue worker

    std::lock_guard<std::mutex> lock(mutex_);
    bindings_.reset();
    pending_read_ = FieldFuture();
    return error;
}

} // namespace celldiff
