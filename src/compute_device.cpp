#include "celldiff/compute_device.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <omp.h> // For OpenMP

namespace celldiff {

// --- DeviceBuffer ---

DeviceBuffer::DeviceBuffer(std::size_t size, unsigned usage)
    : size_(size), usage_(usage), storage_(size, 0.0f) {}

bool DeviceBuffer::destroyed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
}

void DeviceBuffer::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    destroyed_ = true;
    map_state_ = MapState::Unmapped;
    storage_.clear();
    storage_.shrink_to_fit();
}

void DeviceBuffer::require_alive_locked(const char* op) const {
    if (destroyed_) {
        throw std::logic_error(std::string(op) + ": buffer has been destroyed");
    }
}

float* DeviceBuffer::device_data() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked("device_data");
    return storage_.data();
}

const float* DeviceBuffer::device_data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked("device_data");
    return storage_.data();
}

std::shared_future<void> DeviceBuffer::map_async(ComputeQueue& queue) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        require_alive_locked("map_async");
        if (!(usage_ & BUFFER_MAP_READ)) {
            throw std::logic_error("map_async: buffer was not created with BUFFER_MAP_READ");
        }
        if (map_state_ != MapState::Unmapped) {
            throw std::logic_error("map_async: buffer is already mapped or has a map pending");
        }
        map_state_ = MapState::Pending;
    }

    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> mapped = promise->get_future().share();
    std::shared_ptr<DeviceBuffer> self = shared_from_this();
    queue.submit([self, promise]() {
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (self->destroyed_ || self->map_state_ != MapState::Pending) {
            promise->set_exception(std::make_exception_ptr(
                std::logic_error("map_async: buffer was destroyed or unmapped before the map completed")));
            return;
        }
        self->map_state_ = MapState::Mapped;
        promise->set_value();
    });
    return mapped;
}

const float* DeviceBuffer::mapped_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked("mapped_range");
    if (map_state_ != MapState::Mapped) {
        throw std::logic_error("mapped_range: buffer is not mapped");
    }
    return storage_.data();
}

void DeviceBuffer::unmap() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_alive_locked("unmap");
    map_state_ = MapState::Unmapped;
}

MapState DeviceBuffer::map_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_state_;
}

// --- ComputeQueue ---

ComputeQueue::ComputeQueue() : worker_(&ComputeQueue::worker_loop, this) {}

ComputeQueue::~ComputeQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join(); // drains whatever is still queued
    }
}

void ComputeQueue::submit(Command command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::logic_error("submit: queue is shutting down");
        }
        commands_.push_back(std::move(command));
    }
    cv_.notify_one();
}

void ComputeQueue::worker_loop() {
    for (;;) {
        Command command;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !commands_.empty(); });
            if (commands_.empty()) {
                return; // stopping and drained
            }
            command = std::move(commands_.front());
            commands_.pop_front();
        }
        try {
            command();
        } catch (...) {
            // Recorded and rethrown by the next work-done fence.
            std::lock_guard<std::mutex> lock(mutex_);
            if (!pending_error_) {
                pending_error_ = std::current_exception();
            }
        }
    }
}

void ComputeQueue::write_buffer(const BufferHandle& dst, std::vector<float> data) {
    if (!dst->has_usage(BUFFER_COPY_DST)) {
        throw std::logic_error("write_buffer: destination lacks BUFFER_COPY_DST");
    }
    if (data.size() != dst->size()) {
        throw std::logic_error("write_buffer: expected " + std::to_string(dst->size()) + " floats, got " +
                               std::to_string(data.size()));
    }
    submit([dst, data = std::move(data)]() {
        std::copy(data.begin(), data.end(), dst->device_data());
    });
}

void ComputeQueue::clear_buffer(const BufferHandle& dst) {
    if (!dst->has_usage(BUFFER_COPY_DST)) {
        throw std::logic_error("clear_buffer: destination lacks BUFFER_COPY_DST");
    }
    submit([dst]() {
        float* out = dst->device_data();
        std::fill(out, out + dst->size(), 0.0f);
    });
}

void ComputeQueue::copy_buffer_to_buffer(const BufferHandle& src, const BufferHandle& dst) {
    if (!src->has_usage(BUFFER_COPY_SRC)) {
        throw std::logic_error("copy_buffer_to_buffer: source lacks BUFFER_COPY_SRC");
    }
    if (!dst->has_usage(BUFFER_COPY_DST)) {
        throw std::logic_error("copy_buffer_to_buffer: destination lacks BUFFER_COPY_DST");
    }
    if (src->size() != dst->size()) {
        throw std::logic_error("copy_buffer_to_buffer: size mismatch");
    }
    if (dst->map_state() != MapState::Unmapped) {
        throw std::logic_error("copy_buffer_to_buffer: destination is mapped");
    }
    submit([src, dst]() {
        const float* in = src->device_data();
        std::copy(in, in + src->size(), dst->device_data());
    });
}

std::shared_future<void> ComputeQueue::on_submitted_work_done() {
    auto promise = std::make_shared<std::promise<void>>();
    std::shared_future<void> done = promise->get_future().share();
    submit([this, promise]() {
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(error, pending_error_);
        }
        if (error) {
            promise->set_exception(error);
        } else {
            promise->set_value();
        }
    });
    return done;
}

void ComputeQueue::wait_idle() {
    on_submitted_work_done().get();
}

// --- ComputeDevice ---

std::unique_ptr<ComputeDevice> ComputeDevice::create(const DeviceLimits& limits) {
    const int lanes_per_block = BLOCK_SIZE * BLOCK_SIZE * BLOCK_SIZE;
    if (limits.max_compute_invocations_per_workgroup < lanes_per_block) {
        throw std::runtime_error("Compute device unsupported: " + std::to_string(lanes_per_block) +
                                 " invocations per block required, limit is " +
                                 std::to_string(limits.max_compute_invocations_per_workgroup));
    }
    const int max_threads = omp_get_max_threads();
    if (max_threads < 1) {
        throw std::runtime_error("No compute device available: OpenMP reports no threads");
    }
    try {
        return std::unique_ptr<ComputeDevice>(new ComputeDevice(limits, max_threads));
    } catch (const std::system_error& e) {
        throw std::runtime_error(std::string("No compute device available: ") + e.what());
    }
}

ComputeDevice::ComputeDevice(const DeviceLimits& limits, int max_threads)
    : limits_(limits), max_threads_(max_threads) {}

BufferHandle ComputeDevice::create_buffer(std::size_t size, unsigned usage) {
    if (size == 0) {
        throw std::invalid_argument("create_buffer: size must be non-zero");
    }
    return std::make_shared<DeviceBuffer>(size, usage);
}

} // namespace celldiff
