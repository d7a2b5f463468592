#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "celldiff/grid.hpp"

namespace celldiff {

// -----------------------------------------------------------------------------
// Compute device
//
// A host-side stand-in for a massively parallel device: one in-order command
// queue drained by a worker thread. Kernel commands spread their work over the
// OpenMP thread team (see dispatch_lanes). Buffers live in device storage and
// only become host-readable through map_async()/unmap().
// -----------------------------------------------------------------------------

// Buffer usage flags (combine with |).
enum BufferUsage : unsigned {
    BUFFER_STORAGE  = 1u << 0, // bound to kernels
    BUFFER_COPY_SRC = 1u << 1,
    BUFFER_COPY_DST = 1u << 2,
    BUFFER_MAP_READ = 1u << 3, // host-mappable staging memory
};

enum class MapState { Unmapped, Pending, Mapped };

class ComputeQueue;

class DeviceBuffer : public std::enable_shared_from_this<DeviceBuffer> {
public:
    DeviceBuffer(std::size_t size, unsigned usage);

    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;

    std::size_t size() const { return size_; } // in floats
    unsigned usage() const { return usage_; }
    bool has_usage(unsigned flags) const { return (usage_ & flags) == flags; }

    bool destroyed() const;
    void destroy();

    // Device-side storage, for commands running on the queue. Throws std::logic_error once destroyed.
    float* device_data();
    const float* device_data() const;

    // Requests host access. The returned future resolves after every command submitted to
    // `queue` before this call has executed. Requires BUFFER_MAP_READ and an unmapped buffer.
    std::shared_future<void> map_async(ComputeQueue& queue);

    // Host view of a mapped buffer. Throws std::logic_error unless the buffer is mapped.
    const float* mapped_range() const;
    void unmap();
    MapState map_state() const;

private:
    void require_alive_locked(const char* op) const;

    mutable std::mutex mutex_;
    const std::size_t size_;
    const unsigned usage_;
    std::vector<float> storage_;
    bool destroyed_ = false;
    MapState map_state_ = MapState::Unmapped;
};

using BufferHandle = std::shared_ptr<DeviceBuffer>;

class ComputeQueue {
public:
    using Command = std::function<void()>;

    ComputeQueue();
    ~ComputeQueue();

    ComputeQueue(const ComputeQueue&) = delete;
    ComputeQueue& operator=(const ComputeQueue&) = delete;

    // Appends a command. Commands run one at a time in submission order.
    void submit(Command command);

    void write_buffer(const BufferHandle& dst, std::vector<float> data);
    void clear_buffer(const BufferHandle& dst);
    void copy_buffer_to_buffer(const BufferHandle& src, const BufferHandle& dst);

    // Resolves once everything submitted so far has executed. If any of those commands
    // threw, the future carries the first such exception.
    std::shared_future<void> on_submitted_work_done();

    // Blocks until the queue has drained; rethrows a recorded command failure.
    void wait_idle();

private:
    void worker_loop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Command> commands_;
    std::exception_ptr pending_error_; // first failure since the last work-done fence
    bool stopping_ = false;
    std::thread worker_;
};

struct DeviceLimits {
    int max_compute_invocations_per_workgroup = 1024;
};

class ComputeDevice {
public:
    // Throws std::runtime_error when the device cannot satisfy BLOCK_SIZE^3 lanes per block,
    // when OpenMP reports no threads, or when the queue worker cannot be started.
    static std::unique_ptr<ComputeDevice> create(const DeviceLimits& limits = DeviceLimits());

    ComputeDevice(const ComputeDevice&) = delete;
    ComputeDevice& operator=(const ComputeDevice&) = delete;

    BufferHandle create_buffer(std::size_t size, unsigned usage);

    ComputeQueue& queue() { return queue_; }
    const DeviceLimits& limits() const { return limits_; }
    int max_threads() const { return max_threads_; }

private:
    ComputeDevice(const DeviceLimits& limits, int max_threads);

    DeviceLimits limits_;
    int max_threads_;
    ComputeQueue queue_;
};

} // namespace celldiff
