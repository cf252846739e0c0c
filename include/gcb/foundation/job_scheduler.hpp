#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for gateway background work.

#include "gcb/foundation/gateway_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace gcb::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally.
enum class JobPriority { Critical, High, Normal, Low };

/// Thread-pool backed scheduler for one-off jobs (outbound dial attempts,
/// HTTP fallback fetches) and recurring maintenance ticks (session
/// heartbeats, binding and correlation sweeps, status polling).
///
/// @code
///   JobScheduler scheduler(2);
///   scheduler.scheduleTick(std::chrono::milliseconds(100),
///                          [&] { gateway.tick(Clock::now()); });
///   // main loop
///   scheduler.processTick(elapsed);
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    /// Stops the pool, letting running jobs finish.
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Schedule a one-off job.
    /// @return The assigned JobId, or JobScheduleFailed after shutdown().
    GatewayResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Register a recurring job that fires every @p interval of processTick time.
    GatewayResult<JobId> scheduleTick(std::chrono::milliseconds interval, JobFunc job);

    /// Advance tick timers by @p deltaTime and dispatch due tick jobs.
    /// A tick job whose previous run is still executing is skipped.
    void processTick(std::chrono::milliseconds deltaTime);

    /// Block until the job completes.
    GatewayResult<void> wait(JobId id);

    /// Cancel a pending one-off job or disable a tick job.
    GatewayResult<void> cancel(JobId id);

    /// Stop accepting work and join the workers.
    void shutdown();

    /// Number of tracked one-off jobs that have not completed yet.
    [[nodiscard]] std::size_t pendingJobs() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gcb::foundation
