/// @file job_scheduler.cpp
/// @brief JobScheduler implementation wrapping kcenon thread_system.

#include "gcb/foundation/job_scheduler.hpp"

#include "gcb/foundation/gateway_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gcb::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: GCB -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct JobScheduler::Impl {
    struct TickEntry {
        JobId id;
        std::chrono::milliseconds interval;
        std::chrono::milliseconds elapsed{0};
        JobFunc func;
        bool enabled{true};
        std::shared_ptr<std::atomic<bool>> running;
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::atomic<bool> stopped{false};

    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::unordered_map<JobId, std::shared_ptr<std::atomic<bool>>> cancelFlags;
    std::vector<TickEntry> tickJobs;

    mutable std::mutex mutex;

    // Drop bookkeeping for jobs that already finished. Caller holds mutex.
    void pruneCompleted() {
        for (auto it = futures.begin(); it != futures.end();) {
            if (it->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                cancelFlags.erase(it->first);
                it = futures.erase(it);
            } else {
                ++it;
            }
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("gcb_scheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    if (impl_) {
        shutdown();
    }
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
GatewayResult<JobScheduler::JobId> JobScheduler::schedule(
    JobFunc job, JobPriority priority)
{
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return GatewayResult<JobId>::err(
            GatewayError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("gcb_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelFlag, promise]()
              -> kcenon::common::VoidResult {
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (const std::exception& e) {
                GCB_LOG_ERROR(LogCategory::Core,
                              std::string("background job failed: ") + e.what());
                promise->set_exception(std::current_exception());
            } catch (...) {
                // Non-standard exception: hand it to wait() unchanged.
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->pruneCompleted();
        impl_->futures[id] = future;
        impl_->cancelFlags[id] = cancelFlag;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
        return GatewayResult<JobId>::err(
            GatewayError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return GatewayResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// scheduleTick()
// ---------------------------------------------------------------------------
GatewayResult<JobScheduler::JobId> JobScheduler::scheduleTick(
    std::chrono::milliseconds interval, JobFunc job)
{
    if (interval.count() <= 0) {
        return GatewayResult<JobId>::err(
            GatewayError(ErrorCode::InvalidArgument, "tick interval must be positive"));
    }
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(impl_->mutex);
    impl_->tickJobs.push_back(
        Impl::TickEntry{id, interval, std::chrono::milliseconds{0},
                        std::move(job), true,
                        std::make_shared<std::atomic<bool>>(false)});

    return GatewayResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// processTick()
// ---------------------------------------------------------------------------
void JobScheduler::processTick(std::chrono::milliseconds deltaTime) {
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return;
    }

    std::lock_guard lock(impl_->mutex);
    for (auto& tick : impl_->tickJobs) {
        if (!tick.enabled) {
            continue;
        }
        tick.elapsed += deltaTime;
        if (tick.elapsed < tick.interval) {
            continue;
        }
        tick.elapsed = std::chrono::milliseconds{0};

        // One run at a time per tick entry; a slow sweep is never stacked.
        bool expected = false;
        if (!tick.running->compare_exchange_strong(expected, true,
                                                   std::memory_order_acq_rel)) {
            continue;
        }

        auto fn = tick.func;
        auto running = tick.running;
        auto threadJob = kcenon::thread::job_builder()
            .name("gcb_tick_" + std::to_string(tick.id))
            .work([fn, running]() -> kcenon::common::VoidResult {
                try {
                    fn();
                } catch (const std::exception& e) {
                    GCB_LOG_ERROR(LogCategory::Core,
                                  std::string("tick job failed: ") + e.what());
                }
                running->store(false, std::memory_order_release);
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();
        auto enqResult = impl_->pool->enqueue(std::move(threadJob));
        if (enqResult.is_err()) {
            running->store(false, std::memory_order_release);
            GCB_LOG_WARN(LogCategory::Core, "failed to enqueue tick job");
        }
    }
}

// ---------------------------------------------------------------------------
// wait()
// ---------------------------------------------------------------------------
GatewayResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return GatewayResult<void>::err(
                GatewayError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::ThreadError,
                         std::string("job execution failed: ") + e.what()));
    }
    return GatewayResult<void>::ok();
}

// ---------------------------------------------------------------------------
// cancel()
// ---------------------------------------------------------------------------
GatewayResult<void> JobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto flagIt = impl_->cancelFlags.find(id);
    if (flagIt == impl_->cancelFlags.end()) {
        for (auto& tick : impl_->tickJobs) {
            if (tick.id == id) {
                tick.enabled = false;
                return GatewayResult<void>::ok();
            }
        }
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::JobNotFound, "job not found"));
    }

    auto futIt = impl_->futures.find(id);
    if (futIt != impl_->futures.end() &&
        futIt->second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return GatewayResult<void>::err(
            GatewayError(ErrorCode::JobCancelled, "job already completed"));
    }

    flagIt->second->store(true, std::memory_order_release);
    return GatewayResult<void>::ok();
}

// ---------------------------------------------------------------------------
// shutdown() / pendingJobs()
// ---------------------------------------------------------------------------
void JobScheduler::shutdown() {
    if (impl_->stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

std::size_t JobScheduler::pendingJobs() const {
    std::lock_guard lock(impl_->mutex);
    std::size_t pending = 0;
    for (const auto& [id, future] : impl_->futures) {
        if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++pending;
        }
    }
    return pending;
}

} // namespace gcb::foundation
