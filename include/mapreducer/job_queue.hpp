#pragma once

#include "mapreducer/exceptions.hpp"
#include "mapreducer/monitor.hpp"
#include "mapreducer/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace mapreducer {

using JobId = std::uint64_t;

// FIFO executor with two simultaneous admission caps:
//  - at most `concurrency` jobs running at once
//  - at most `interval_cap` jobs started per `interval`
// A job waits until both allow it to start. The interval begins with the
// first start after the previous interval expired.
class JobQueue {
public:
    JobQueue(std::size_t concurrency, std::size_t interval_cap, Duration interval);
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // Enqueue a job. Never blocks; the job's result or exception is
    // delivered through the returned future. `context` tags emitted events.
    template <typename Fn>
    std::future<std::invoke_result_t<Fn&>> submit(Fn fn, const MonitorEvent& context = MonitorEvent{});

    std::size_t pending() const;
    std::size_t running() const;
    std::size_t started_in_interval() const;

    std::size_t concurrency() const noexcept;
    std::size_t interval_cap() const noexcept;
    Duration interval() const noexcept;

    // Block until nothing is pending or running.
    void wait_idle();

    // Fail every job that has not started with CancelledException.
    // Returns the number of jobs removed.
    std::size_t cancel_pending();

    // Cancel pending jobs, let running ones finish, join the workers.
    void stop();

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    struct Job {
        JobId id{0};
        std::function<void()> run;
        std::function<void(std::exception_ptr)> fail;
        MonitorEvent context;
    };

    const std::size_t concurrency_;
    const std::size_t interval_cap_;
    const Duration interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    std::vector<std::thread> workers_;

    std::size_t running_{0};
    std::size_t started_in_interval_{0};
    Timestamp interval_start_{};
    bool stopping_{false};
    JobId next_job_id_{1};

    std::shared_ptr<Monitor> monitor_;

    JobId enqueue(Job job);
    void worker_loop();

    // Caller must hold mutex_. Starts a new interval if the current one expired.
    void roll_interval(Timestamp now);
};

template <typename Fn>
std::future<std::invoke_result_t<Fn&>> JobQueue::submit(Fn fn, const MonitorEvent& context) {
    using Result = std::invoke_result_t<Fn&>;

    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    Job job;
    job.context = context;
    job.run = [promise, fn = std::move(fn)]() mutable {
        try {
            if constexpr (std::is_void_v<Result>) {
                fn();
                promise->set_value();
            } else {
                promise->set_value(fn());
            }
        } catch (...) {
            // Delivered to the submitter through the future.
            promise->set_exception(std::current_exception());
        }
    };
    job.fail = [promise](std::exception_ptr error) {
        promise->set_exception(error);
    };

    enqueue(std::move(job));
    return future;
}

} // namespace mapreducer
