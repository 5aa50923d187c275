#include "mapreducer/job_queue.hpp"

#include <stdexcept>

namespace mapreducer {

JobQueue::JobQueue(std::size_t concurrency, std::size_t interval_cap, Duration interval)
    : concurrency_(concurrency)
    , interval_cap_(interval_cap)
    , interval_(interval)
{
    if (concurrency_ == 0) {
        throw std::invalid_argument("JobQueue concurrency must be positive");
    }
    if (interval_cap_ == 0) {
        throw std::invalid_argument("JobQueue interval_cap must be positive");
    }
    if (interval_ <= Duration::zero()) {
        throw std::invalid_argument("JobQueue interval must be positive");
    }

    workers_.reserve(concurrency_);
    for (std::size_t i = 0; i < concurrency_; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

JobQueue::~JobQueue() {
    stop();
}

JobId JobQueue::enqueue(Job job) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopping_) {
        lock.unlock();
        job.fail(std::make_exception_ptr(CancelledException("Job queue stopped")));
        return 0;
    }
    JobId id = next_job_id_++;
    job.id = id;
    MonitorEvent event = job.context;
    jobs_.push_back(std::move(job));
    std::size_t depth = jobs_.size();
    auto monitor = monitor_;
    lock.unlock();

    cv_.notify_one();

    event.type = EventType::JobSubmitted;
    event.message = "Job " + std::to_string(id) + " queued";
    event.count = depth;
    emit(monitor, event);
    return id;
}

std::size_t JobQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

std::size_t JobQueue::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t JobQueue::started_in_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_in_interval_;
}

std::size_t JobQueue::concurrency() const noexcept { return concurrency_; }
std::size_t JobQueue::interval_cap() const noexcept { return interval_cap_; }
Duration JobQueue::interval() const noexcept { return interval_; }

void JobQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && running_ == 0; });
}

std::size_t JobQueue::cancel_pending() {
    std::deque<Job> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled.swap(jobs_);
    }
    for (auto& job : cancelled) {
        job.fail(std::make_exception_ptr(CancelledException()));
    }
    idle_cv_.notify_all();
    return cancelled.size();
}

void JobQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cancel_pending();
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void JobQueue::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(mutex_);
    monitor_ = std::move(monitor);
}

void JobQueue::roll_interval(Timestamp now) {
    if (now - interval_start_ >= interval_) {
        interval_start_ = now;
        started_in_interval_ = 0;
    }
}

void JobQueue::worker_loop() {
    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);

        // Wait for a job that both caps allow to start.
        while (true) {
            if (stopping_) return;
            if (jobs_.empty()) {
                cv_.wait(lock);
                continue;
            }
            roll_interval(Clock::now());
            if (started_in_interval_ < interval_cap_) break;
            cv_.wait_until(lock, interval_start_ + interval_);
        }

        Job job = std::move(jobs_.front());
        jobs_.pop_front();
        ++started_in_interval_;
        ++running_;
        std::size_t in_interval = started_in_interval_;
        auto monitor = monitor_;
        lock.unlock();

        MonitorEvent started = job.context;
        started.type = EventType::JobStarted;
        started.message = "Job " + std::to_string(job.id) + " started";
        started.count = in_interval;
        emit(monitor, started);

        job.run();

        MonitorEvent finished = job.context;
        finished.type = EventType::JobFinished;
        finished.message = "Job " + std::to_string(job.id) + " finished";
        emit(monitor, finished);

        lock.lock();
        --running_;
        bool idle = jobs_.empty() && running_ == 0;
        lock.unlock();
        if (idle) {
            idle_cv_.notify_all();
        }
    }
}

} // namespace mapreducer
