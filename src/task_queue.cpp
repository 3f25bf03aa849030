#include "task_queue.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace memora {

TaskQueue::TaskQueue(size_t workers, size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {
    size_t n = std::max<size_t>(1, workers);
    threads_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::submit(TaskId id, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            rejected_++;
            std::cerr << "[tasks] Dropped " << id.label() << ": queue is shut down\n";
            return false;
        }
        if (jobs_.size() >= capacity_) {
            rejected_++;
            std::cerr << "[tasks] Dropped " << id.label() << ": queue full ("
                      << capacity_ << ")\n";
            return false;
        }
        jobs_.push_back(Job{std::move(id), std::move(task)});
    }
    work_cv_.notify_one();
    return true;
}

void TaskQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && active_ == 0; });
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }
    work_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void TaskQueue::run(Job& job) {
    try {
        job.task();
        completed_++;
    } catch (const std::exception& e) {
        failed_++;
        std::cerr << "[tasks] " << job.id.label() << " failed: " << e.what() << "\n";
    } catch (...) {
        failed_++;
        std::cerr << "[tasks] " << job.id.label() << " failed: unknown exception\n";
    }
}

void TaskQueue::worker() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stop_ || !jobs_.empty(); });

            // Drain before exiting so accepted work is still attempted once
            if (jobs_.empty()) return;

            job = std::move(jobs_.front());
            jobs_.pop_front();
            active_++;
        }

        run(job);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_--;
            if (jobs_.empty() && active_ == 0) idle_cv_.notify_all();
        }
    }
}

} // namespace memora
