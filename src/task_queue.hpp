#pragma once
#include <string>
#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <cstdint>

namespace memora {

// Identity of a background task, e.g. {session id, turn}. Carried through
// to the logs so overlapping work for one key can be recognised; the queue
// itself does not deduplicate.
struct TaskId {
    std::string key;
    uint64_t sequence = 0;

    std::string label() const { return key + "#" + std::to_string(sequence); }
};

// Bounded FIFO worker pool for fire-and-forget work.
//
// Contract: at-most-once attempt, best-effort delivery. An accepted task
// runs exactly once unless the process dies first; a task that throws is
// logged and counted, never retried, never rethrown to the submitter.
// submit() refuses work when the queue is full or shut down.
class TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue(size_t workers, size_t capacity);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Returns false (and logs) when the task was not accepted.
    bool submit(TaskId id, Task task);

    // Block until nothing is queued or running.
    void wait_idle();

    // Run what is already queued, then join the workers. Idempotent.
    void shutdown();

    size_t pending() const;
    size_t workers() const { return threads_.size(); }
    size_t capacity() const { return capacity_; }

    uint64_t completed() const { return completed_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t rejected() const { return rejected_.load(); }

private:
    struct Job {
        TaskId id;
        Task task;
    };

    void worker();
    void run(Job& job);

    std::vector<std::thread> threads_;
    std::deque<Job> jobs_;
    size_t capacity_;
    size_t active_ = 0;
    bool stop_ = false;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace memora
