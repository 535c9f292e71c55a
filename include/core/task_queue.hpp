#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace meetscribe {
namespace core {

/**
 * Base task interface
 */
class Task {
public:
    virtual ~Task() = default;
    virtual void execute() = 0;
};

/**
 * Function-based task implementation
 */
class FunctionTask : public Task {
public:
    explicit FunctionTask(std::function<void()> func) : func_(std::move(func)) {}

    void execute() override {
        if (func_) {
            func_();
        }
    }

private:
    std::function<void()> func_;
};

/**
 * Thread-safe FIFO task queue with an optional capacity bound.
 * When bounded, enqueue() waits for space, which is how the pipeline
 * pushes backpressure upstream.
 */
class TaskQueue {
public:
    /**
     * @param capacity maximum queued tasks, 0 for unbounded
     */
    explicit TaskQueue(size_t capacity = 0);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;
    TaskQueue(TaskQueue&&) = delete;
    TaskQueue& operator=(TaskQueue&&) = delete;

    /**
     * Add a task, waiting while the queue is full.
     * @return false if the queue shut down before the task was accepted
     */
    bool enqueue(std::shared_ptr<Task> task);
    bool enqueue(std::function<void()> func);

    /**
     * Add a task only if there is room right now
     */
    bool tryEnqueue(std::shared_ptr<Task> task);

    /**
     * Get the next task (blocks if empty).
     * Returns nullptr once the queue is shut down and drained.
     */
    std::shared_ptr<Task> dequeue();

    /**
     * Get the next task without blocking, nullptr if empty
     */
    std::shared_ptr<Task> tryDequeue();

    size_t size() const;
    bool empty() const;
    size_t capacity() const { return capacity_; }

    /**
     * Drop all pending tasks
     * @return number of tasks dropped
     */
    size_t clear();

    /**
     * Stop accepting tasks and wake every waiter. Queued tasks can still be
     * dequeued.
     */
    void shutdown();
    bool isShuttingDown() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::shared_ptr<Task>> queue_;
    std::atomic<bool> shutdown_;
};

/**
 * Fixed-size thread pool draining a TaskQueue. The thread count is the
 * parallelism limit of whatever runs on it.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads, std::string name = "pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    void start(std::shared_ptr<TaskQueue> task_queue);

    /**
     * Shut the queue down, let workers finish the queued tasks and join them
     */
    void stop();

    size_t getNumThreads() const { return num_threads_; }
    bool isRunning() const { return running_; }

private:
    void workerLoop();

    size_t num_threads_;
    std::string name_;
    std::vector<std::thread> workers_;
    std::shared_ptr<TaskQueue> task_queue_;
    std::atomic<bool> running_;
};

} // namespace core
} // namespace meetscribe
