#include "core/task_queue.hpp"
#include "utils/logging.hpp"

namespace meetscribe {
namespace core {

TaskQueue::TaskQueue(size_t capacity) : capacity_(capacity), shutdown_(false) {
}

TaskQueue::~TaskQueue() {
    shutdown();
}

bool TaskQueue::enqueue(std::shared_ptr<Task> task) {
    if (!task) {
        return false;
    }

    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return shutdown_ || capacity_ == 0 || queue_.size() < capacity_;
        });
        if (shutdown_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

bool TaskQueue::enqueue(std::function<void()> func) {
    return enqueue(std::make_shared<FunctionTask>(std::move(func)));
}

bool TaskQueue::tryEnqueue(std::shared_ptr<Task> task) {
    if (!task) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_ || (capacity_ != 0 && queue_.size() >= capacity_)) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

std::shared_ptr<Task> TaskQueue::dequeue() {
    std::shared_ptr<Task> task;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return nullptr;
        }

        task = std::move(queue_.front());
        queue_.pop_front();
    }
    not_full_.notify_one();
    return task;
}

std::shared_ptr<Task> TaskQueue::tryDequeue() {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return nullptr;
        }
        task = std::move(queue_.front());
        queue_.pop_front();
    }
    not_full_.notify_one();
    return task;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t TaskQueue::clear() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = queue_.size();
        queue_.clear();
    }
    not_full_.notify_all();
    return dropped;
}

void TaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool TaskQueue::isShuttingDown() const {
    return shutdown_;
}

// ThreadPool implementation

ThreadPool::ThreadPool(size_t num_threads, std::string name)
    : num_threads_(num_threads), name_(std::move(name)), running_(false) {
    if (num_threads_ == 0) {
        num_threads_ = 1;
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::start(std::shared_ptr<TaskQueue> task_queue) {
    if (running_ || !task_queue) {
        return;
    }

    task_queue_ = std::move(task_queue);
    running_ = true;

    workers_.reserve(num_threads_);
    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }
    utils::Logger::debug("ThreadPool '" + name_ + "' started with " +
                         std::to_string(num_threads_) + " threads");
}

void ThreadPool::stop() {
    if (!running_) {
        return;
    }

    if (task_queue_) {
        task_queue_->shutdown();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    running_ = false;
    workers_.clear();
    task_queue_.reset();
    utils::Logger::debug("ThreadPool '" + name_ + "' stopped");
}

void ThreadPool::workerLoop() {
    while (true) {
        // Returns nullptr only after shutdown with nothing left to run
        auto task = task_queue_->dequeue();
        if (!task) {
            break;
        }

        try {
            task->execute();
        } catch (const std::exception& e) {
            utils::Logger::error("ThreadPool '" + name_ + "' task failed: " + std::string(e.what()));
        }
    }
}

} // namespace core
} // namespace meetscribe
