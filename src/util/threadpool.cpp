// ZKCOMPLY - Thread Pool Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/util/threadpool.h"

namespace zkcomply {
namespace util {

// ============================================================================
// ThreadPool Implementation
// ============================================================================

ThreadPool::ThreadPool() : ThreadPool(Config{}) {}

ThreadPool::ThreadPool(size_t numThreads) {
    config_.numThreads = numThreads;
    Start();
}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    Start();
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Start() {
    if (running_.exchange(true)) {
        return;
    }
    
    size_t numThreads = config_.numThreads;
    if (numThreads == 0) {
        numThreads = std::thread::hardware_concurrency();
        if (numThreads == 0) {
            numThreads = 2;
        }
    }
    
    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerLoop, this);
    }
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    waitCondition_.wait(lock, [this] {
        return tasks_.empty() && activeTasks_.load() == 0;
    });
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    
    condition_.notify_all();
    
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    
    std::queue<std::function<void()>> empty;
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        std::swap(tasks_, empty);
    }
    waitCondition_.notify_all();
}

size_t ThreadPool::PendingTasks() const {
    std::unique_lock<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void ThreadPool::WorkerLoop() {
    while (true) {
        std::function<void()> task;
        
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            
            condition_.wait(lock, [this] {
                return !running_.load() || !tasks_.empty();
            });
            
            if (!running_.load()) {
                return;
            }
            
            task = std::move(tasks_.front());
            tasks_.pop();
            activeTasks_.fetch_add(1);
        }
        
        // Tasks are packaged_task wrappers, so exceptions land in the future
        task();
        
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            activeTasks_.fetch_sub(1);
        }
        waitCondition_.notify_all();
    }
}

} // namespace util
} // namespace zkcomply
