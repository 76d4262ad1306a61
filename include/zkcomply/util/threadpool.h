// ZKCOMPLY - Thread Pool
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Fixed-size worker pool with future-based result retrieval. Exceptions
// thrown by a task are captured in its future.

#ifndef ZKCOMPLY_UTIL_THREADPOOL_H
#define ZKCOMPLY_UTIL_THREADPOOL_H

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace zkcomply {
namespace util {

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * A thread pool for executing tasks asynchronously.
 *
 * Tasks run in submission order. Destruction drains nothing: pending tasks
 * that have not started are dropped and their futures report broken_promise.
 */
class ThreadPool {
public:
    /// Configuration
    struct Config {
        size_t numThreads{0};       // 0 = hardware concurrency
        size_t maxQueueSize{10000}; // Maximum pending tasks
        std::string name{"pool"};   // Pool name for logging
    };
    
    /// Create with default configuration
    ThreadPool();
    
    /// Create with specified number of threads
    explicit ThreadPool(size_t numThreads);
    
    /// Create with configuration
    explicit ThreadPool(const Config& config);
    
    /// Destructor (joins workers)
    ~ThreadPool();
    
    // Non-copyable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    
    /// Block until the queue is empty and no task is executing
    void Wait();
    
    /// Stop workers and discard pending tasks
    void Shutdown();
    
    bool IsRunning() const { return running_.load(); }
    
    size_t ThreadCount() const { return workers_.size(); }
    
    size_t PendingTasks() const;
    
    size_t ActiveTasks() const { return activeTasks_.load(); }
    
    /**
     * Submit a task for execution.
     *
     * @throws std::runtime_error if the pool is stopped or the queue is full
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type> {
        
        using ReturnType = typename std::invoke_result<F, Args...>::type;
        
        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        
        std::future<ReturnType> result = task->get_future();
        
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            
            if (!running_.load()) {
                throw std::runtime_error("ThreadPool not running");
            }
            
            if (tasks_.size() >= config_.maxQueueSize) {
                throw std::runtime_error("ThreadPool queue full");
            }
            
            tasks_.emplace([task]() { (*task)(); });
        }
        
        condition_.notify_one();
        return result;
    }

private:
    Config config_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    
    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitCondition_;
    
    std::atomic<bool> running_{false};
    std::atomic<size_t> activeTasks_{0};
    
    void Start();
    void WorkerLoop();
};

// ============================================================================
// Future Helpers
// ============================================================================

/// Wait for every future and collect the results in order
template<typename T>
std::vector<T> WaitAll(std::vector<std::future<T>>& futures) {
    std::vector<T> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

} // namespace util
} // namespace zkcomply

#endif // ZKCOMPLY_UTIL_THREADPOOL_H
