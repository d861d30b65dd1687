#ifndef CUTOUT_WORKERPOOL_HPP
#define CUTOUT_WORKERPOOL_HPP

#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace cutout {

/**
 * @brief Thrown by WorkerPool::submit when the backlog is full
 */
class PoolSaturated : public std::runtime_error {
public:
    explicit PoolSaturated(size_t max_pending)
        : std::runtime_error("Worker pool backlog is full (" +
                             std::to_string(max_pending) + " pending)") {}
};

/**
 * @brief Fixed-size FIFO worker pool with a bounded backlog
 *
 * Request handlers hand their pipeline invocation to the pool and wait on
 * the returned future with a deadline. A caller that gives up on the future
 * does not cancel the task: it runs to completion on its worker and its
 * result is dropped together with the shared state.
 *
 * Example usage:
 * @code
 *   WorkerPool pool(4, 64);
 *   auto future = pool.submit([]() { return 42; });
 *   if (future.wait_for(std::chrono::seconds(5)) == std::future_status::ready) {
 *       int result = future.get();
 *   }
 * @endcode
 */
class WorkerPool {
public:
    /**
     * @brief Construct pool with the given number of workers
     * @param num_threads Number of worker threads
     * @param max_pending Maximum queued (not yet running) tasks, 0 = unbounded
     * @throws std::invalid_argument if num_threads is 0
     */
    explicit WorkerPool(size_t num_threads, size_t max_pending = 0);

    /**
     * @brief Destructor - drains queued tasks, then joins the workers
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Queue a callable for execution
     *
     * @return Future for the callable's result; exceptions thrown by the
     *         callable are rethrown from future.get()
     * @throws PoolSaturated if max_pending tasks are already queued
     * @throws std::runtime_error if the pool is shutting down
     */
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    size_t size() const noexcept { return workers_.size(); }

    size_t max_pending() const noexcept { return max_pending_; }

    /**
     * @brief Number of tasks queued but not yet picked up by a worker
     */
    size_t pending() const;

private:
    void worker_thread();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;

    size_t max_pending_;
    bool stop_;
};

// Implementation (header-only for template support)

inline WorkerPool::WorkerPool(size_t num_threads, size_t max_pending)
    : max_pending_(max_pending), stop_(false)
{
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool size must be greater than 0");
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_thread(); });
    }
}

inline WorkerPool::~WorkerPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

template<typename F, typename... Args>
auto WorkerPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (stop_) {
            throw std::runtime_error("Cannot submit task to stopped WorkerPool");
        }
        if (max_pending_ != 0 && tasks_.size() >= max_pending_) {
            throw PoolSaturated(max_pending_);
        }

        tasks_.emplace_back([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

inline size_t WorkerPool::pending() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

inline void WorkerPool::worker_thread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            // Exit only once the queue is drained
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        task();
    }
}

} // namespace cutout

#endif // CUTOUT_WORKERPOOL_HPP
