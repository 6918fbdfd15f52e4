#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @class WorkerPool
 * @brief Fixed set of threads running queued jobs in submission order.
 *
 * submit() hands back a future, so a caller can park on a blocking probe
 * running here while its own thread stays free of socket work. Jobs still
 * queued when the pool is destroyed are run before the threads exit.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads) {
        if (num_threads == 0) num_threads = 1;
        threads_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            threads_.emplace_back(&WorkerPool::run, this);
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closing_ = true;
        }
        wake_.notify_all();
        for (std::thread& thread : threads_) thread.join();
    }

    /**
     * @brief Queues @p fn; exceptions it throws surface from future::get().
     * @throws std::runtime_error if the pool is shutting down.
     */
    template<typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        std::packaged_task<std::invoke_result_t<Fn>()> task(std::forward<Fn>(fn));
        auto future = task.get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closing_) throw std::runtime_error("submit on stopped WorkerPool");
            jobs_.emplace_back([task = std::move(task)]() mutable { task(); });
        }
        wake_.notify_one();
        return future;
    }

    size_t size() const { return threads_.size(); }

private:
    void run() {
        for (;;) {
            std::packaged_task<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait(lock, [this] { return closing_ || !jobs_.empty(); });
                if (jobs_.empty()) return;
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

    std::deque<std::packaged_task<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool closing_ = false;
    std::vector<std::thread> threads_;
};

#endif // WORKER_POOL_HPP
