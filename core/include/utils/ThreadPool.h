#ifndef HELIOSTRATEGY_THREAD_POOL_H
#define HELIOSTRATEGY_THREAD_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace helio {

/**
 * @brief Fixed set of workers that evaluates index batches, one batch at a time.
 *
 * A batch is a body invoked once for every index in [0, count). Workers claim
 * indices from a shared cursor, so a slow simulation never holds up the rest of
 * the generation. parallel_for() blocks until every index has finished and
 * reports failures per index instead of stopping at the first one.
 */
class ThreadPool {
public:
    using IndexBody = std::function<void(std::size_t)>;

    /**
     * @param num_threads Worker count; 0 selects hardware_concurrency().
     */
    explicit ThreadPool(std::size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    /**
     * @brief Run body(i) for every i in [0, count) on the workers and wait.
     *
     * @return One entry per index: null on success, otherwise the exception
     *         body(i) threw. Concurrent callers are serialized.
     */
    std::vector<std::exception_ptr> parallel_for(std::size_t count, const IndexBody& body);

private:
    struct Batch {
        Batch(std::size_t n, const IndexBody& fn) : count(n), body(&fn), errors(n) {}

        const std::size_t count;
        const IndexBody* body;
        std::vector<std::exception_ptr> errors;
        std::atomic<std::size_t> cursor{0};
        std::size_t finished = 0;  // guarded by mutex_
    };

    void worker_loop();
    void drain(Batch& batch);

    std::vector<std::thread> workers_;

    std::mutex submit_mutex_;
    std::mutex mutex_;
    std::condition_variable batch_ready_;
    std::condition_variable batch_done_;
    std::shared_ptr<Batch> current_;
    std::uint64_t batch_serial_ = 0;
    bool shutdown_ = false;
};

}  // namespace helio

#endif  // HELIOSTRATEGY_THREAD_POOL_H
