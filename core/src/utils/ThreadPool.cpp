#include "utils/ThreadPool.h"

#include <algorithm>

namespace helio {

ThreadPool::ThreadPool(std::size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }

    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    batch_ready_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::vector<std::exception_ptr> ThreadPool::parallel_for(std::size_t count, const IndexBody& body) {
    if (count == 0) {
        return {};
    }

    std::lock_guard<std::mutex> serial(submit_mutex_);
    auto batch = std::make_shared<Batch>(count, body);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = batch;
        ++batch_serial_;
    }
    batch_ready_.notify_all();

    {
        std::unique_lock<std::mutex> lock(mutex_);
        batch_done_.wait(lock, [&batch]() { return batch->finished == batch->count; });
        current_.reset();
    }
    return std::move(batch->errors);
}

void ThreadPool::worker_loop() {
    std::uint64_t seen = 0;
    for (;;) {
        std::shared_ptr<Batch> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            batch_ready_.wait(lock, [&]() { return shutdown_ || (current_ && batch_serial_ != seen); });
            if (shutdown_) {
                return;
            }
            seen = batch_serial_;
            batch = current_;
        }
        drain(*batch);
    }
}

void ThreadPool::drain(Batch& batch) {
    std::size_t done = 0;
    // A worker that wakes after the batch finished claims nothing and never touches body
    for (std::size_t i = batch.cursor.fetch_add(1); i < batch.count; i = batch.cursor.fetch_add(1)) {
        try {
            (*batch.body)(i);
        } catch (...) {
            batch.errors[i] = std::current_exception();
        }
        ++done;
    }
    if (done == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    batch.finished += done;
    if (batch.finished == batch.count) {
        batch_done_.notify_all();
    }
}

}  // namespace helio
