#pragma once

#include <QFuture>
#include <QPromise>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace smp {

// Fixed pool of decode threads shared by every source buffer and duration
// probe. Jobs run FIFO; results travel back through QFuture so the owner
// receives them on its own thread via QFutureWatcher.
class DecodePool {
public:
    explicit DecodePool(int worker_count);
    ~DecodePool();

    DecodePool(const DecodePool&) = delete;
    DecodePool& operator=(const DecodePool&) = delete;

    // Process-wide pool, started on first use
    static DecodePool& Shared();

    void Submit(std::function<void()> job);

    // Run fn() on a worker; the future finishes with its return value.
    // A job dropped at shutdown leaves the future canceled.
    template<typename T, typename Fn>
    QFuture<T> Run(Fn fn) {
        auto promise = std::make_shared<QPromise<T>>();
        QFuture<T> future = promise->future();
        promise->start();
        Submit([promise, fn]() {
            promise->addResult(fn());
            promise->finish();
        });
        return future;
    }

    size_t QueuedJobs() const;

private:
    void worker_loop();

    std::vector<std::thread> m_workers;
    mutable std::mutex m_jobs_mutex;
    std::condition_variable m_jobs_cv;
    std::deque<std::function<void()>> m_jobs;
    std::atomic<bool> m_shutdown{false};
};

} // namespace smp
