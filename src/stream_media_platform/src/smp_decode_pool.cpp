#include <stream_media_platform/smp_decode_pool.h>
#include "smp_log.h"

namespace smp {

namespace {
constexpr int kSharedWorkers = 2;
}

DecodePool::DecodePool(int worker_count) {
    if (worker_count < 1) worker_count = 1;
    for (int i = 0; i < worker_count; ++i) {
        m_workers.emplace_back(&DecodePool::worker_loop, this);
    }
    SMP_LOG_DEBUG("DecodePool started with %d workers", worker_count);
}

DecodePool::~DecodePool() {
    m_shutdown.store(true);
    m_jobs_cv.notify_all();
    for (auto& w : m_workers) {
        if (w.joinable()) w.join();
    }
    m_workers.clear();

    // Unrun jobs release their promises here, which cancels the futures
    std::lock_guard<std::mutex> lock(m_jobs_mutex);
    m_jobs.clear();
}

DecodePool& DecodePool::Shared() {
    static DecodePool s_pool(kSharedWorkers);
    return s_pool;
}

void DecodePool::Submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        m_jobs.push_back(std::move(job));
    }
    m_jobs_cv.notify_one();
}

size_t DecodePool::QueuedJobs() const {
    std::lock_guard<std::mutex> lock(m_jobs_mutex);
    return m_jobs.size();
}

void DecodePool::worker_loop() {
    while (!m_shutdown.load()) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_jobs_mutex);
            m_jobs_cv.wait(lock, [this] {
                return m_shutdown.load() || !m_jobs.empty();
            });
            if (m_shutdown.load()) break;
            if (m_jobs.empty()) continue;

            job = std::move(m_jobs.front());
            m_jobs.pop_front();
        }
        job();
    }
}

} // namespace smp
