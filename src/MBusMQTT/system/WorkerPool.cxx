#include "system/WorkerPool.hxx"
#include "system/Logger.hxx"

namespace mbusMQTT
{
    static constexpr char TAG[] = "WorkerPool";

    WorkerPool::WorkerPool(const size_t threads) {
        const size_t count = std::max<size_t>(threads, 1);
        m_threads.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            m_threads.emplace_back(&WorkerPool::workerLoop, this);
        }
        MBUS_LOGD(TAG, "Started %zu workers", count);
    }

    WorkerPool::~WorkerPool() {
        shutdown();
    }

    bool WorkerPool::submit(Job job) {
        {
            std::lock_guard<std::mutex> lock(m_pool_mutex);
            if (m_stopping) {
                return false;
            }
            m_jobs.push_back(std::move(job));
        }
        m_job_cv.notify_one();
        return true;
    }

    bool WorkerPool::waitIdle(const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_pool_mutex);
        return m_idle_cv.wait_for(lock, timeout, [this] { return m_jobs.empty() && m_active == 0; });
    }

    void WorkerPool::shutdown() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_pool_mutex);
            if (m_stopping && m_threads.empty()) {
                return;
            }
            m_stopping = true;
            // Не начатые задания выбрасываются, ждём только выполняющиеся
            dropped = m_jobs.size();
            m_jobs.clear();
        }
        if (dropped > 0) {
            MBUS_LOGW(TAG, "Shutdown dropped %zu queued jobs", dropped);
        }
        m_job_cv.notify_all();
        m_idle_cv.notify_all();
        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        m_threads.clear();
    }

    size_t WorkerPool::pending() const {
        std::lock_guard<std::mutex> lock(m_pool_mutex);
        return m_jobs.size() + m_active;
    }

    void WorkerPool::workerLoop() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(m_pool_mutex);
                m_job_cv.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
                if (m_jobs.empty()) {
                    return;
                }
                job = std::move(m_jobs.front());
                m_jobs.pop_front();
                ++m_active;
            }

            try {
                job();
            } catch (const std::exception& e) {
                MBUS_LOGE(TAG, "Job failed: %s", e.what());
            }

            {
                std::lock_guard<std::mutex> lock(m_pool_mutex);
                --m_active;
                if (m_jobs.empty() && m_active == 0) {
                    m_idle_cv.notify_all();
                }
            }
        }
    }
} // mbusMQTT
