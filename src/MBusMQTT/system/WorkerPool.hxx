#ifndef MBUSMQTT_WORKERPOOL_HXX
#define MBUSMQTT_WORKERPOOL_HXX

namespace mbusMQTT
{
    // Fixed set of threads for blocking bus jobs
    class WorkerPool {
        public:
            using Job = std::function<void()>;

            explicit WorkerPool(size_t threads);
            ~WorkerPool();

            WorkerPool(const WorkerPool&) = delete;
            WorkerPool& operator=(const WorkerPool&) = delete;

            // false once shutdown has started
            bool submit(Job job);

            /**
             * @brief Wait until no job is queued or running.
             * @return false on timeout.
             */
            bool waitIdle(std::chrono::milliseconds timeout);

            // Stop accepting jobs, drop the queued ones, join the running ones
            void shutdown();

            [[nodiscard]] size_t pending() const;
            [[nodiscard]] size_t size() const { return m_threads.size(); }

        private:
            void workerLoop();

            std::vector<std::thread> m_threads;
            std::deque<Job> m_jobs;
            size_t m_active{0};
            bool m_stopping{false};
            mutable std::mutex m_pool_mutex;
            std::condition_variable m_job_cv;
            std::condition_variable m_idle_cv;
    };
} // mbusMQTT

#endif //MBUSMQTT_WORKERPOOL_HXX
