#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace job_system {

/**
 * Work-stealing thread pool.
 *
 * Jobs are distributed round-robin over per-worker deques; idle workers steal
 * half of a random victim's queue. wait_for_completion() is a barrier: it
 * returns once every submitted job has finished. The first exception thrown by
 * a job stops the workers from taking further work and is rethrown from
 * wait_for_completion() on the waiting thread.
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // Supports both LIFO and FIFO
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        bool stop = false;  // guarded by mutex
        std::atomic<std::size_t> jobs_executed{0};
        std::atomic<std::size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<std::size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    // Outstanding = submitted but not finished (or discarded after an error)
    std::size_t outstanding_ = 0;
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::exception_ptr first_error_;  // guarded by completion_mutex_
    std::atomic<bool> failed_{false};

    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        // Take from the front, the owner pops from the back
        std::size_t steal_count = std::max<std::size_t>(1, victim->tasks.size() / 2);
        stolen.reserve(steal_count);
        for (std::size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }
        return stolen;
    }

    void finish_jobs(std::size_t count) {
        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            outstanding_ -= count;
        }
        completion_cv_.notify_all();
    }

    void record_error(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            if (!first_error_) {
                first_error_ = error;
            }
        }
        failed_.store(true, std::memory_order_release);
    }

    // Drop everything still queued once a job has failed
    std::size_t discard_queued(WorkerData* data) {
        std::lock_guard<std::mutex> lock(data->mutex);
        std::size_t dropped = data->tasks.size();
        data->tasks.clear();
        return dropped;
    }

    void worker_loop(WorkerData* data) {
        std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<std::size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr<JobType> job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                if (data->tasks.empty() && !data->stop) {
                    lock.unlock();

                    for (std::size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                // Short timeout so that work pushed to other queues gets stolen
                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop || !data->tasks.empty();
                });

                if (data->stop && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (!job) {
                continue;
            }

            if (failed_.load(std::memory_order_acquire)) {
                finish_jobs(1 + discard_queued(data));
                continue;
            }

            try {
                job->execute();
            } catch (...) {
                record_error(std::current_exception());
            }
            data->jobs_executed.fetch_add(1);
            finish_jobs(1);
        }
    }

public:
    explicit JobSystem(std::size_t num_threads = 0) {
        std::size_t count = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (count == 0) count = 1;

        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    ~JobSystem() {
        shutdown();
    }

    void start() {
        if (is_running_.load()) return;

        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            outstanding_ = 0;
            first_error_ = nullptr;
        }
        failed_.store(false);

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop = false;
            }
            WorkerData* data = worker.get();
            worker->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop = true;
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            ++outstanding_;
        }

        std::size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        auto* worker = workers_[worker_idx].get();

        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type), mode);
    }

    /**
     * Block until every submitted job has finished.
     * Rethrows the first exception raised by a job; the error is cleared so
     * the system can be reused.
     */
    void wait_for_completion() {
        std::exception_ptr error;
        {
            std::unique_lock<std::mutex> lock(completion_mutex_);
            completion_cv_.wait(lock, [this] { return outstanding_ == 0; });
            error = first_error_;
            first_error_ = nullptr;
        }
        if (error) {
            failed_.store(false, std::memory_order_release);
            std::rethrow_exception(error);
        }
    }

    bool is_running() const {
        return is_running_.load();
    }

    struct SystemStatistics {
        std::size_t total_jobs_executed;
        std::size_t total_jobs_stolen;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->jobs_executed.load();
            stats.total_jobs_stolen += worker->jobs_stolen.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
