#include <gtest/gtest.h>
#include <job_system/job_system.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

enum class TestJobType {
    RELABEL,
    WALK
};

class JobSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        job_system = std::make_unique<job_system::JobSystem<TestJobType>>(4);
    }

    void TearDown() override {
        job_system->shutdown();
        job_system.reset();
    }

    std::unique_ptr<job_system::JobSystem<TestJobType>> job_system;
};

TEST_F(JobSystemTest, BasicJobExecution) {
    std::atomic<int> counter{0};

    job_system->start();

    auto job = job_system::make_job([&counter]() {
        counter.fetch_add(1);
    }, TestJobType::RELABEL);

    job_system->submit(std::move(job));
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 1);
}

TEST_F(JobSystemTest, MultipleJobsExecution) {
    std::atomic<int> counter{0};
    const int num_jobs = 100;

    job_system->start();

    for (int i = 0; i < num_jobs; ++i) {
        job_system->submit_function([&counter]() {
            counter.fetch_add(1);
        }, TestJobType::WALK);
    }

    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
    EXPECT_EQ(job_system->get_statistics().total_jobs_executed, static_cast<std::size_t>(num_jobs));
}

TEST_F(JobSystemTest, BothScheduleModesRunEveryJob) {
    std::vector<int> execution_order;
    std::mutex order_mutex;

    job_system->start();

    for (int i = 0; i < 20; ++i) {
        auto mode = (i % 2 == 0) ? job_system::ScheduleMode::LIFO : job_system::ScheduleMode::FIFO;
        job_system->submit(job_system::make_job([&execution_order, &order_mutex, i]() {
            std::lock_guard<std::mutex> lock(order_mutex);
            execution_order.push_back(i);
        }, TestJobType::WALK), mode);
    }

    job_system->wait_for_completion();

    EXPECT_EQ(execution_order.size(), 20u);
}

TEST_F(JobSystemTest, WaitWithoutJobsReturns) {
    job_system->start();
    job_system->wait_for_completion();
    SUCCEED();
}

TEST_F(JobSystemTest, WaitIsABarrierBetweenPhases) {
    const int per_phase = 64;
    std::vector<int> phase_one(per_phase, 0);
    std::atomic<int> mismatches{0};

    job_system->start();

    for (int i = 0; i < per_phase; ++i) {
        job_system->submit_function([&phase_one, i]() {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            phase_one[i] = i + 1;
        }, TestJobType::RELABEL);
    }
    job_system->wait_for_completion();

    for (int i = 0; i < per_phase; ++i) {
        job_system->submit_function([&phase_one, &mismatches, i]() {
            if (phase_one[i] != i + 1) mismatches.fetch_add(1);
        }, TestJobType::RELABEL);
    }
    job_system->wait_for_completion();

    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(JobSystemTest, JobsCanSubmitJobs) {
    std::atomic<int> counter{0};

    job_system->start();

    for (int i = 0; i < 10; ++i) {
        job_system->submit_function([this, &counter]() {
            counter.fetch_add(1);
            job_system->submit_function([&counter]() {
                counter.fetch_add(1);
            }, TestJobType::WALK);
        }, TestJobType::WALK);
    }

    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 20);
}

TEST_F(JobSystemTest, ExceptionPropagatesToWaiter) {
    job_system->start();

    job_system->submit_function([]() {
        throw std::runtime_error("job failed");
    }, TestJobType::WALK);

    EXPECT_THROW(job_system->wait_for_completion(), std::runtime_error);
}

TEST_F(JobSystemTest, ReusableAfterError) {
    job_system->start();

    for (int i = 0; i < 50; ++i) {
        job_system->submit_function([i]() {
            if (i == 3) throw std::invalid_argument("bad input");
        }, TestJobType::WALK);
    }
    EXPECT_THROW(job_system->wait_for_completion(), std::invalid_argument);

    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) {
        job_system->submit_function([&counter]() {
            counter.fetch_add(1);
        }, TestJobType::WALK);
    }
    EXPECT_NO_THROW(job_system->wait_for_completion());
    EXPECT_EQ(counter.load(), 10);
}

TEST_F(JobSystemTest, SubmitWhenStoppedThrows) {
    EXPECT_THROW(job_system->submit_function([]() {}, TestJobType::WALK), std::runtime_error);
}

TEST_F(JobSystemTest, RestartAfterShutdown) {
    std::atomic<int> counter{0};

    job_system->start();
    job_system->submit_function([&counter]() { counter.fetch_add(1); }, TestJobType::WALK);
    job_system->wait_for_completion();
    job_system->shutdown();
    EXPECT_FALSE(job_system->is_running());

    job_system->start();
    job_system->submit_function([&counter]() { counter.fetch_add(1); }, TestJobType::WALK);
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 2);
}

TEST_F(JobSystemTest, UnevenLoadCompletes) {
    std::atomic<int> counter{0};
    const int num_jobs = 40;

    job_system->start();

    for (int i = 0; i < num_jobs; ++i) {
        job_system->submit_function([&counter, i]() {
            // Every eighth job is slow so idle workers have to steal
            if (i % 8 == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            counter.fetch_add(1);
        }, TestJobType::RELABEL);
    }

    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
}
