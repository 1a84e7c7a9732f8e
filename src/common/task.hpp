#ifndef SEQFLOW_COMMON_TASK_HPP
#define SEQFLOW_COMMON_TASK_HPP

#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace Seqflow {
    // Wait-group over a fixed set of worker threads. The first exception raised
    // by any worker is kept and rethrown by wait().
    class TaskGroup {
    public:
        TaskGroup() = default;
        TaskGroup(const TaskGroup&) = delete;
        TaskGroup& operator=(const TaskGroup&) = delete;

        ~TaskGroup() { join_(); }

        template <class Fn>
        void spawn(Fn fn)
        {
            workers_.emplace_back([this, fn = std::move(fn)]() mutable {
                try {
                    fn();
                } catch (...) {
                    record_(std::current_exception());
                }
            });
        }

        void wait()
        {
            join_();
            std::exception_ptr error;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                error = std::exchange(error_, nullptr);
            }
            if (error) {
                std::rethrow_exception(error);
            }
        }

    private:
        void join_() noexcept
        {
            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
            workers_.clear();
        }

        void record_(std::exception_ptr error)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!error_) {
                error_ = std::move(error);
            }
        }

        std::vector<std::thread> workers_{};
        std::mutex mutex_{};
        std::exception_ptr error_{};
    };
}

#endif // SEQFLOW_COMMON_TASK_HPP
