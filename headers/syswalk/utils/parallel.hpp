//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef SYSWALK_PARALLEL_HPP
#define SYSWALK_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Thread pool and order-preserving parallel map.
 *
 * Used by the graph builder to extract references from many files at
 * once. map() returns results in input order, so merging them
 * sequentially afterwards gives the same graph for any thread count.
 */

#include <vector>
#include <future>
#include <thread>
#include <queue>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <type_traits>

namespace syswalk::parallel {

    /**
     * Returns the number of hardware threads, or 1 if detection fails.
     */
    inline unsigned int hardware_concurrency() noexcept {
        unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    /**
     * Upper bound for pool sizes requested by callers.
     */
    inline unsigned int max_pool_size() noexcept {
        return hardware_concurrency() * 4;
    }

    class ThreadPool {
    public:
        /**
         * @param num_threads Number of worker threads (0 = auto-detect).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            try {
                for (unsigned int i = 0; i < num_threads; ++i) {
                    workers_.emplace_back([this] {
                        worker_loop();
                    });
                }
            } catch (...) {
                // A joinable std::thread terminates the process when destroyed
                shut_down();
                throw;
            }
        }

        ~ThreadPool() {
            shut_down();
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void shut_down() noexcept {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Maps f over items on the pool. Results keep the input order.
     */
    template<typename T, typename F>
    auto map(const std::vector<T>& items, F&& f, ThreadPool& pool)
        -> std::vector<std::invoke_result_t<F, const T&>> {
        using ResultType = std::invoke_result_t<F, const T&>;

        std::vector<std::future<ResultType>> futures;
        futures.reserve(items.size());

        for (const auto& item : items) {
            futures.push_back(pool.submit([&f, &item]() {
                return f(item);
            }));
        }

        std::vector<ResultType> results;
        results.reserve(items.size());

        for (auto& future : futures) {
            results.push_back(future.get());
        }

        return results;
    }

}  // namespace syswalk::parallel

#endif //SYSWALK_PARALLEL_HPP
