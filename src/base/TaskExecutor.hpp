//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_TASKEXECUTOR_HPP
#define FIELDREL_TASKEXECUTOR_HPP

#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fieldrel {
    /**
     * @brief fixed-size worker pool.
     *        tasks posted after shutdown() are rejected; tasks already queued are drained before the workers exit.
     */
    class TaskExecutor {
    public:
        explicit TaskExecutor(int size):
            _isRunning(true)
        {
            if (size <= 0) {
                throw std::invalid_argument("TaskExecutor requires at least one worker");
            }

            for (int i = 0; i < size; i++) {
                _workers.emplace_back(&TaskExecutor::workerLoop, this);
            }
        }

        TaskExecutor(const TaskExecutor &) = delete;
        TaskExecutor &operator=(const TaskExecutor &) = delete;

        ~TaskExecutor() {
            shutdown();
        }

        /**
         * @note an exception thrown by workerFn is forwarded to the returned promise
         */
        template <typename T>
        std::shared_ptr<std::promise<T>> post(std::function<T()> workerFn) {
            auto promise = std::make_shared<std::promise<T>>();

            {
                std::lock_guard lockGuard(_mutex);
                if (!_isRunning) {
                    throw std::runtime_error("TaskExecutor is already shut down");
                }

                auto wrapperFn = [workerFn = std::move(workerFn), promise]() {
                    try {
                        promise->set_value(workerFn());
                    } catch (...) {
                        promise->set_exception(std::current_exception());
                    }
                };
                _tasks.push(std::move(wrapperFn));
            }
            _condvar.notify_one();

            return promise;
        }

        size_t size() const {
            return _workers.size();
        }

        void shutdown() {
            {
                std::lock_guard lockGuard(_mutex);
                if (!_isRunning) {
                    return;
                }
                _isRunning = false;
            }
            _condvar.notify_all();

            for (auto &worker: _workers) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

    private:
        void workerLoop() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock lock(_mutex);
                    _condvar.wait(lock, [this] { return !_tasks.empty() || !_isRunning; });

                    if (!_isRunning && _tasks.empty()) {
                        return;
                    }

                    task = std::move(_tasks.front());
                    _tasks.pop();
                }
                task();
            }
        }

        bool _isRunning;

        std::queue<std::function<void()>> _tasks;
        std::vector<std::thread> _workers;
        std::mutex _mutex;
        std::condition_variable _condvar;
    };
}


#endif //FIELDREL_TASKEXECUTOR_HPP
