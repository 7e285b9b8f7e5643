#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace jellyvr::adapters::secondary {

/**
 * @brief Фиксированный пул потоков для исходящих HTTP запросов
 *
 * Не больше workers задач выполняется и не больше maxQueued ждёт в очереди.
 * Сверх этого trySubmit() сразу возвращает std::nullopt.
 * Потоки создаются при первой задаче.
 *
 * shutdown() выбрасывает ещё не начатые задачи (их future получают
 * broken_promise) и ждёт завершения уже выполняющихся.
 *
 * Thread-safe: да
 */
class RequestExecutor {
public:
    RequestExecutor(size_t workers, size_t maxQueued)
        : workerCount_(workers > 0 ? workers : 1)
        , maxQueued_(maxQueued)
    {}

    ~RequestExecutor() {
        shutdown();
    }

    RequestExecutor(const RequestExecutor&) = delete;
    RequestExecutor& operator=(const RequestExecutor&) = delete;

    std::optional<std::future<void>> trySubmit(std::function<void()> task) {
        std::packaged_task<void()> packaged(std::move(task));
        auto future = packaged.get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return std::nullopt;
            }
            if (busy_ + queue_.size() >= workerCount_ + maxQueued_) {
                return std::nullopt;
            }
            if (workers_.empty()) {
                for (size_t i = 0; i < workerCount_; ++i) {
                    workers_.emplace_back([this]() { runLoop(); });
                }
            }
            queue_.push(std::move(packaged));
        }
        condVar_.notify_one();
        return future;
    }

    void shutdown() {
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return;
            }
            shutdown_ = true;
            std::queue<std::packaged_task<void()>>().swap(queue_);
            workers.swap(workers_);
        }
        condVar_.notify_all();

        if (!workers.empty()) {
            std::cout << "[RequestExecutor] Waiting for " << workers.size() << " workers..." << std::endl;
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    /// Выполняющиеся + ждущие в очереди
    size_t inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return busy_ + queue_.size();
    }

    size_t capacity() const { return workerCount_ + maxQueued_; }

private:
    const size_t workerCount_;
    const size_t maxQueued_;

    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    std::queue<std::packaged_task<void()>> queue_;
    std::vector<std::thread> workers_;
    size_t busy_ = 0;
    bool shutdown_ = false;

    void runLoop() {
        while (true) {
            std::packaged_task<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });
                if (shutdown_) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop();
                ++busy_;
            }

            // Исключение задачи попадает в её future
            task();

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --busy_;
            }
        }
    }
};

} // namespace jellyvr::adapters::secondary
