#pragma once

#include "ports/output/IProgressRelay.hpp"
#include "ports/output/IJellyfinGateway.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>

namespace jellyvr::application {

/**
 * @brief Фоновая пересылка событий воспроизведения в Jellyfin
 *
 * Очередь + один рабочий поток. enqueue() не блокируется на сети.
 * Ошибки Jellyfin логируются, задача не повторяется.
 * stop() дорабатывает уже поставленные задачи и ждёт поток.
 *
 * Thread-safe: да
 */
class ProgressRelayWorker : public ports::output::IProgressRelay {
public:
    explicit ProgressRelayWorker(std::shared_ptr<ports::output::IJellyfinGateway> jellyfin)
        : jellyfin_(std::move(jellyfin))
        , running_(false)
        , processed_(0)
        , failed_(0)
    {
        std::cout << "[ProgressRelayWorker] Created" << std::endl;
    }

    ~ProgressRelayWorker() override {
        stop();
    }

    ProgressRelayWorker(const ProgressRelayWorker&) = delete;
    ProgressRelayWorker& operator=(const ProgressRelayWorker&) = delete;

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = false;
        }
        workerThread_ = std::thread([this]() { runLoop(); });
        std::cout << "[ProgressRelayWorker] Started" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condVar_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[ProgressRelayWorker] Stopped" << std::endl;
    }

    void enqueue(ports::output::RelayTask task) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                std::cerr << "[ProgressRelayWorker] Dropped event for item " << task.itemId
                          << ": worker stopped" << std::endl;
                return;
            }
            queue_.push(std::move(task));
        }
        condVar_.notify_one();
    }

    bool isRunning() const { return running_.load(); }
    uint64_t processedCount() const { return processed_.load(); }
    uint64_t failedCount() const { return failed_.load(); }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    /**
     * @brief Выполнить одну задачу в текущем потоке
     */
    void process(const ports::output::RelayTask& task) {
        try {
            if (task.type == ports::output::RelayTask::Type::START) {
                jellyfin_->reportPlaybackStart(task.credentials, task.itemId,
                                               task.playSessionId, task.mediaSourceId);
            } else {
                jellyfin_->reportProgress(task.credentials, task.itemId, task.positionTicks,
                                          task.kind, task.playSessionId);
            }
            ++processed_;
        } catch (const std::exception& e) {
            ++failed_;
            std::cerr << "[ProgressRelayWorker] Relay failed for item " << task.itemId
                      << ": " << e.what() << std::endl;
        }
    }

private:
    std::shared_ptr<ports::output::IJellyfinGateway> jellyfin_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> processed_;
    std::atomic<uint64_t> failed_;
    std::thread workerThread_;

    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    std::queue<ports::output::RelayTask> queue_;
    bool shutdown_ = false;

    void runLoop() {
        while (true) {
            ports::output::RelayTask task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });
                if (queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop();
            }
            process(task);
        }
    }
};

} // namespace jellyvr::application
