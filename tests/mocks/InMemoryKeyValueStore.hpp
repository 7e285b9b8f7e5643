#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include "domain/Errors.hpp"
#include <unordered_map>
#include <mutex>
#include <atomic>

namespace jellyvr::tests::mocks {

/**
 * @brief In-Memory key-value хранилище для unit-тестов
 *
 * Тот же контракт compareAndSwap, что и у PostgresKeyValueStore.
 * setUnavailable(true) имитирует недоступную БД.
 */
class InMemoryKeyValueStore : public ports::output::IKeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkAvailable();
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        return it->second;
    }

    void put(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkAvailable();
        data_[key] = value;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkAvailable();
        return data_.erase(key) > 0;
    }

    ports::output::CasResult compareAndSwap(
        const std::string& key,
        const std::optional<std::string>& expected,
        const std::string& desired
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkAvailable();
        ++casCalls_;

        auto it = data_.find(key);
        if (!expected) {
            if (it != data_.end()) return ports::output::CasResult::CONFLICT;
            data_[key] = desired;
            return ports::output::CasResult::SWAPPED;
        }
        if (it == data_.end() || it->second != *expected) {
            return ports::output::CasResult::CONFLICT;
        }
        it->second = desired;
        return ports::output::CasResult::SWAPPED;
    }

    // Test helpers
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    size_t countPrefix(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& [key, value] : data_) {
            if (key.compare(0, prefix.size(), prefix) == 0) ++count;
        }
        return count;
    }

    int casCalls() const { return casCalls_.load(); }

    void setUnavailable(bool unavailable) { unavailable_ = unavailable; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }

private:
    void checkAvailable() const {
        if (unavailable_) {
            throw domain::StoreUnavailableError("connection refused");
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;
    std::atomic<int> casCalls_{0};
    std::atomic<bool> unavailable_{false};
};

} // namespace jellyvr::tests::mocks
