#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include "settings/DbSettings.hpp"
#include "domain/Errors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace jellyvr::adapters::secondary {

/**
 * @brief Key-value хранилище на PostgreSQL
 *
 * Одна таблица kv_records, каждая операция - одна транзакция из одного
 * оператора. compareAndSwap сравнивает значение целиком:
 * UPDATE ... WHERE value = expected или INSERT ... ON CONFLICT DO NOTHING.
 */
class PostgresKeyValueStore : public ports::output::IKeyValueStore {
public:
    explicit PostgresKeyValueStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresKeyValueStore] Connecting to "
                  << settings_->describe()
                  << " (timeout " << settings_->getConnectTimeoutSeconds() << "s)..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            createSchema();
            std::cout << "[PostgresKeyValueStore] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] Connection failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

    ~PostgresKeyValueStore() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());
            auto result = txn.exec_params(
                "SELECT value FROM kv_records WHERE key = $1",
                key
            );
            txn.commit();

            if (result.empty()) return std::nullopt;
            return result[0][0].as<std::string>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] get() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

    void put(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());
            txn.exec_params(
                R"(
                    INSERT INTO kv_records (key, value, updated_at)
                    VALUES ($1, $2, NOW())
                    ON CONFLICT (key) DO UPDATE SET
                        value = EXCLUDED.value,
                        updated_at = EXCLUDED.updated_at
                )",
                key,
                value
            );
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] put() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());
            auto result = txn.exec_params(
                "DELETE FROM kv_records WHERE key = $1",
                key
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] remove() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

    ports::output::CasResult compareAndSwap(
        const std::string& key,
        const std::optional<std::string>& expected,
        const std::string& desired
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(connection());
            pqxx::result result;

            if (expected) {
                result = txn.exec_params(
                    R"(
                        UPDATE kv_records SET value = $3, updated_at = NOW()
                        WHERE key = $1 AND value = $2
                    )",
                    key,
                    *expected,
                    desired
                );
            } else {
                result = txn.exec_params(
                    R"(
                        INSERT INTO kv_records (key, value, updated_at)
                        VALUES ($1, $2, NOW())
                        ON CONFLICT (key) DO NOTHING
                    )",
                    key,
                    desired
                );
            }
            txn.commit();

            return result.affected_rows() == 1
                ? ports::output::CasResult::SWAPPED
                : ports::output::CasResult::CONFLICT;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] compareAndSwap() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(e.what());
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    /**
     * @brief Текущее соединение; после обрыва открывается заново
     */
    pqxx::connection& connection() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresKeyValueStore] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
        return *connection_;
    }

    void createSchema() {
        pqxx::work txn(*connection_);
        txn.exec(
            R"(
                CREATE TABLE IF NOT EXISTS kv_records (
                    key TEXT PRIMARY KEY,
                    value TEXT NOT NULL,
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )"
        );
        txn.commit();
    }
};

} // namespace jellyvr::adapters::secondary
