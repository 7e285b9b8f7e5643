#pragma once

#include <string>
#include <optional>

namespace jellyvr::ports::output {

/**
 * @brief Результат compare-and-swap
 */
enum class CasResult {
    SWAPPED,
    CONFLICT    ///< Текущее значение не совпало с ожидаемым
};

/**
 * @brief Долговременное key-value хранилище
 *
 * Все операции атомарны по ключу. Успешный put переживает рестарт,
 * частичные записи не наблюдаемы.
 *
 * @throws domain::StoreUnavailableError при любой ошибке ввода-вывода
 */
class IKeyValueStore {
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief Атомарно заменить значение, если оно равно expected
     * @param expected std::nullopt - ключ должен отсутствовать (insert-if-absent)
     */
    virtual CasResult compareAndSwap(
        const std::string& key,
        const std::optional<std::string>& expected,
        const std::string& desired
    ) = 0;
};

} // namespace jellyvr::ports::output
