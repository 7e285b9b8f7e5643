#pragma once

#include <string>

namespace jellyvr::ports::output {

/**
 * @brief Генерация и проверка локальных паролей
 */
class IPasswordHasher {
public:
    virtual ~IPasswordHasher() = default;

    /// Короткий случайный пароль из строчных латинских букв
    virtual std::string generatePassword(int length) = 0;

    virtual std::string generateSalt() = 0;

    virtual std::string hash(const std::string& password, const std::string& salt) = 0;

    virtual bool verify(const std::string& password,
                        const std::string& salt,
                        const std::string& expectedHash) = 0;
};

} // namespace jellyvr::ports::output
