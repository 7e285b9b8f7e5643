#pragma once

#include "ports/output/IPasswordHasher.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace jellyvr::adapters::secondary {

/**
 * @brief Пароли на OpenSSL
 *
 * Пароль - строчные латинские буквы из RAND_bytes (без смещения по модулю).
 * Хэш - hex(SHA-256(salt + password)), соль - 16 случайных байт в hex.
 */
class Sha256PasswordHasher : public ports::output::IPasswordHasher {
public:
    static constexpr int SALT_BYTES = 16;

    std::string generatePassword(int length) override {
        if (length < 1) {
            length = 1;
        }

        std::string password;
        password.reserve(length);
        // 26 * 9 = 234: байты >= 234 отбрасываются, остаток делится без смещения
        while (static_cast<int>(password.size()) < length) {
            auto bytes = randomBytes(length * 2);
            for (unsigned char b : bytes) {
                if (b >= 234) continue;
                password += static_cast<char>('a' + b % 26);
                if (static_cast<int>(password.size()) == length) break;
            }
        }
        return password;
    }

    std::string generateSalt() override {
        return toHex(randomBytes(SALT_BYTES));
    }

    std::string hash(const std::string& password, const std::string& salt) override {
        std::string input = salt + password;
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLength = 0;

        if (EVP_Digest(input.data(), input.size(), digest, &digestLength, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("SHA-256 digest failed");
        }
        return toHex(std::vector<unsigned char>(digest, digest + digestLength));
    }

    bool verify(const std::string& password,
                const std::string& salt,
                const std::string& expectedHash) override {
        if (salt.empty() || expectedHash.empty()) {
            return false;
        }
        std::string actual = hash(password, salt);
        if (actual.size() != expectedHash.size()) {
            return false;
        }
        return CRYPTO_memcmp(actual.data(), expectedHash.data(), actual.size()) == 0;
    }

private:
    static std::vector<unsigned char> randomBytes(int count) {
        std::vector<unsigned char> bytes(count);
        if (RAND_bytes(bytes.data(), count) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        return bytes;
    }

    static std::string toHex(const std::vector<unsigned char>& bytes) {
        std::string hex;
        hex.reserve(bytes.size() * 2);
        char buf[3];
        for (unsigned char b : bytes) {
            std::snprintf(buf, sizeof(buf), "%02x", b);
            hex += buf;
        }
        return hex;
    }
};

} // namespace jellyvr::adapters::secondary
