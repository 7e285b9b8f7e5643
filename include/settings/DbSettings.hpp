// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace jellyvr::settings
{

    /**
     * @brief Хранилище сессий и прогресса: PostgreSQL
     *
     * JELLYVR_DB_URL - готовая строка libpq (postgresql://... или key=value).
     * Если задана, остальные JELLYVR_DB_* кроме таймаута не читаются.
     *
     * Иначе строка собирается из JELLYVR_DB_HOST, JELLYVR_DB_PORT,
     * JELLYVR_DB_NAME, JELLYVR_DB_USER, JELLYVR_DB_PASSWORD.
     *
     * JELLYVR_DB_CONNECT_TIMEOUT - секунды на установку соединения (default: 5).
     *
     * @throws std::invalid_argument порт или таймаут не число либо вне диапазона
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            connectTimeoutSeconds_ = readInt("JELLYVR_DB_CONNECT_TIMEOUT", "5", 1, 3600);

            const char *url = std::getenv("JELLYVR_DB_URL");
            if (url && *url)
            {
                url_ = url;
                return;
            }

            host_ = readString("JELLYVR_DB_HOST", "localhost");
            port_ = readInt("JELLYVR_DB_PORT", "5432", 1, 65535);
            name_ = readString("JELLYVR_DB_NAME", "jellyvr");
            user_ = readString("JELLYVR_DB_USER", "jellyvr");
            password_ = readString("JELLYVR_DB_PASSWORD", "");
        }

        int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }

        /// Для логов, без пароля
        std::string describe() const
        {
            if (!url_.empty())
            {
                return "JELLYVR_DB_URL";
            }
            return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + name_;
        }

        std::string getConnectionString() const
        {
            const std::string extra = "connect_timeout=" + std::to_string(connectTimeoutSeconds_) +
                                      " application_name=jellyvr-gateway";
            if (!url_.empty())
            {
                // URI принимает параметры только в query string
                if (url_.rfind("postgres", 0) == 0)
                {
                    const char separator = url_.find('?') == std::string::npos ? '?' : '&';
                    return url_ + separator + "connect_timeout=" + std::to_string(connectTimeoutSeconds_) +
                           "&application_name=jellyvr-gateway";
                }
                return url_ + " " + extra;
            }

            std::string conninfo = "host=" + host_ + " port=" + std::to_string(port_) +
                                   " dbname=" + name_ + " user=" + user_;
            if (!password_.empty())
            {
                conninfo += " password=" + password_;
            }
            return conninfo + " " + extra;
        }

    private:
        std::string url_;
        std::string host_;
        int port_ = 0;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeoutSeconds_ = 5;

        static std::string readString(const char *name, const char *fallback)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(fallback);
        }

        static int readInt(const char *name, const char *fallback, int min, int max)
        {
            const std::string raw = readString(name, fallback);
            int value = 0;
            try
            {
                value = std::stoi(raw);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(std::string(name) + " is not a number: " + raw);
            }
            if (value < min || value > max)
            {
                throw std::invalid_argument(std::string(name) + " out of range: " + raw);
            }
            return value;
        }
    };

} // namespace jellyvr::settings
