// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace hospitality::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("HOSPITALITY_DB_HOST", "hospitality-postgres");
            port_ = std::stoi(getEnvOrDefault("HOSPITALITY_DB_PORT", "5432"));
            name_ = getEnvOrDefault("HOSPITALITY_DB_NAME", "hospitality_db");
            user_ = getEnvOrDefault("HOSPITALITY_DB_USER", "hospitality_user");
            password_ = getEnvOrDefault("HOSPITALITY_DB_PASSWORD", "hospitality_secret_password");
            lockTimeoutMs_ = std::stoi(getEnvOrDefault("HOSPITALITY_DB_LOCK_TIMEOUT_MS", "5000"));
            if (lockTimeoutMs_ < 0)
            {
                throw std::invalid_argument("HOSPITALITY_DB_LOCK_TIMEOUT_MS must be non-negative");
            }
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        /**
         * @brief Сколько транзакция ждёт блокировку строки агрегата (0 = без лимита)
         */
        int getLockTimeoutMs() const { return lockTimeoutMs_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int lockTimeoutMs_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace hospitality::settings
