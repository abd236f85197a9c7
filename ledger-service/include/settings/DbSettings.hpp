// include/settings/DbSettings.hpp
#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace ledger::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Параметры передаются явно. Переменные окружения (K8s ENV) читаются
     * только в точке сборки приложения через fromEnvironment().
     */
    class DbSettings
    {
    public:
        DbSettings(std::string host, int port, std::string name, std::string user, std::string password)
            : host_(std::move(host)), port_(port), name_(std::move(name)), user_(std::move(user)), password_(std::move(password))
        {
            if (port_ <= 0 || port_ > 65535)
            {
                throw std::invalid_argument("DbSettings: invalid port " + std::to_string(port_));
            }
        }

        static DbSettings fromEnvironment()
        {
            return DbSettings(
                getEnvOrDefault("LEDGER_DB_HOST", "ledger-postgres"),
                std::stoi(getEnvOrDefault("LEDGER_DB_PORT", "5432")),
                getEnvOrDefault("LEDGER_DB_NAME", "ledger_db"),
                getEnvOrDefault("LEDGER_DB_USER", "ledger_user"),
                getEnvOrDefault("LEDGER_DB_PASSWORD", "ledger_secret_password"));
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

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

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace ledger::settings
