#pragma once

#include <string>
#include <cstdlib>

namespace monolith::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL (MONOLITH_STORAGE=postgres)
     *
     * Переменные окружения MONOLITH_DB_*. Пароль наружу не отдаётся,
     * только в составе строки подключения.
     */
    class DbSettings
    {
    public:
        DbSettings()
            : host_(getEnvOrDefault("MONOLITH_DB_HOST", "localhost"))
            , port_(getEnvOrDefault("MONOLITH_DB_PORT", "5432"))
            , name_(getEnvOrDefault("MONOLITH_DB_NAME", "monolith"))
            , user_(getEnvOrDefault("MONOLITH_DB_USER", "monolith"))
            , password_(getEnvOrDefault("MONOLITH_DB_PASSWORD", ""))
            , sslMode_(getEnvOrDefault("MONOLITH_DB_SSLMODE", "prefer"))
            , connectTimeout_(getEnvOrDefault("MONOLITH_DB_CONNECT_TIMEOUT", "5"))
        {
        }

        const std::string& getHost() const { return host_; }
        const std::string& getPort() const { return port_; }
        const std::string& getName() const { return name_; }

        /// libpq keyword/value строка
        std::string getConnectionString() const
        {
            std::string conn = "host=" + host_ + " port=" + port_ + " dbname=" + name_ + " user=" + user_;
            if (!password_.empty())
            {
                conn += " password=" + password_;
            }
            conn += " sslmode=" + sslMode_ + " connect_timeout=" + connectTimeout_ + " application_name=monolith";
            return conn;
        }

        /// Для логов: без пароля
        std::string describe() const
        {
            return user_ + "@" + host_ + ":" + port_ + "/" + name_;
        }

    private:
        std::string host_;
        std::string port_;
        std::string name_;
        std::string user_;
        std::string password_;
        std::string sslMode_;
        std::string connectTimeout_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace monolith::settings
