#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace monolith::settings
{

    enum class StorageBackend
    {
        MEMORY,
        POSTGRES
    };

    /**
     * @brief Общие настройки приложения
     *
     * Читает параметры из переменных окружения:
     * - MONOLITH_STORAGE: memory | postgres
     * - MONOLITH_MAX_EVENT_DEPTH: лимит событий за один flush()
     * - MONOLITH_MAX_TX_ATTEMPTS: лимит попыток read-write транзакции
     */
    class AppSettings
    {
    public:
        static constexpr int DEFAULT_MAX_EVENT_DEPTH = 10;
        static constexpr int DEFAULT_MAX_TX_ATTEMPTS = 5;

        AppSettings()
        {
            storage_ = parseStorage(getEnvOrDefault("MONOLITH_STORAGE", "memory"));
            maxEventDepth_ = parsePositive("MONOLITH_MAX_EVENT_DEPTH",
                                           getEnvOrDefault("MONOLITH_MAX_EVENT_DEPTH", "10"));
            maxTransactionAttempts_ = parsePositive("MONOLITH_MAX_TX_ATTEMPTS",
                                                    getEnvOrDefault("MONOLITH_MAX_TX_ATTEMPTS", "5"));
        }

        AppSettings(StorageBackend storage, int maxEventDepth, int maxTransactionAttempts)
            : storage_(storage)
            , maxEventDepth_(maxEventDepth)
            , maxTransactionAttempts_(maxTransactionAttempts)
        {
        }

        StorageBackend getStorage() const { return storage_; }
        int getMaxEventDepth() const { return maxEventDepth_; }
        int getMaxTransactionAttempts() const { return maxTransactionAttempts_; }

        std::string getStorageName() const
        {
            return storage_ == StorageBackend::POSTGRES ? "postgres" : "memory";
        }

    private:
        StorageBackend storage_;
        int maxEventDepth_;
        int maxTransactionAttempts_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }

        static StorageBackend parseStorage(const std::string &value)
        {
            if (value == "memory") return StorageBackend::MEMORY;
            if (value == "postgres") return StorageBackend::POSTGRES;
            throw std::invalid_argument("MONOLITH_STORAGE must be 'memory' or 'postgres', got '" + value + "'");
        }

        static int parsePositive(const char *name, const std::string &value)
        {
            size_t pos = 0;
            int parsed = 0;
            try
            {
                parsed = std::stoi(value, &pos);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(std::string(name) + " must be a positive integer, got '" + value + "'");
            }
            if (pos != value.size() || parsed <= 0)
            {
                throw std::invalid_argument(std::string(name) + " must be a positive integer, got '" + value + "'");
            }
            return parsed;
        }
    };

} // namespace monolith::settings
