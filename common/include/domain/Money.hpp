#pragma once

#include "domain/DomainException.hpp"
#include "domain/MoneyErrors.hpp"
#include <string>
#include <cstdint>

namespace monolith::domain {

/**
 * @brief Денежное значение с валютой
 *
 * Хранит сумму в минорных единицах (центы, копейки).
 * Неизменяемо: все операции возвращают новый экземпляр.
 */
class Money {
public:
    Money() : amount_(0), currency_("USD") {}

    /**
     * @param amount Сумма в минорных единицах
     * @param currency ISO 4217, три буквы
     * @throws DomainException INVALID_CURRENCY
     */
    Money(int64_t amount, std::string currency)
        : amount_(amount), currency_(std::move(currency))
    {
        if (currency_.size() != 3) {
            throw DomainException(errors::INVALID_CURRENCY, "currency must be 3-letter ISO code: '" + currency_ + "'");
        }
    }

    static Money zero(const std::string& currency = "USD") {
        return Money(0, currency);
    }

    int64_t amount() const { return amount_; }
    const std::string& currency() const { return currency_; }
    bool isZero() const { return amount_ == 0; }

    /**
     * @throws DomainException CURRENCY_MISMATCH, AMOUNT_OVERFLOW
     */
    Money operator+(const Money& other) const {
        requireSameCurrency(other, "add");
        int64_t result = 0;
        if (__builtin_add_overflow(amount_, other.amount_, &result)) {
            throw overflow("add");
        }
        return Money(result, currency_);
    }

    Money operator-(const Money& other) const {
        requireSameCurrency(other, "subtract");
        int64_t result = 0;
        if (__builtin_sub_overflow(amount_, other.amount_, &result)) {
            throw overflow("subtract");
        }
        return Money(result, currency_);
    }

    /**
     * @throws DomainException AMOUNT_OVERFLOW
     */
    Money operator*(int64_t factor) const {
        int64_t result = 0;
        if (__builtin_mul_overflow(amount_, factor, &result)) {
            throw overflow("multiply");
        }
        return Money(result, currency_);
    }

    bool operator==(const Money& other) const {
        return amount_ == other.amount_ && currency_ == other.currency_;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

    std::string toString() const {
        return std::to_string(amount_) + " " + currency_;
    }

private:
    void requireSameCurrency(const Money& other, const char* operation) const {
        if (currency_ != other.currency_) {
            throw DomainException(errors::CURRENCY_MISMATCH,
                std::string("cannot ") + operation + " different currencies: " +
                currency_ + " and " + other.currency_);
        }
    }

    DomainException overflow(const char* operation) const {
        return DomainException(errors::AMOUNT_OVERFLOW,
            std::string("amount overflow on ") + operation + ": " + toString());
    }

    int64_t amount_;
    std::string currency_;
};

} // namespace monolith::domain
