#pragma once

#include "users/ports/input/IUserService.hpp"
#include "users/ports/output/IUserRepository.hpp"
#include "transaction/ITransactionScope.hpp"
#include "transaction/ReadOnlyTransactionScope.hpp"
#include "events/IHandlerRegistry.hpp"
#include "events/TransactionalEventBus.hpp"
#include "settings/AppSettings.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace monolith::users::application {

/**
 * @brief Сервис пользователей
 *
 * Команда (create/update/delete):
 * 1. открыть read-write транзакцию;
 * 2. внутри неё создать TransactionalEventBus;
 * 3. загрузить агрегат, вызвать бизнес-метод, сохранить;
 * 4. опубликовать события агрегата и выполнить flush().
 * Обработчики других модулей выполняются в той же транзакции,
 * их ошибка откатывает всю команду.
 */
class UserService : public ports::input::IUserService {
public:
    static constexpr int DEFAULT_PAGE_SIZE = 20;
    static constexpr int MAX_PAGE_SIZE = 100;

    UserService(
        std::shared_ptr<ports::output::IUserRepository> userRepository,
        std::shared_ptr<transaction::ITransactionScope> transactionScope,
        std::shared_ptr<transaction::ReadOnlyTransactionScope> readScope,
        std::shared_ptr<events::IHandlerRegistry> handlerRegistry,
        std::shared_ptr<settings::AppSettings> settings
    ) : userRepository_(std::move(userRepository))
      , transactionScope_(std::move(transactionScope))
      , readScope_(std::move(readScope))
      , handlerRegistry_(std::move(handlerRegistry))
      , settings_(std::move(settings))
    {
        std::cout << "[UserService] Created" << std::endl;
    }

    std::string createUser(const Context& ctx, const std::string& email,
                           const std::string& firstName, const std::string& lastName) override {
        auto validEmail = domain::Email::create(email);
        auto name = domain::Name::create(firstName, lastName);

        auto userId = transaction::executeWithResult<std::string>(*transactionScope_, ctx,
            [&](const Context& txCtx) {
                events::TransactionalEventBus eventBus(handlerRegistry_, settings_->getMaxEventDepth());

                if (userRepository_->existsByEmail(txCtx, validEmail)) {
                    throw monolith::domain::DomainException(domain::errors::EMAIL_EXISTS,
                        "email already exists: " + validEmail.value());
                }

                auto user = domain::User::create(validEmail, name);
                userRepository_->save(txCtx, user);

                eventBus.publishAll(txCtx, user.popDomainEvents());
                eventBus.flush(txCtx);
                return user.id().value();
            });

        std::cout << "[UserService] Created user " << userId << std::endl;
        return userId;
    }

    void updateUser(const Context& ctx, const std::string& userId,
                    const std::string& firstName, const std::string& lastName) override {
        auto id = domain::UserId::parse(userId);
        auto name = domain::Name::create(firstName, lastName);

        transactionScope_->execute(ctx, [&](const Context& txCtx) {
            events::TransactionalEventBus eventBus(handlerRegistry_, settings_->getMaxEventDepth());

            auto user = loadUser(txCtx, id);
            user.updateProfile(name);
            userRepository_->save(txCtx, user);

            eventBus.publishAll(txCtx, user.popDomainEvents());
            eventBus.flush(txCtx);
        });

        std::cout << "[UserService] Updated user " << userId << std::endl;
    }

    void deleteUser(const Context& ctx, const std::string& userId) override {
        auto id = domain::UserId::parse(userId);

        transactionScope_->execute(ctx, [&](const Context& txCtx) {
            events::TransactionalEventBus eventBus(handlerRegistry_, settings_->getMaxEventDepth());

            auto user = loadUser(txCtx, id);
            user.remove();
            userRepository_->save(txCtx, user);

            eventBus.publishAll(txCtx, user.popDomainEvents());
            eventBus.flush(txCtx);
        });

        std::cout << "[UserService] Deleted user " << userId << std::endl;
    }

    domain::User getUser(const Context& ctx, const std::string& userId) override {
        auto id = domain::UserId::parse(userId);

        return transaction::executeWithResult<domain::User>(*readScope_, ctx,
            [&](const Context& txCtx) { return loadUser(txCtx, id); });
    }

    ports::input::UserPage listUsers(const Context& ctx, int offset, int limit) override {
        ports::input::UserPage page;
        page.offset = std::max(offset, 0);
        page.limit = limit <= 0 ? DEFAULT_PAGE_SIZE : std::min(limit, MAX_PAGE_SIZE);

        readScope_->execute(ctx, [&](const Context& txCtx) {
            auto [users, total] = userRepository_->findAll(txCtx, page.offset, page.limit);
            page.users = std::move(users);
            page.totalCount = total;
        });
        return page;
    }

private:
    domain::User loadUser(const Context& ctx, const domain::UserId& id) {
        auto user = userRepository_->findById(ctx, id);
        if (!user) {
            throw monolith::domain::DomainException(domain::errors::USER_NOT_FOUND,
                "user not found: " + id.value());
        }
        return std::move(*user);
    }

    std::shared_ptr<ports::output::IUserRepository> userRepository_;
    std::shared_ptr<transaction::ITransactionScope> transactionScope_;
    std::shared_ptr<transaction::ReadOnlyTransactionScope> readScope_;
    std::shared_ptr<events::IHandlerRegistry> handlerRegistry_;
    std::shared_ptr<settings::AppSettings> settings_;
};

} // namespace monolith::users::application
