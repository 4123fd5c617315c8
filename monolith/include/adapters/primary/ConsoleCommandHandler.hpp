#pragma once

#include "users/ports/input/IUserService.hpp"
#include "orders/ports/input/IOrderService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace monolith::adapters::primary {

/**
 * @brief Primary-адаптер: текстовые команды → входные порты модулей
 *
 * Одна строка - одна команда, ответ - один JSON-документ:
 *   {"status":"ok", ...}
 *   {"status":"error","code":"...","message":"..."}
 *
 * Команды:
 * - user.create <email> <first> <last>
 * - user.update <id> <first> <last>
 * - user.delete <id>
 * - user.get <id>
 * - user.list [offset] [limit]
 * - order.create <userId>
 * - order.add-item <orderId> <productId> <name> <qty> <amount> <currency>
 * - order.remove-item <orderId> <productId>
 * - order.submit <orderId>
 * - order.cancel <orderId>
 * - order.get <orderId>
 * - order.list <userId> [offset] [limit]
 * - help
 */
class ConsoleCommandHandler {
public:
    ConsoleCommandHandler(std::shared_ptr<users::ports::input::IUserService> userService,
                          std::shared_ptr<orders::ports::input::IOrderService> orderService);

    /**
     * @brief Выполнить команду
     *
     * Не бросает: любая ошибка превращается в JSON-ответ со статусом error.
     */
    std::string handle(const Context& ctx, const std::string& line);

    std::string handle(const std::string& line);

    static std::string helpText();

private:
    using Args = std::vector<std::string>;

    nlohmann::json dispatch(const Context& ctx, const std::string& command, const Args& args);

    nlohmann::json createUser(const Context& ctx, const Args& args);
    nlohmann::json updateUser(const Context& ctx, const Args& args);
    nlohmann::json deleteUser(const Context& ctx, const Args& args);
    nlohmann::json getUser(const Context& ctx, const Args& args);
    nlohmann::json listUsers(const Context& ctx, const Args& args);

    nlohmann::json createOrder(const Context& ctx, const Args& args);
    nlohmann::json addItem(const Context& ctx, const Args& args);
    nlohmann::json removeItem(const Context& ctx, const Args& args);
    nlohmann::json submitOrder(const Context& ctx, const Args& args);
    nlohmann::json cancelOrder(const Context& ctx, const Args& args);
    nlohmann::json getOrder(const Context& ctx, const Args& args);
    nlohmann::json listOrders(const Context& ctx, const Args& args);

    static nlohmann::json userToJson(const users::domain::User& user);
    static nlohmann::json orderToJson(const orders::domain::Order& order);

    std::shared_ptr<users::ports::input::IUserService> userService_;
    std::shared_ptr<orders::ports::input::IOrderService> orderService_;
};

} // namespace monolith::adapters::primary
