#include "adapters/primary/ConsoleCommandHandler.hpp"
#include "CancellationToken.hpp"
#include "events/EventExceptions.hpp"
#include "transaction/TransactionExceptions.hpp"
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace monolith::adapters::primary {

namespace {

/// Неверные аргументы команды
class UsageException : public std::invalid_argument {
public:
    explicit UsageException(const std::string& usage)
        : std::invalid_argument("usage: " + usage) {}
};

nlohmann::json ok() {
    return nlohmann::json{{"status", "ok"}};
}

nlohmann::json error(const std::string& code, const std::string& message) {
    return nlohmann::json{{"status", "error"}, {"code", code}, {"message", message}};
}

void requireArgs(const std::vector<std::string>& args, size_t minCount, const char* usage) {
    if (args.size() < minCount) {
        throw UsageException(usage);
    }
}

int parseInt(const std::string& value, const char* usage) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            throw UsageException(usage);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw UsageException(usage);
    }
}

int64_t parseAmount(const std::string& value, const char* usage) {
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            throw UsageException(usage);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw UsageException(usage);
    }
}

int optionalInt(const std::vector<std::string>& args, size_t index, int defaultValue, const char* usage) {
    return args.size() > index ? parseInt(args[index], usage) : defaultValue;
}

/**
 * @brief Бизнес-ошибка, вложенная в ошибку обработчика события
 */
std::optional<std::pair<std::string, std::string>> nestedDomainError(const std::exception& e) {
    try {
        std::rethrow_if_nested(e);
    } catch (const monolith::domain::DomainException& inner) {
        return std::make_pair(inner.getCode(), std::string(inner.what()));
    } catch (const std::exception& inner) {
        return nestedDomainError(inner);
    }
    return std::nullopt;
}

} // namespace

ConsoleCommandHandler::ConsoleCommandHandler(std::shared_ptr<users::ports::input::IUserService> userService,
                                             std::shared_ptr<orders::ports::input::IOrderService> orderService)
    : userService_(std::move(userService))
    , orderService_(std::move(orderService))
{
    std::cout << "[ConsoleCommandHandler] Created" << std::endl;
}

std::string ConsoleCommandHandler::handle(const std::string& line) {
    return handle(Context::background(), line);
}

std::string ConsoleCommandHandler::handle(const Context& ctx, const std::string& line) {
    std::istringstream in(line);
    std::string command;
    in >> command;

    Args args;
    for (std::string arg; in >> arg;) {
        args.push_back(arg);
    }

    nlohmann::json response;
    try {
        response = dispatch(ctx, command, args);
    } catch (const UsageException& e) {
        response = error("INVALID_ARGUMENTS", e.what());
    } catch (const monolith::domain::DomainException& e) {
        response = error(e.getCode(), e.what());
    } catch (const events::EventHandlerException& e) {
        std::cerr << "[ConsoleCommandHandler] " << command << " failed: " << e.what() << std::endl;
        if (auto inner = nestedDomainError(e)) {
            response = error(inner->first, inner->second);
        } else {
            response = error("EVENT_HANDLER_FAILED", e.what());
        }
    } catch (const events::EventProcessingDepthExceededException& e) {
        response = error("EVENT_DEPTH_EXCEEDED", e.what());
    } catch (const transaction::NestedTransactionException& e) {
        response = error("NESTED_TRANSACTION", e.what());
    } catch (const transaction::TransactionAbortedException& e) {
        response = error("TRANSACTION_ABORTED", e.what());
    } catch (const OperationCancelledException& e) {
        response = error("CANCELLED", e.what());
    } catch (const std::exception& e) {
        std::cerr << "[ConsoleCommandHandler] " << command << " failed: " << e.what() << std::endl;
        response = error("INTERNAL_ERROR", e.what());
    }
    // Сообщения об ошибках повторяют ввод, а он может быть не в UTF-8
    return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ConsoleCommandHandler::helpText() {
    return
        "user.create <email> <first> <last>\n"
        "user.update <id> <first> <last>\n"
        "user.delete <id>\n"
        "user.get <id>\n"
        "user.list [offset] [limit]\n"
        "order.create <userId>\n"
        "order.add-item <orderId> <productId> <name> <qty> <amount> <currency>\n"
        "order.remove-item <orderId> <productId>\n"
        "order.submit <orderId>\n"
        "order.cancel <orderId>\n"
        "order.get <orderId>\n"
        "order.list <userId> [offset] [limit]\n"
        "help";
}

nlohmann::json ConsoleCommandHandler::dispatch(const Context& ctx, const std::string& command, const Args& args) {
    if (command == "user.create")       return createUser(ctx, args);
    if (command == "user.update")       return updateUser(ctx, args);
    if (command == "user.delete")       return deleteUser(ctx, args);
    if (command == "user.get")          return getUser(ctx, args);
    if (command == "user.list")         return listUsers(ctx, args);
    if (command == "order.create")      return createOrder(ctx, args);
    if (command == "order.add-item")    return addItem(ctx, args);
    if (command == "order.remove-item") return removeItem(ctx, args);
    if (command == "order.submit")      return submitOrder(ctx, args);
    if (command == "order.cancel")      return cancelOrder(ctx, args);
    if (command == "order.get")         return getOrder(ctx, args);
    if (command == "order.list")        return listOrders(ctx, args);

    if (command == "help") {
        auto response = ok();
        response["help"] = helpText();
        return response;
    }
    if (command.empty()) {
        return error("EMPTY_COMMAND", "empty command");
    }
    return error("UNKNOWN_COMMAND", "unknown command: " + command);
}

// ============================================================================
// users
// ============================================================================

nlohmann::json ConsoleCommandHandler::createUser(const Context& ctx, const Args& args) {
    requireArgs(args, 3, "user.create <email> <first> <last>");
    auto response = ok();
    response["user_id"] = userService_->createUser(ctx, args[0], args[1], args[2]);
    return response;
}

nlohmann::json ConsoleCommandHandler::updateUser(const Context& ctx, const Args& args) {
    requireArgs(args, 3, "user.update <id> <first> <last>");
    userService_->updateUser(ctx, args[0], args[1], args[2]);
    auto response = ok();
    response["user_id"] = args[0];
    return response;
}

nlohmann::json ConsoleCommandHandler::deleteUser(const Context& ctx, const Args& args) {
    requireArgs(args, 1, "user.delete <id>");
    userService_->deleteUser(ctx, args[0]);
    auto response = ok();
    response["user_id"] = args[0];
    return response;
}

nlohmann::json ConsoleCommandHandler::getUser(const Context& ctx, const Args& args) {
    requireArgs(args, 1, "user.get <id>");
    auto response = ok();
    response["user"] = userToJson(userService_->getUser(ctx, args[0]));
    return response;
}

nlohmann::json ConsoleCommandHandler::listUsers(const Context& ctx, const Args& args) {
    const char* usage = "user.list [offset] [limit]";
    auto page = userService_->listUsers(ctx, optionalInt(args, 0, 0, usage), optionalInt(args, 1, 0, usage));

    auto users = nlohmann::json::array();
    for (const auto& user : page.users) {
        users.push_back(userToJson(user));
    }

    auto response = ok();
    response["users"] = users;
    response["total"] = page.totalCount;
    response["offset"] = page.offset;
    response["limit"] = page.limit;
    return response;
}

// ============================================================================
// orders
// ============================================================================

nlohmann::json ConsoleCommandHandler::createOrder(const Context& ctx, const Args& args) {
    requireArgs(args, 1, "order.create <userId>");
    auto response = ok();
    response["order_id"] = orderService_->createOrder(ctx, args[0]);
    return response;
}

nlohmann::json ConsoleCommandHandler::addItem(const Context& ctx, const Args& args) {
    const char* usage = "order.add-item <orderId> <productId> <name> <qty> <amount> <currency>";
    requireArgs(args, 6, usage);

    monolith::domain::Money price(parseAmount(args[4], usage), args[5]);
    orderService_->addItem(ctx, args[0], args[1], args[2], parseInt(args[3], usage), price);

    auto response = ok();
    response["order_id"] = args[0];
    return response;
}

nlohmann::json ConsoleCommandHandler::removeItem(const Context& ctx, const Args& args) {
    requireArgs(args, 2, "order.remove-item <orderId> <productId>");
    orderService_->removeItem(ctx, args[0], args[1]);
    auto response = ok();
    response["order_id"] = args[0];
    return response;
}

nlohmann::json ConsoleCommandHandler::submitOrder(const Context& ctx, const Args& args) {
    requireArgs(args, 1, "order.submit <orderId>");
    orderService_->submitOrder(ctx, args[0]);
    auto response = ok();
    response["order_id"] = args[0];
    return response;
}

nlohmann::json ConsoleCommandHandler::cancelOrder(const Context& ctx, const Args& args) {
    requireArgs(args, 1, "order.cancel <orderId>");
    orderService_->cancelOrder(ctx, args[0]);
    auto response = ok();
    response["order_id"] = args[0];
    return response;
}

nlohmann::json ConsoleCommandHandler::getOrder(const Context& ctx, const Args& args) {
    requireArgs(args, 1, "order.get <orderId>");
    auto response = ok();
    response["order"] = orderToJson(orderService_->getOrder(ctx, args[0]));
    return response;
}

nlohmann::json ConsoleCommandHandler::listOrders(const Context& ctx, const Args& args) {
    const char* usage = "order.list <userId> [offset] [limit]";
    requireArgs(args, 1, usage);
    auto page = orderService_->listUserOrders(ctx, args[0],
        optionalInt(args, 1, 0, usage), optionalInt(args, 2, 0, usage));

    auto orders = nlohmann::json::array();
    for (const auto& order : page.orders) {
        orders.push_back(orderToJson(order));
    }

    auto response = ok();
    response["orders"] = orders;
    response["total"] = page.totalCount;
    response["offset"] = page.offset;
    response["limit"] = page.limit;
    return response;
}

// ============================================================================
// Маппинг в JSON
// ============================================================================

nlohmann::json ConsoleCommandHandler::userToJson(const users::domain::User& user) {
    nlohmann::json j;
    j["id"] = user.id().value();
    j["email"] = user.email().value();
    j["first_name"] = user.name().firstName();
    j["last_name"] = user.name().lastName();
    j["status"] = users::domain::toString(user.status());
    j["created_at"] = user.createdAt().toString();
    j["updated_at"] = user.updatedAt().toString();
    return j;
}

nlohmann::json ConsoleCommandHandler::orderToJson(const orders::domain::Order& order) {
    auto items = nlohmann::json::array();
    for (const auto& item : order.items()) {
        items.push_back({
            {"product_id", item.productId},
            {"product_name", item.productName},
            {"quantity", item.quantity},
            {"unit_price", item.unitPrice.amount()},
            {"subtotal", item.subtotal().amount()},
            {"currency", item.unitPrice.currency()}
        });
    }

    nlohmann::json j;
    j["id"] = order.id().value();
    j["user_id"] = order.userRef().value();
    j["status"] = orders::domain::toString(order.status());
    j["items"] = items;
    j["total"] = order.total().amount();
    j["currency"] = order.total().currency();
    j["created_at"] = order.createdAt().toString();
    j["updated_at"] = order.updatedAt().toString();
    return j;
}

} // namespace monolith::adapters::primary
