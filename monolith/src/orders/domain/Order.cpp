#include "orders/domain/Order.hpp"
#include "orders/domain/OrderErrors.hpp"
#include "orders/domain/events/OrderEvents.hpp"
#include "domain/MoneyErrors.hpp"
#include <algorithm>
#include <limits>

namespace monolith::orders::domain {

using monolith::domain::DomainException;
using monolith::domain::Timestamp;

Order::Order(OrderId id, UserRef userRef, std::vector<OrderItem> items, OrderStatus status, Money total,
             Timestamp createdAt, Timestamp updatedAt)
    : id_(std::move(id))
    , userRef_(std::move(userRef))
    , items_(std::move(items))
    , status_(status)
    , total_(std::move(total))
    , createdAt_(createdAt)
    , updatedAt_(updatedAt)
{}

Order Order::create(UserRef userRef) {
    auto now = Timestamp::now();
    Order order(OrderId::generate(), std::move(userRef), {}, OrderStatus::DRAFT, Money::zero(), now, now);
    order.addDomainEvent(std::make_shared<OrderCreatedEvent>(order.id_.value(), order.userRef_.value()));
    return order;
}

Order Order::reconstitute(OrderId id, UserRef userRef, std::vector<OrderItem> items, OrderStatus status,
                          Money total, Timestamp createdAt, Timestamp updatedAt) {
    return Order(std::move(id), std::move(userRef), std::move(items), status, std::move(total),
                 createdAt, updatedAt);
}

void Order::addItem(const std::string& productId, const std::string& productName, int quantity,
                    const Money& unitPrice) {
    ensureDraft();
    if (quantity <= 0) {
        throw DomainException(errors::INVALID_QUANTITY,
            "quantity must be positive, got " + std::to_string(quantity));
    }
    if (productId.empty()) {
        throw DomainException(errors::INVALID_PRODUCT, "product id is required");
    }
    if (unitPrice.amount() < 0) {
        throw DomainException(errors::INVALID_PRODUCT, "unit price must not be negative");
    }
    if (!items_.empty() && items_.front().unitPrice.currency() != unitPrice.currency()) {
        throw DomainException(monolith::domain::errors::CURRENCY_MISMATCH,
            "order currency is " + items_.front().unitPrice.currency() + ", got " + unitPrice.currency());
    }

    // Изменения применяются только если итог посчитан без переполнения
    std::vector<OrderItem> items = items_;
    auto it = std::find_if(items.begin(), items.end(),
        [&](const OrderItem& item) { return item.productId == productId; });
    if (it != items.end()) {
        if (quantity > std::numeric_limits<int>::max() - it->quantity) {
            throw DomainException(errors::INVALID_QUANTITY,
                "total quantity of " + productId + " exceeds " + std::to_string(std::numeric_limits<int>::max()));
        }
        it->quantity += quantity;
    } else {
        items.push_back(OrderItem{productId, productName, quantity, unitPrice});
    }

    Money total = totalOf(items);
    items_ = std::move(items);
    total_ = std::move(total);
    touch();
}

void Order::removeItem(const std::string& productId) {
    ensureDraft();
    auto it = std::find_if(items_.begin(), items_.end(),
        [&](const OrderItem& item) { return item.productId == productId; });
    if (it == items_.end()) {
        throw DomainException(errors::ITEM_NOT_FOUND, "item not found: " + productId);
    }
    items_.erase(it);
    total_ = totalOf(items_);
    touch();
}

void Order::submit() {
    ensureDraft();
    if (items_.empty()) {
        throw DomainException(errors::ORDER_EMPTY, "cannot submit empty order " + id_.value());
    }
    status_ = OrderStatus::PENDING;
    touch();
    addDomainEvent(std::make_shared<OrderSubmittedEvent>(
        id_.value(), userRef_.value(), total_.amount(), total_.currency()));
}

void Order::confirm() {
    if (status_ != OrderStatus::PENDING) {
        throw DomainException(errors::ORDER_NOT_PENDING,
            "order " + id_.value() + " is " + toString(status_) + ", expected pending");
    }
    status_ = OrderStatus::CONFIRMED;
    touch();
}

void Order::complete() {
    if (status_ != OrderStatus::CONFIRMED) {
        throw DomainException(errors::ORDER_NOT_CONFIRMED,
            "order " + id_.value() + " is " + toString(status_) + ", expected confirmed");
    }
    status_ = OrderStatus::COMPLETED;
    touch();
}

void Order::cancel() {
    if (status_ == OrderStatus::CANCELLED) {
        throw DomainException(errors::ORDER_ALREADY_CANCELLED, "order already cancelled: " + id_.value());
    }
    if (status_ == OrderStatus::COMPLETED) {
        throw DomainException(errors::ORDER_COMPLETED, "cannot cancel completed order " + id_.value());
    }
    status_ = OrderStatus::CANCELLED;
    touch();
    addDomainEvent(std::make_shared<OrderCancelledEvent>(id_.value(), userRef_.value()));
}

void Order::ensureDraft() const {
    if (status_ != OrderStatus::DRAFT) {
        throw DomainException(errors::ORDER_NOT_DRAFT,
            "order " + id_.value() + " is " + toString(status_) + ", expected draft");
    }
}

Money Order::totalOf(const std::vector<OrderItem>& items) {
    if (items.empty()) {
        return Money::zero();
    }
    Money total = Money::zero(items.front().unitPrice.currency());
    for (const auto& item : items) {
        total = total + item.subtotal();
    }
    return total;
}

void Order::touch() {
    updatedAt_ = Timestamp::now();
}

} // namespace monolith::orders::domain
