/**
 * @file OrderTest.cpp
 * @brief Unit-тесты агрегата Order
 */

#include <gtest/gtest.h>
#include <functional>
#include <limits>
#include "orders/domain/Order.hpp"
#include "orders/domain/events/OrderEvents.hpp"
#include "domain/Uuid.hpp"

using namespace monolith;
using namespace monolith::orders::domain;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class OrderTest : public ::testing::Test {
protected:
    void SetUp() override {
        userId_ = monolith::domain::generateUuid();
    }

    Order makeDraft() {
        auto order = Order::create(UserRef::parse(userId_));
        order.clearDomainEvents();
        return order;
    }

    Order makePending() {
        auto order = makeDraft();
        order.addItem("sku-1", "Widget", 1, Money(500, "EUR"));
        order.submit();
        order.clearDomainEvents();
        return order;
    }

    static std::string codeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const monolith::domain::DomainException& e) {
            return e.getCode();
        }
        return "";
    }

    std::string userId_;
};

// ============================================================================
// CREATE / ITEMS
// ============================================================================

TEST_F(OrderTest, Create_IsEmptyDraftWithOrderCreated) {
    auto order = Order::create(UserRef::parse(userId_));

    EXPECT_EQ(order.status(), OrderStatus::DRAFT);
    EXPECT_TRUE(order.items().empty());
    EXPECT_TRUE(order.total().isZero());

    ASSERT_EQ(order.domainEvents().size(), 1u);
    EXPECT_EQ(order.domainEvents().front()->eventType(), events::contracts::ORDER_CREATED);
}

TEST_F(OrderTest, UserRef_RejectsNonUuid) {
    EXPECT_EQ(codeOf([] { UserRef::parse("user-1"); }), errors::INVALID_USER_REF);
    EXPECT_EQ(codeOf([] { OrderId::parse(""); }), errors::INVALID_ORDER_ID);
}

TEST_F(OrderTest, AddItem_RecalculatesTotal) {
    auto order = makeDraft();

    order.addItem("sku-1", "Widget", 2, Money(1050, "EUR"));
    order.addItem("sku-2", "Gadget", 1, Money(300, "EUR"));

    ASSERT_EQ(order.items().size(), 2u);
    EXPECT_EQ(order.total(), Money(2400, "EUR"));
}

TEST_F(OrderTest, AddItem_SameProductMergesQuantity) {
    auto order = makeDraft();

    order.addItem("sku-1", "Widget", 2, Money(100, "USD"));
    order.addItem("sku-1", "Widget", 3, Money(100, "USD"));

    ASSERT_EQ(order.items().size(), 1u);
    EXPECT_EQ(order.items().front().quantity, 5);
    EXPECT_EQ(order.total(), Money(500, "USD"));
}

TEST_F(OrderTest, AddItem_InvalidInput_Throws) {
    auto order = makeDraft();

    EXPECT_EQ(codeOf([&] { order.addItem("sku-1", "Widget", 0, Money(100, "USD")); }), errors::INVALID_QUANTITY);
    EXPECT_EQ(codeOf([&] { order.addItem("", "Widget", 1, Money(100, "USD")); }), errors::INVALID_PRODUCT);

    order.addItem("sku-1", "Widget", 1, Money(100, "USD"));
    EXPECT_EQ(codeOf([&] { order.addItem("sku-2", "Gadget", 1, Money(100, "EUR")); }),
              monolith::domain::errors::CURRENCY_MISMATCH);
}

TEST_F(OrderTest, AddItem_QuantityOverflow_RejectedAndOrderUnchanged) {
    auto order = makeDraft();
    order.addItem("sku-1", "Widget", std::numeric_limits<int>::max(), Money(0, "USD"));

    EXPECT_EQ(codeOf([&] { order.addItem("sku-1", "Widget", 1, Money(0, "USD")); }), errors::INVALID_QUANTITY);
    ASSERT_EQ(order.items().size(), 1u);
    EXPECT_EQ(order.items().front().quantity, std::numeric_limits<int>::max());
}

TEST_F(OrderTest, AddItem_AmountOverflow_RejectedAndOrderUnchanged) {
    auto order = makeDraft();
    const Money huge(std::numeric_limits<int64_t>::max(), "EUR");

    EXPECT_EQ(codeOf([&] { order.addItem("sku-1", "Widget", 2, huge); }),
              monolith::domain::errors::AMOUNT_OVERFLOW);
    EXPECT_TRUE(order.items().empty());
    EXPECT_TRUE(order.total().isZero());

    order.addItem("sku-1", "Widget", 1, huge);
    EXPECT_EQ(codeOf([&] { order.addItem("sku-2", "Gadget", 1, Money(1, "EUR")); }),
              monolith::domain::errors::AMOUNT_OVERFLOW);
    EXPECT_EQ(order.items().size(), 1u);
    EXPECT_EQ(order.total(), huge);
}

TEST_F(OrderTest, RemoveItem_MissingProduct_Throws) {
    auto order = makeDraft();
    order.addItem("sku-1", "Widget", 1, Money(100, "USD"));

    EXPECT_EQ(codeOf([&] { order.removeItem("sku-9"); }), errors::ITEM_NOT_FOUND);

    order.removeItem("sku-1");
    EXPECT_TRUE(order.items().empty());
    EXPECT_TRUE(order.total().isZero());
}

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST_F(OrderTest, Submit_EmptyOrder_Throws) {
    auto order = makeDraft();
    EXPECT_EQ(codeOf([&] { order.submit(); }), errors::ORDER_EMPTY);
    EXPECT_EQ(order.status(), OrderStatus::DRAFT);
}

TEST_F(OrderTest, Submit_RecordsOrderSubmittedWithTotal) {
    auto order = makeDraft();
    order.addItem("sku-1", "Widget", 3, Money(250, "EUR"));

    order.submit();

    EXPECT_EQ(order.status(), OrderStatus::PENDING);
    auto recorded = order.popDomainEvents();
    ASSERT_EQ(recorded.size(), 1u);

    const auto* submitted = dynamic_cast<const OrderSubmittedEvent*>(recorded.front().get());
    ASSERT_NE(submitted, nullptr);
    EXPECT_EQ(submitted->orderId(), order.id().value());
    EXPECT_EQ(submitted->userId(), userId_);
    EXPECT_EQ(submitted->totalAmount(), 750);
    EXPECT_EQ(submitted->currency(), "EUR");
}

TEST_F(OrderTest, NonDraft_RejectsItemChanges) {
    auto order = makePending();

    EXPECT_EQ(codeOf([&] { order.addItem("sku-2", "Gadget", 1, Money(100, "EUR")); }), errors::ORDER_NOT_DRAFT);
    EXPECT_EQ(codeOf([&] { order.removeItem("sku-1"); }), errors::ORDER_NOT_DRAFT);
    EXPECT_EQ(codeOf([&] { order.submit(); }), errors::ORDER_NOT_DRAFT);
}

TEST_F(OrderTest, ConfirmAndComplete) {
    auto order = makeDraft();
    EXPECT_EQ(codeOf([&] { order.confirm(); }), errors::ORDER_NOT_PENDING);
    EXPECT_EQ(codeOf([&] { order.complete(); }), errors::ORDER_NOT_CONFIRMED);

    order = makePending();
    order.confirm();
    EXPECT_EQ(order.status(), OrderStatus::CONFIRMED);

    order.complete();
    EXPECT_EQ(order.status(), OrderStatus::COMPLETED);
    EXPECT_EQ(codeOf([&] { order.cancel(); }), errors::ORDER_COMPLETED);
}

TEST_F(OrderTest, Cancel_RecordsOrderCancelledOnce) {
    auto order = makePending();

    order.cancel();

    EXPECT_EQ(order.status(), OrderStatus::CANCELLED);
    auto recorded = order.popDomainEvents();
    ASSERT_EQ(recorded.size(), 1u);
    EXPECT_EQ(recorded.front()->eventType(), events::contracts::ORDER_CANCELLED);

    EXPECT_EQ(codeOf([&] { order.cancel(); }), errors::ORDER_ALREADY_CANCELLED);
    EXPECT_TRUE(order.popDomainEvents().empty());
}

TEST_F(OrderTest, Cancel_DraftIsAllowed) {
    auto order = makeDraft();
    EXPECT_NO_THROW(order.cancel());
    EXPECT_EQ(order.status(), OrderStatus::CANCELLED);
}
