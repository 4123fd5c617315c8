/**
 * @file OrderSubmittedEventHandlerTest.cpp
 * @brief Тесты уведомления о заказе: содержимое и идемпотентность
 */

#include <gtest/gtest.h>
#include "notifications/application/handlers/OrderSubmittedEventHandler.hpp"
#include "events/InMemoryEventBus.hpp"
#include "mocks/RecordingNotificationSender.hpp"

using namespace monolith;
using namespace monolith::tests;
using monolith::notifications::application::handlers::OrderSubmittedEventHandler;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class OrderSubmittedEventHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sender_ = std::make_shared<RecordingNotificationSender>();
        handler_ = std::make_shared<OrderSubmittedEventHandler>(sender_);
        bus_.subscribe(events::contracts::ORDER_SUBMITTED, handler_);
    }

    events::DomainEventPtr submitted(const std::string& orderId = "order-1") {
        return std::make_shared<events::contracts::OrderSubmittedEvent>(orderId, "user-1", 2100, "EUR");
    }

    std::shared_ptr<RecordingNotificationSender> sender_;
    std::shared_ptr<OrderSubmittedEventHandler> handler_;
    events::InMemoryEventBus bus_;
};

// ============================================================================
// TESTS
// ============================================================================

TEST_F(OrderSubmittedEventHandlerTest, SendsNotificationToOrderOwner) {
    bus_.publish(Context::background(), submitted());

    ASSERT_EQ(sender_->sent().size(), 1u);
    const auto& notification = sender_->sent().front();
    EXPECT_EQ(notification.recipientId, "user-1");
    EXPECT_EQ(notification.subject, "Order submitted");
    EXPECT_NE(notification.body.find("order-1"), std::string::npos);
    EXPECT_NE(notification.body.find("2100 EUR"), std::string::npos);
}

TEST_F(OrderSubmittedEventHandlerTest, ReplayedEvent_IsSkipped) {
    auto event = submitted();

    bus_.publish(Context::background(), event);
    bus_.publish(Context::background(), event);

    EXPECT_EQ(sender_->sent().size(), 1u);
    EXPECT_EQ(handler_->processedCount(), 1u);
}

TEST_F(OrderSubmittedEventHandlerTest, DistinctEvents_AreAllDelivered) {
    bus_.publish(Context::background(), submitted("order-1"));
    bus_.publish(Context::background(), submitted("order-2"));

    EXPECT_EQ(sender_->sent().size(), 2u);
}

TEST_F(OrderSubmittedEventHandlerTest, FailedSend_CanBeRetried) {
    auto event = submitted();
    sender_->failNextSend();

    bus_.publish(Context::background(), event);
    EXPECT_TRUE(sender_->sent().empty());
    EXPECT_EQ(handler_->processedCount(), 0u);

    bus_.publish(Context::background(), event);
    EXPECT_EQ(sender_->sent().size(), 1u);
}

TEST_F(OrderSubmittedEventHandlerTest, OldestEventIds_AreEvicted) {
    auto handler = std::make_shared<OrderSubmittedEventHandler>(sender_, 2);
    events::InMemoryEventBus bus;
    bus.subscribe(events::contracts::ORDER_SUBMITTED, handler);

    auto first = submitted("order-1");
    auto second = submitted("order-2");
    auto third = submitted("order-3");

    bus.publish(Context::background(), first);
    bus.publish(Context::background(), second);
    bus.publish(Context::background(), third);
    EXPECT_EQ(handler->processedCount(), 2u);

    // Самый старый eventId вытеснен, поэтому повтор снова отправляется
    bus.publish(Context::background(), first);
    EXPECT_EQ(sender_->sent().size(), 4u);

    // Третье событие ещё помнится
    bus.publish(Context::background(), third);
    EXPECT_EQ(sender_->sent().size(), 4u);
    EXPECT_EQ(handler->processedCount(), 2u);
}

TEST(OrderSubmittedEventHandlerConstructionTest, NullSender_Throws) {
    EXPECT_THROW(OrderSubmittedEventHandler(nullptr), std::invalid_argument);
}

TEST(OrderSubmittedEventHandlerConstructionTest, ZeroCapacity_Throws) {
    EXPECT_THROW(OrderSubmittedEventHandler(std::make_shared<RecordingNotificationSender>(), 0),
                 std::invalid_argument);
}
