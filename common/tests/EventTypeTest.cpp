/**
 * @file EventTypeTest.cpp
 * @brief Тесты EventType и базовых полей DomainEvent
 */

#include <gtest/gtest.h>
#include "events/EventType.hpp"
#include "events/EventExceptions.hpp"
#include "events/contracts/UserEvents.hpp"
#include "events/contracts/OrderEvents.hpp"
#include "domain/Uuid.hpp"
#include "mocks/TestEvents.hpp"

using namespace monolith;
using namespace monolith::events;

// ============================================================================
// FORMAT
// ============================================================================

TEST(EventTypeTest, ValidFormat_Accepted) {
    EXPECT_TRUE(EventType::isValid("users.UserDeleted"));
    EXPECT_TRUE(EventType::isValid("orders.OrderSubmitted"));
    EXPECT_TRUE(EventType::isValid("a.Bc"));
}

TEST(EventTypeTest, InvalidFormat_Rejected) {
    EXPECT_FALSE(EventType::isValid(""));
    EXPECT_FALSE(EventType::isValid("users"));
    EXPECT_FALSE(EventType::isValid("Users.UserDeleted"));
    EXPECT_FALSE(EventType::isValid("users.userDeleted"));
    EXPECT_FALSE(EventType::isValid("users.User_Deleted"));
    EXPECT_FALSE(EventType::isValid("users.U"));
    EXPECT_FALSE(EventType::isValid("users.UserDeleted.Extra"));
    EXPECT_FALSE(EventType::isValid("user2.UserDeleted"));
}

TEST(EventTypeTest, Constructor_InvalidFormat_Throws) {
    EXPECT_THROW(EventType("not-an-event"), InvalidEventTypeException);
    EXPECT_THROW(EventType("orders.submitted"), std::invalid_argument);
}

TEST(EventTypeTest, ModuleAndName_SplitAtDot) {
    EventType type("orders.OrderCancelled");

    EXPECT_EQ(type.module(), "orders");
    EXPECT_EQ(type.name(), "OrderCancelled");
    EXPECT_EQ(type.str(), "orders.OrderCancelled");
}

TEST(EventTypeTest, Contracts_HaveExpectedValues) {
    EXPECT_EQ(contracts::USER_DELETED.str(), "users.UserDeleted");
    EXPECT_EQ(contracts::ORDER_SUBMITTED.str(), "orders.OrderSubmitted");
    EXPECT_NE(contracts::USER_CREATED, contracts::USER_UPDATED);
}

// ============================================================================
// DOMAIN EVENT BASE FIELDS
// ============================================================================

TEST(DomainEventTest, Construction_AssignsIdAndTimestamp) {
    auto before = domain::Timestamp::now();
    contracts::UserDeletedEvent event("user-42");
    auto after = domain::Timestamp::now();

    EXPECT_TRUE(domain::isUuid(event.eventId()));
    EXPECT_EQ(event.eventType(), contracts::USER_DELETED);
    EXPECT_EQ(event.aggregateId(), "user-42");
    EXPECT_EQ(event.userId(), "user-42");
    EXPECT_FALSE(event.occurredAt() < before);
    EXPECT_FALSE(event.occurredAt() > after);
}

TEST(DomainEventTest, EventIds_AreUnique) {
    contracts::UserDeletedEvent first("user-1");
    contracts::UserDeletedEvent second("user-1");

    EXPECT_NE(first.eventId(), second.eventId());
}

TEST(DomainEventTest, ToJson_ContainsBaseAndPayload) {
    contracts::OrderSubmittedEvent event("order-1", "user-1", 2500, "USD");

    auto json = event.toJson();

    EXPECT_EQ(json["event_type"], "orders.OrderSubmitted");
    EXPECT_EQ(json["event_id"], event.eventId());
    EXPECT_EQ(json["aggregate_id"], "order-1");
    EXPECT_EQ(json["user_id"], "user-1");
    EXPECT_EQ(json["total_amount"], 2500);
    EXPECT_EQ(json["currency"], "USD");
    EXPECT_EQ(json["occurred_at"].get<std::string>().back(), 'Z');
}

TEST(DomainEventTest, PolymorphicToJson_UsesDerivedFields) {
    auto event = tests::makeEvent(tests::PING_SENT, 7);
    const DomainEvent& base = *event;

    EXPECT_EQ(base.toJson()["sequence"], 7);
}
