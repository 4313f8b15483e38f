/*
 * Tests for Message classes
 */

#include <gtest/gtest.h>
#include <set>
#include "conduct/Message.hpp"
#include "conduct/msg/Start.hpp"
#include "conduct/msg/Shutdown.hpp"
#include "conduct/call/Protocol.hpp"
#include "conduct/call/Responses.hpp"

using namespace conduct;

// Test custom message with ID
struct TestMessage : public Message_N<100> {
    int value;
    TestMessage(int v = 0) : value(v) {}
};

struct AnotherMessage : public Message_N<200> {
    std::string text;
    AnotherMessage(const std::string& t = "") : text(t) {}
};

TEST(MessageTest, MessageIdTemplate) {
    TestMessage msg;
    EXPECT_EQ(msg.get_message_id(), 100);
}

TEST(MessageTest, DifferentMessageIds) {
    TestMessage msg1;
    AnotherMessage msg2;
    EXPECT_NE(msg1.get_message_id(), msg2.get_message_id());
}

TEST(MessageTest, MessageDefaultFields) {
    TestMessage msg;
    EXPECT_EQ(msg.sender, nullptr);
    EXPECT_EQ(msg.destination, nullptr);
    EXPECT_EQ(msg.addressed_to(), NO_TASK);
}

TEST(MessageTest, StartMessageId) {
    msg::Start start;
    EXPECT_EQ(start.get_message_id(), 6);
}

TEST(MessageTest, ShutdownMessageId) {
    msg::Shutdown shutdown;
    EXPECT_EQ(shutdown.get_message_id(), 5);
}

TEST(MessageTest, LifecycleMessagesAreSystemEvents) {
    msg::Start start;
    msg::Shutdown shutdown;
    TestMessage plain;
    EXPECT_NE(dynamic_cast<const msg::SystemEvent*>(static_cast<const Message*>(&start)), nullptr);
    EXPECT_NE(dynamic_cast<const msg::SystemEvent*>(static_cast<const Message*>(&shutdown)), nullptr);
    EXPECT_EQ(dynamic_cast<const msg::SystemEvent*>(static_cast<const Message*>(&plain)), nullptr);
}

TEST(MessageTest, MessageCopy) {
    TestMessage original(42);
    TestMessage copy(original);
    EXPECT_EQ(copy.value, 42);
    // destination should be reset on copy
    EXPECT_EQ(copy.destination, nullptr);
}

TEST(MessageTest, CallProtocolIdsAreDistinct) {
    std::set<int> ids = {MSG_SYNC_CALL, MSG_ASYNC_CALL, MSG_BLOCK_CALL,
                         MSG_SUCCESS_RESPONSE, MSG_ERROR_RESPONSE, MSG_BLOCK_RESPONSE};
    EXPECT_EQ(ids.size(), 6u);
    for (int id : ids) {
        EXPECT_GE(id, 800);
        EXPECT_LT(id, 900);
    }
}

TEST(MessageTest, ResponsesAreAddressedToTheirTask) {
    SuccessResponse ok(42, 1);
    BlockResponse block(43, std::any(2));
    EXPECT_EQ(ok.get_message_id(), MSG_SUCCESS_RESPONSE);
    EXPECT_EQ(ok.addressed_to(), 42u);
    EXPECT_EQ(block.get_message_id(), MSG_BLOCK_RESPONSE);
    EXPECT_EQ(block.addressed_to(), 43u);
}
