/*
 * Tests for SyncCall dispatch, cleanup and response handling
 */

#include <algorithm>
#include "test_support.hpp"
#include "conduct/call/SyncCall.hpp"

using namespace conduct_test;

class SyncCallTest : public CallerTest {
protected:
    Calculator calc;

    std::shared_ptr<const Response> next_response() {
        auto m = mailbox->receive();
        auto response = std::dynamic_pointer_cast<const Response>(m);
        EXPECT_NE(response, nullptr);
        return response;
    }
};

static bool has_frame(const Error& e, const std::string& frame) {
    const auto& trace = e.backtrace();
    return std::find(trace.begin(), trace.end(), frame) != trace.end();
}

TEST_F(SyncCallTest, SuccessSendsOneSuccessResponse) {
    SyncCall call("add", {2, 3});
    EXPECT_EQ(std::any_cast<int>(call.dispatch(calc)), 5);

    ASSERT_EQ(mailbox->length(), 1u);
    auto response = next_response();
    EXPECT_EQ(response->get_message_id(), MSG_SUCCESS_RESPONSE);
    EXPECT_EQ(response->task(), task.id());
    EXPECT_EQ(std::any_cast<int>(response->value()), 5);
}

TEST_F(SyncCallTest, ValueResumesTheWaitingTask) {
    auto call = std::make_shared<SyncCall>("add", Args{2, 3});
    call->dispatch(calc);
    EXPECT_EQ(std::any_cast<int>(call->value()), 5);
    EXPECT_TRUE(mailbox->is_empty());
}

TEST_F(SyncCallTest, WaitReturnsTheResponse) {
    auto call = std::make_shared<SyncCall>("sum", Args{1, 2, 3});
    call->dispatch(calc);
    EXPECT_EQ(std::any_cast<int>(call->wait()->value()), 6);
    EXPECT_TRUE(mailbox->is_empty());
}

TEST_F(SyncCallTest, WaitSkipsSystemEventsOutsideAnActor) {
    auto call = std::make_shared<SyncCall>("add", Args{1, 1});
    mailbox->send(new Ping());
    call->dispatch(calc);
    EXPECT_EQ(std::any_cast<int>(call->wait()->value()), 2);
    EXPECT_TRUE(mailbox->is_empty());
}

TEST_F(SyncCallTest, AbortIsReportedAndSwallowed) {
    auto call = std::make_shared<SyncCall>("mul", Args{1, 2});
    EXPECT_NO_THROW(call->dispatch(calc));

    ASSERT_EQ(mailbox->length(), 1u);
    try {
        call->value();
        FAIL() << "expected MethodMissingError";
    } catch (const MethodMissingError& e) {
        EXPECT_EQ(e.method(), "mul");
        EXPECT_TRUE(has_frame(e, REMOTE_CALL_FRAME));
    }
}

TEST_F(SyncCallTest, ArgumentCountAbortReachesCallerUnwrapped) {
    auto call = std::make_shared<SyncCall>("add", Args{1});
    EXPECT_NO_THROW(call->dispatch(calc));
    try {
        call->value();
        FAIL() << "expected ArgumentCountError";
    } catch (const ArgumentCountError& e) {
        EXPECT_EQ(e.given(), 1u);
        EXPECT_STREQ(e.what(), "wrong number of arguments (1 for 2)");
    }
}

TEST_F(SyncCallTest, CalleeFaultIsReportedAndRethrown) {
    auto call = std::make_shared<SyncCall>("fail");
    std::size_t callee_frames = 0;
    try {
        call->dispatch(calc);
        FAIL() << "expected BoomError";
    } catch (const BoomError& e) {
        EXPECT_EQ(&e, calc.last_thrown.load());
        EXPECT_FALSE(has_frame(e, REMOTE_CALL_FRAME));
        callee_frames = e.backtrace().size();
    }

    ASSERT_EQ(mailbox->length(), 1u);
    try {
        call->value();
        FAIL() << "expected BoomError";
    } catch (const BoomError& e) {
        EXPECT_EQ(&e, calc.last_thrown.load());
        EXPECT_TRUE(has_frame(e, REMOTE_CALL_FRAME));
        EXPECT_GT(e.backtrace().size(), callee_frames);
    }
}

TEST_F(SyncCallTest, CleanupAnswersWithExactlyOneDeadActorError) {
    auto call = std::make_shared<SyncCall>("add", Args{1, 2});
    call->cleanup();

    ASSERT_EQ(mailbox->length(), 1u);
    try {
        call->value();
        FAIL() << "expected DeadActorError";
    } catch (const DeadActorError& e) {
        EXPECT_STREQ(e.what(), "attempted to call a dead actor");
    }
    EXPECT_TRUE(mailbox->is_empty());
}

TEST_F(SyncCallTest, ResponseToDeadSenderIsDropped) {
    auto call = std::make_shared<SyncCall>("add", Args{1, 2});
    mailbox->close();
    EXPECT_EQ(std::any_cast<int>(call->dispatch(calc)), 3);
    EXPECT_NO_THROW(call->cleanup());
}

TEST_F(SyncCallTest, ChainIdIsSetDuringSuccessAndClearedAfter) {
    SyncCall call("chain");
    EXPECT_FALSE(call.chain_id().empty());
    std::any seen = call.dispatch(calc);
    EXPECT_EQ(std::any_cast<std::string>(seen), call.chain_id());
    EXPECT_EQ(CallChain::current_id(), "");
}

TEST_F(SyncCallTest, ChainIdIsSetDuringAbortAndClearedAfter) {
    SyncCall call("nope");
    call.dispatch(calc);
    EXPECT_EQ(calc.inspected_chain, call.chain_id());
    EXPECT_EQ(CallChain::current_id(), "");
}

TEST_F(SyncCallTest, ChainIdIsSetDuringFaultAndClearedAfter) {
    SyncCall call("fail");
    EXPECT_THROW(call.dispatch(calc), BoomError);
    EXPECT_EQ(calc.last_chain, call.chain_id());
    EXPECT_EQ(CallChain::current_id(), "");
}

TEST_F(SyncCallTest, InheritsTheActiveChain) {
    {
        CallChain::Scope scope("outer-chain");
        SyncCall call("add", {1, 2});
        EXPECT_EQ(call.chain_id(), "outer-chain");
    }
    SyncCall first("add", {1, 2});
    SyncCall second("add", {1, 2});
    EXPECT_FALSE(first.chain_id().empty());
    EXPECT_NE(first.chain_id(), second.chain_id());
}

TEST_F(SyncCallTest, ExplicitSenderAndTask) {
    auto other = std::make_shared<Mailbox>();
    SyncCall call(other, 77, "", "add", {4, 5});
    EXPECT_EQ(call.sender(), other);
    EXPECT_EQ(call.task(), 77u);
    EXPECT_FALSE(call.chain_id().empty());

    call.dispatch(calc);
    EXPECT_TRUE(mailbox->is_empty());
    ASSERT_EQ(other->length(), 1u);
    EXPECT_EQ(other->receive()->addressed_to(), 77u);
}

TEST_F(SyncCallTest, OnlyTheCallingTaskMayAwaitTheResponse) {
    auto call = std::make_shared<SyncCall>("add", Args{1, 2});
    call->dispatch(calc);
    {
        Task other(mailbox);
        EXPECT_THROW(call->response(), TaskError);
    }
    EXPECT_EQ(std::any_cast<int>(call->value()), 3);
}
