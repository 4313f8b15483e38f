/*
 * Tests for SuccessResponse, ErrorResponse and BlockResponse
 */

#include <algorithm>
#include <stdexcept>
#include "test_support.hpp"
#include "conduct/call/Responses.hpp"
#include "conduct/call/SyncCall.hpp"

using namespace conduct_test;

class ResponseTest : public CallerTest {
protected:
    SyncCall call{mailbox, 5, "chain-5", "mul"};
};

TEST_F(ResponseTest, SuccessValueIsReturnedUnchanged) {
    SuccessResponse response(task.id(), std::string("result"));
    EXPECT_EQ(std::any_cast<std::string>(response.value()), "result");
}

TEST_F(ResponseTest, ErrorResponseKnowsItsCall) {
    ErrorResponse response(call, std::make_exception_ptr(std::logic_error("x")));
    EXPECT_EQ(response.get_message_id(), MSG_ERROR_RESPONSE);
    EXPECT_EQ(response.task(), 5u);
    EXPECT_EQ(response.method(), "mul");
    EXPECT_TRUE(response.error());
}

TEST_F(ResponseTest, AbortIsUnwrappedToItsCause) {
    auto cause = std::make_exception_ptr(MethodMissingError("mul", "#<Calculator name=calc>"));
    const void* original = nullptr;
    try {
        std::rethrow_exception(cause);
    } catch (const MethodMissingError& e) {
        original = &e;
    }

    ErrorResponse response(call, std::make_exception_ptr(AbortError(cause)));
    try {
        response.value();
        FAIL() << "expected MethodMissingError";
    } catch (const AbortError&) {
        FAIL() << "AbortError must not reach the caller";
    } catch (const MethodMissingError& e) {
        EXPECT_EQ(&e, original);
        const auto& trace = e.backtrace();
        EXPECT_NE(std::find(trace.begin(), trace.end(), REMOTE_CALL_FRAME), trace.end());
    }
}

TEST_F(ResponseTest, EachRaiseAddsAnotherBoundary) {
    ErrorResponse response(call, std::make_exception_ptr(DeadActorError("gone")));
    std::size_t first = 0;
    try {
        response.value();
    } catch (const DeadActorError& e) {
        first = e.backtrace().size();
    }
    try {
        response.value();
    } catch (const DeadActorError& e) {
        auto trace = e.backtrace();
        EXPECT_GT(trace.size(), first);
        EXPECT_EQ(std::count(trace.begin(), trace.end(), REMOTE_CALL_FRAME), 2);
    }
}

TEST_F(ResponseTest, ForeignExceptionsAreRethrownAsIs) {
    ErrorResponse response(call, std::make_exception_ptr(std::logic_error("plain")));
    try {
        response.value();
        FAIL() << "expected logic_error";
    } catch (const std::logic_error& e) {
        EXPECT_STREQ(e.what(), "plain");
    }
}

TEST_F(ResponseTest, DispatchResumesTheWaitingTaskOnce) {
    auto response = std::make_shared<SuccessResponse>(task.id(), 9);
    mailbox->send(response);

    std::any resumed = task.suspend("callwait");
    auto handed = std::any_cast<std::shared_ptr<const Response>>(resumed);
    EXPECT_EQ(handed.get(), response.get());
    EXPECT_EQ(std::any_cast<int>(handed->value()), 9);

    // the task is running again; a second delivery finds nobody waiting
    EXPECT_THROW(response->dispatch(), TaskError);
}

TEST_F(ResponseTest, BlockResponseResumesWithTheRawResult) {
    mailbox->send(std::make_shared<BlockResponse>(task.id(), std::any(3)));
    EXPECT_EQ(std::any_cast<int>(task.suspend("invokeblock")), 3);
}

TEST_F(ResponseTest, BlockResponseCarriesFailureUnannotated) {
    auto cause = std::make_exception_ptr(DeadActorError("closure failed"));
    std::size_t frames = 0;
    try {
        std::rethrow_exception(cause);
    } catch (const DeadActorError& e) {
        frames = e.backtrace().size();
    }

    mailbox->send(std::make_shared<BlockResponse>(task.id(), cause));
    try {
        task.suspend("invokeblock");
        FAIL() << "expected DeadActorError";
    } catch (const DeadActorError& e) {
        EXPECT_EQ(e.backtrace().size(), frames);
    }
}
