/*
 * Tests for Call: capability check, argument count and block handling
 */

#include "test_support.hpp"
#include "conduct/call/AsyncCall.hpp"
#include "conduct/call/SyncCall.hpp"

using namespace conduct_test;

class CallTest : public CallerTest {
protected:
    Calculator calc;
};

TEST_F(CallTest, CheckAcceptsMatchingSignature) {
    SyncCall call("add", {1, 2});
    const Operation& op = call.check(calc);
    EXPECT_EQ(op.arity.required, 2u);
    EXPECT_FALSE(op.arity.variadic);
}

TEST_F(CallTest, UnknownOperationAbortsWithMethodMissing) {
    SyncCall call("mul", {1, 2});
    expect_abort_with<MethodMissingError>([&] { call.check(calc); },
                                          "undefined operation `mul' for #<conduct_test::Calculator name=calc>");
}

TEST_F(CallTest, MethodMissingFallsBackWhenInspectFails) {
    Fragile fragile;
    SyncCall call("poke");
    expect_abort_with<MethodMissingError>([&] { call.check(fragile); }, "name=fragile alive=true");
    expect_abort_with<MethodMissingError>([&] { call.check(fragile); }, ":0x");
}

TEST_F(CallTest, WrongArgumentCountExact) {
    SyncCall call("add", {1, 2, 3});
    expect_abort_with<ArgumentCountError>([&] { call.check(calc); }, "wrong number of arguments (3 for 2)");
}

TEST_F(CallTest, OptionalParametersWidenTheRange) {
    EXPECT_NO_THROW(SyncCall("scale", {3}).check(calc));
    EXPECT_NO_THROW(SyncCall("scale", {3, 4}).check(calc));

    SyncCall call("scale", {3, 4, 5});
    expect_abort_with<ArgumentCountError>([&] { call.check(calc); }, "(3 for 1..2)");
}

TEST_F(CallTest, VariadicOperationsHaveNoUpperBound) {
    EXPECT_NO_THROW(SyncCall("sum").check(calc));
    EXPECT_NO_THROW(SyncCall("sum", {1, 2, 3, 4, 5, 6}).check(calc));

    SyncCall call("label");
    expect_abort_with<ArgumentCountError>([&] { call.check(calc); }, "(0 for 1+)");
}

TEST_F(CallTest, DispatchMatchesDirectInvocation) {
    Args args{std::string("total"), 1, 2};
    SyncCall call("label", args);
    std::any remote = call.dispatch(calc);
    std::any direct = calc.label(args, Block());
    EXPECT_EQ(std::any_cast<std::string>(remote), std::any_cast<std::string>(direct));
    EXPECT_EQ(std::any_cast<std::string>(remote), "total:2");
}

TEST_F(CallTest, CallExposesWhatItCarries) {
    SyncCall call("add", {1, 2});
    EXPECT_EQ(call.method(), "add");
    EXPECT_EQ(call.arguments().size(), 2u);
    EXPECT_EQ(call.block(), nullptr);

    SyncCall with_block("apply", {1}, twice);
    ASSERT_NE(with_block.block(), nullptr);
    EXPECT_EQ(with_block.block()->task(), task.id());
    EXPECT_EQ(with_block.block()->mailbox(), mailbox);
    EXPECT_EQ(with_block.block()->execution(), ExecutionSite::receiver);
}

TEST_F(CallTest, ExclusiveModeRejectsBlockAtConstruction) {
    task.set_exclusive(true);
    EXPECT_THROW(std::make_shared<SyncCall>("apply", Args{1}, twice), ConfigurationError);
    EXPECT_THROW(std::make_shared<AsyncCall>("apply", Args{1}, twice), ConfigurationError);
    EXPECT_NO_THROW(std::make_shared<SyncCall>("add", Args{1}));
}

TEST_F(CallTest, SenderExecutionSitePassesNoBlock) {
    SyncCall on_sender("has_block", {}, twice, ExecutionSite::sender);
    EXPECT_FALSE(std::any_cast<bool>(on_sender.dispatch(calc)));

    SyncCall on_receiver("has_block", {}, twice, ExecutionSite::receiver);
    EXPECT_TRUE(std::any_cast<bool>(on_receiver.dispatch(calc)));

    SyncCall without("has_block");
    EXPECT_FALSE(std::any_cast<bool>(without.dispatch(calc)));
}
