/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/call/AsyncCall.hpp"
#include "conduct/Actor.hpp"
#include "conduct/CallChain.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Logger.hpp"
#include "conduct/Task.hpp"

namespace conduct {

AsyncCall::AsyncCall(std::string method, Args arguments, Block block, ExecutionSite execution)
    : Call(std::move(method), std::move(arguments), std::move(block), execution,
           Task::current().mailbox(), Task::current().id())
{
    // nobody waits on an async call, so a round trip to the sender could never be served
    if (this->block() && this->block()->execution() == ExecutionSite::receiver)
        throw ConfigurationError("async calls cannot run blocks on the receiver");
}

std::any AsyncCall::dispatch(Actor& target)
{
    CallChain::Scope chain(CallChain::generate());
    try {
        Call::dispatch(target);
    } catch (const AbortError& ex) {
        Logger::debug(target.class_name() + ": async call `" + method() + "' aborted!\n" +
                      Logger::format_exception(ex.cause()));
    }
    return std::any();
}

void AsyncCall::cleanup()
{
    Logger::debug("async call `" + method() + "' discarded: target is dead");
}

} // namespace conduct
