/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/call/Call.hpp"
#include "conduct/Actor.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Task.hpp"

namespace conduct {

Call::Call(std::string method, Args arguments, Block block, ExecutionSite execution,
           const MailboxRef& owner, TaskId owner_task)
    : method_(std::move(method))
    , arguments_(std::move(arguments))
{
    if (block) {
        if (Task::current().exclusive()) {
            throw ConfigurationError("cannot execute blocks on sender in exclusive mode");
        }
        block_ = std::make_shared<BlockProxy>(std::move(block), owner, owner_task, execution);
    }
}

std::string Call::describe(const Actor& target)
{
    try {
        return target.inspect();
    } catch (const std::exception&) {
        return target.simulated_inspect();
    }
}

const Operation& Call::check(const Actor& target) const
{
    try {
        const Operation* op = target.find_operation(method_);
        if (!op) {
            throw MethodMissingError(method_, describe(target));
        }
        if (!op->arity.accepts(arguments_.size())) {
            throw ArgumentCountError(arguments_.size(), op->arity.describe());
        }
        return *op;
    } catch (const std::exception&) {
        throw AbortError(std::current_exception());
    }
}

std::any Call::dispatch(Actor& target)
{
    const Operation& op = check(target);
    return op.handler(arguments_, block_ ? block_->to_block() : Block());
}

} // namespace conduct
