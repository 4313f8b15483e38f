/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/call/BlockProxy.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Logger.hpp"
#include "conduct/Task.hpp"
#include "conduct/call/Responses.hpp"

namespace conduct {

BlockProxy::BlockProxy(Block block, MailboxRef mailbox, TaskId task, ExecutionSite execution)
    : block_(std::move(block))
    , mailbox_(std::move(mailbox))
    , task_(task)
    , execution_(execution)
{
}

std::any BlockProxy::call(const Args& args) const
{
    Task& task = Task::current();
    auto request = std::make_shared<BlockCall>(shared_from_this(), task.mailbox(), args, task.id());
    if (!mailbox_->send(request)) {
        throw DeadActorError("attempted to call a block owned by a dead actor");
    }
    return task.suspend("invokeblock");
}

Block BlockProxy::to_block() const
{
    if (execution_ == ExecutionSite::sender) {
        return Block();
    }
    std::shared_ptr<const BlockProxy> self = shared_from_this();
    return [self](const Args& args) { return self->call(args); };
}

BlockCall::BlockCall(std::shared_ptr<const BlockProxy> proxy, MailboxRef reply_to, Args arguments, TaskId task)
    : proxy_(std::move(proxy))
    , reply_to_(std::move(reply_to))
    , arguments_(std::move(arguments))
    , task_(task)
{
}

void BlockCall::dispatch()
{
    Task& owner = Task::current();
    std::shared_ptr<BlockResponse> response;
    {
        Task task(owner.mailbox(), owner.actor());
        try {
            response = std::make_shared<BlockResponse>(task_, proxy_->block()(arguments_));
        } catch (...) {
            response = std::make_shared<BlockResponse>(task_, std::current_exception());
        }
    }
    if (!reply_to_->send(response)) {
        Logger::debug("block response for task " + std::to_string(task_) + " dropped: invoker is gone");
    }
}

} // namespace conduct
