/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <memory>

#include "conduct/Mailbox.hpp"
#include "conduct/Message.hpp"
#include "conduct/Operation.hpp"
#include "conduct/call/Protocol.hpp"

namespace conduct {

/**
 * BlockProxy - a caller's closure as seen from the callee
 *
 * Bound to the task that supplied the closure (its mailbox and id). The
 * closure's captures belong to that task, so with ExecutionSite::receiver
 * every invocation from the callee is shipped back as a BlockCall and the
 * callee's task suspends until the BlockResponse arrives.
 */
class BlockProxy : public std::enable_shared_from_this<BlockProxy> {
public:
    BlockProxy(Block block, MailboxRef mailbox, TaskId task, ExecutionSite execution);

    /**
     * Invoke the closure on its owning task and wait for the result.
     * Must run inside a Task of the callee.
     * @throws DeadActorError if the owning mailbox no longer accepts messages
     */
    std::any call(const Args& args) const;

    /// What the operation receives: a round-trip callable, or nothing for ExecutionSite::sender.
    Block to_block() const;

    const Block& block() const { return block_; }
    const MailboxRef& mailbox() const { return mailbox_; }
    TaskId task() const { return task_; }
    ExecutionSite execution() const { return execution_; }

private:
    Block block_;
    MailboxRef mailbox_;
    TaskId task_;
    ExecutionSite execution_;
};

/**
 * BlockCall - request to run a proxy's closure on its owning task
 *
 * Addressed to the task that owns the closure, so that task's sync-call wait
 * loop picks it up. Replies to reply_to with a BlockResponse for task().
 */
class BlockCall : public Dispatchable {
public:
    BlockCall(std::shared_ptr<const BlockProxy> proxy, MailboxRef reply_to, Args arguments, TaskId task);

    int get_message_id() const override { return MSG_BLOCK_CALL; }
    TaskId addressed_to() const override { return proxy_->task(); }

    /// Waiting task of the invoker; the BlockResponse resumes it.
    TaskId task() const { return task_; }
    const Args& arguments() const { return arguments_; }

    /// Run the closure in a new Task and send the BlockResponse.
    void dispatch() override;

private:
    std::shared_ptr<const BlockProxy> proxy_;
    MailboxRef reply_to_;
    Args arguments_;
    TaskId task_;
};

} // namespace conduct
