/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <memory>
#include <string>

#include "conduct/Mailbox.hpp"
#include "conduct/Message.hpp"
#include "conduct/Operation.hpp"
#include "conduct/call/BlockProxy.hpp"
#include "conduct/call/Protocol.hpp"

namespace conduct {

class Actor;

/**
 * Call - request to run a named operation on another actor
 *
 * Immutable once built. A block is wrapped in a BlockProxy bound to the task
 * that built the call; building a call with a block from an exclusive task
 * fails right away with ConfigurationError.
 */
class Call : public Message {
public:
    const std::string& method() const { return method_; }
    const Args& arguments() const { return arguments_; }
    const std::shared_ptr<const BlockProxy>& block() const { return block_; }

    /**
     * Look up the operation and validate the argument count.
     * @return the capability table entry to run
     * @throws AbortError wrapping MethodMissingError or ArgumentCountError
     */
    const Operation& check(const Actor& target) const;

    /// check(), then run the operation. Returns its result or lets its exception through.
    virtual std::any dispatch(Actor& target);

    /// The target died before the call could run.
    virtual void cleanup() = 0;

protected:
    Call(std::string method, Args arguments, Block block, ExecutionSite execution,
         const MailboxRef& owner, TaskId owner_task);

private:
    static std::string describe(const Actor& target);

    std::string method_;
    Args arguments_;
    std::shared_ptr<const BlockProxy> block_;
};

} // namespace conduct
