/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <memory>
#include <string>

#include "conduct/Mailbox.hpp"
#include "conduct/call/Call.hpp"
#include "conduct/call/Responses.hpp"

namespace conduct {

/**
 * SyncCall - a call whose sender waits for the answer
 *
 * Carries the sender's mailbox, the waiting task's handle and the call-chain
 * id. Exactly one Response goes back for every SyncCall: from dispatch(), or
 * from cleanup() when the target is already dead.
 *
 * Failure handling on the callee side:
 * - AbortError (caller broke the protocol): reported to the sender, swallowed.
 * - anything else (callee bug): reported to the sender, then rethrown so it
 *   faults the callee as well.
 */
class SyncCall : public Call {
public:
    /// Answer goes to the current task; the chain id is inherited or generated.
    explicit SyncCall(std::string method, Args arguments = {}, Block block = nullptr,
                      ExecutionSite execution = ExecutionSite::receiver);

    SyncCall(MailboxRef sender, TaskId task, std::string chain_id, std::string method,
             Args arguments = {}, Block block = nullptr,
             ExecutionSite execution = ExecutionSite::receiver);

    int get_message_id() const override { return MSG_SYNC_CALL; }

    const MailboxRef& sender() const { return sender_; }
    TaskId task() const { return task_; }
    const std::string& chain_id() const { return chain_id_; }

    std::any dispatch(Actor& target) override;

    /// Answer with DeadActorError. Used when the target died before dispatch.
    void cleanup() override;

    /**
     * Suspend the calling task until its response is dispatched.
     * @throws TaskError when not called from the task that made the call
     */
    std::shared_ptr<const Response> response() const;

    /// response()->value(): the result, or the callee's failure re-raised here.
    std::any value() const;

    /**
     * Sender-side receive loop. Serves system events and block calls
     * addressed to this task until the response shows up, and returns it.
     */
    std::shared_ptr<const Response> wait() const;

    /// Messages wait() accepts: addressed to task, or system events.
    static Mailbox::Predicate matching(TaskId task);

private:
    void respond(message_ptr response) const;

    MailboxRef sender_;
    TaskId task_;
    std::string chain_id_;
};

} // namespace conduct
