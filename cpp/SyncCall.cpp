/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/call/SyncCall.hpp"
#include "conduct/Actor.hpp"
#include "conduct/CallChain.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Logger.hpp"
#include "conduct/Task.hpp"
#include "conduct/msg/SystemEvent.hpp"

namespace conduct {

SyncCall::SyncCall(std::string method, Args arguments, Block block, ExecutionSite execution)
    : SyncCall(Task::current().mailbox(), Task::current().id(), CallChain::current_id(),
               std::move(method), std::move(arguments), std::move(block), execution)
{
}

SyncCall::SyncCall(MailboxRef sender, TaskId task, std::string chain_id, std::string method,
                   Args arguments, Block block, ExecutionSite execution)
    : Call(std::move(method), std::move(arguments), std::move(block), execution, sender, task)
    , sender_(std::move(sender))
    , task_(task)
    , chain_id_(chain_id.empty() ? CallChain::generate() : std::move(chain_id))
{
}

std::any SyncCall::dispatch(Actor& target)
{
    CallChain::Scope chain(chain_id_);
    try {
        std::any result = Call::dispatch(target);
        respond(std::make_shared<SuccessResponse>(task_, result));
        return result;
    } catch (const AbortError&) {
        // The sender's mistake: it gets the error, this actor keeps going.
        respond(std::make_shared<ErrorResponse>(*this, std::current_exception()));
    } catch (...) {
        respond(std::make_shared<ErrorResponse>(*this, std::current_exception()));
        throw;
    }
    return std::any();
}

void SyncCall::cleanup()
{
    auto error = std::make_exception_ptr(DeadActorError("attempted to call a dead actor"));
    respond(std::make_shared<ErrorResponse>(*this, error));
}

void SyncCall::respond(message_ptr response) const
{
    if (!sender_->send(std::move(response))) {
        Logger::debug("response to task " + std::to_string(task_) + " for `" + method() +
                      "' dropped: sender is gone");
    }
}

std::shared_ptr<const Response> SyncCall::response() const
{
    Task& task = Task::current();
    if (task.id() != task_) {
        throw TaskError("task " + std::to_string(task.id()) + " cannot await the response for task " +
                        std::to_string(task_));
    }
    return std::any_cast<std::shared_ptr<const Response>>(task.suspend("callwait"));
}

std::any SyncCall::value() const
{
    return response()->value();
}

Mailbox::Predicate SyncCall::matching(TaskId task)
{
    return [task](const Message& m) {
        return m.addressed_to() == task || dynamic_cast<const msg::SystemEvent*>(&m) != nullptr;
    };
}

std::shared_ptr<const Response> SyncCall::wait() const
{
    const Mailbox::Predicate pred = matching(task_);
    for (;;) {
        message_ptr message = sender_->receive(pred);

        if (auto* ev = dynamic_cast<const msg::SystemEvent*>(message.get())) {
            if (Actor* actor = Task::current().actor()) {
                actor->handle_system_event(*ev);
            } else {
                Logger::debug("system event " + std::to_string(ev->get_message_id()) +
                              " ignored outside an actor");
            }
            continue;
        }

        if (auto response = std::dynamic_pointer_cast<const Response>(message)) {
            return response;
        }

        if (auto* dispatchable = dynamic_cast<Dispatchable*>(message.get())) {
            dispatchable->dispatch();
        }
    }
}

} // namespace conduct
