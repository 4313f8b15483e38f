/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/ActorRef.hpp"
#include "conduct/Actor.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Task.hpp"
#include "conduct/call/AsyncCall.hpp"
#include "conduct/call/SyncCall.hpp"

namespace conduct {

Actor& ActorRef::target() const
{
    if (!actor_) {
        throw DeadActorError("attempted to call through an empty ActorRef");
    }
    return *actor_;
}

std::any ActorRef::call(const std::string& method, Args arguments, Block block, ExecutionSite execution) const
{
    Actor& actor = target();
    Task& task = Task::current();

    auto call = std::make_shared<SyncCall>(method, std::move(arguments), std::move(block), execution);
    actor.send(call, task.actor());

    if (task.actor() && !task.exclusive()) {
        return call->value();
    }
    return call->wait()->value();
}

void ActorRef::async(const std::string& method, Args arguments, Block block, ExecutionSite execution) const
{
    Actor& actor = target();
    actor.send(std::make_shared<AsyncCall>(method, std::move(arguments), std::move(block), execution),
               Task::current().actor());
}

void ActorRef::send(Message* m, Actor* sender) const
{
    if (!actor_) {
        delete m;
        throw DeadActorError("attempted to send through an empty ActorRef");
    }
    actor_->send(m, sender);
}

bool ActorRef::is_alive() const
{
    return actor_ && actor_->is_alive();
}

const char* ActorRef::get_name() const
{
    return actor_ ? actor_->get_name() : "";
}

} // namespace conduct
