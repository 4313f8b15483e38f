/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <string>

#include "conduct/Message.hpp"
#include "conduct/Operation.hpp"
#include "conduct/call/Protocol.hpp"

namespace conduct {

class Actor;

/**
 * ActorRef - handle used to talk to an actor
 *
 * Usage:
 *   ActorRef calc = mgr.get_actor_by_name("calc");
 *   int sum = std::any_cast<int>(calc.call("add", {1, 2}));
 *   calc.async("reset");
 *
 *   // The block runs on the calling task, once per invocation by the callee.
 *   calc.call("each", {3}, [&](const Args& args) { seen.push_back(args[0]); return std::any(); });
 */
class ActorRef {
public:
    ActorRef() = default;
    explicit ActorRef(Actor* actor) : actor_(actor) {}

    /**
     * Synchronous call. Inside a non-exclusive actor task the task suspends
     * and the actor keeps serving its mailbox; anywhere else the calling
     * thread runs SyncCall::wait().
     *
     * @return the operation's result
     * @throws whatever the callee raised (AbortError unwrapped), or DeadActorError
     */
    std::any call(const std::string& method, Args arguments = {}, Block block = nullptr,
                  ExecutionSite execution = ExecutionSite::receiver) const;

    /// Fire and forget. A block needs ExecutionSite::sender; otherwise ConfigurationError.
    void async(const std::string& method, Args arguments = {}, Block block = nullptr,
               ExecutionSite execution = ExecutionSite::receiver) const;

    /// Plain message delivery (takes ownership of m).
    void send(Message* m, Actor* sender = nullptr) const;

    bool is_alive() const;
    const char* get_name() const;
    Actor* get() const { return actor_; }
    explicit operator bool() const { return actor_ != nullptr; }

private:
    Actor& target() const;

    Actor* actor_ = nullptr;
};

} // namespace conduct
