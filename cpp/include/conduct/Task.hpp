/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <exception>
#include <optional>
#include <string>

#include "conduct/Mailbox.hpp"
#include "conduct/Message.hpp"

namespace conduct {

class Actor;

/// Value a suspended task is resumed with: a result, or an error to rethrow.
struct Resumption {
    std::any value;
    std::exception_ptr error;
};

/**
 * Task - a cooperative unit of execution on an actor's thread
 *
 * The actor runs every call and block call in its own Task. Tasks nest on the
 * thread's stack: while one is suspended the actor keeps serving its mailbox,
 * and anything it picks up runs as a newer Task on top. A suspended task is
 * found again through a per-thread table keyed by TaskId, which is how
 * responses refer to it.
 *
 * A thread that is not an actor gets a root task with a private mailbox the
 * first time Task::current() is called on it.
 *
 * Tasks are stack objects: construct one to make it current, destroy it to
 * pop it. They must be destroyed in reverse order of construction.
 */
class Task {
public:
    explicit Task(MailboxRef mailbox, Actor* actor = nullptr);
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// Innermost task of the calling thread.
    static Task& current();

    /**
     * Fill the resumption slot of the suspended task id on this thread.
     * @throws TaskError if no such task is suspended or it was already resumed
     */
    static void resume(TaskId id, Resumption resumption);

    /**
     * Wait until resumed and return the resumption value (or rethrow its error).
     *
     * Inside a non-exclusive actor the actor's event loop keeps running here.
     * Otherwise only messages addressed to this task are received and
     * dispatched.
     *
     * @param tag status shown while suspended, e.g. "callwait"
     * @throws TaskTerminated if the owning actor stops meanwhile
     */
    std::any suspend(const char* tag);

    TaskId id() const noexcept { return id_; }
    const MailboxRef& mailbox() const noexcept { return mailbox_; }
    Actor* actor() const noexcept { return actor_; }

    const std::string& correlation_id() const noexcept { return correlation_id_; }
    void set_correlation_id(std::string id) { correlation_id_ = std::move(id); }

    bool exclusive() const noexcept { return exclusive_; }
    void set_exclusive(bool exclusive) noexcept { exclusive_ = exclusive; }

    bool is_suspended() const noexcept { return suspended_; }
    const char* status() const noexcept { return status_; }

private:
    struct root_t {};
    Task(root_t, MailboxRef mailbox);

    static Task* find(TaskId id);
    void await_addressed();

    TaskId id_;
    MailboxRef mailbox_;
    Actor* actor_;
    std::string correlation_id_;
    bool exclusive_ = false;
    bool suspended_ = false;
    bool registered_;
    const char* status_ = "running";
    std::optional<Resumption> resumption_;
};

} // namespace conduct
