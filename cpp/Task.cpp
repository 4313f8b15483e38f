/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/Task.hpp"
#include "conduct/Actor.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <vector>

namespace conduct {

namespace {

std::atomic<TaskId> g_next_task_id{1};

struct ThreadTasks {
    std::vector<Task*> stack;
    std::map<TaskId, Task*> arena;
};

thread_local ThreadTasks t_tasks;
thread_local std::unique_ptr<Task> t_root;

std::string task_label(TaskId id) { return "task " + std::to_string(id); }

} // namespace

Task::Task(MailboxRef mailbox, Actor* actor)
    : id_(g_next_task_id.fetch_add(1))
    , mailbox_(std::move(mailbox))
    , actor_(actor)
    , registered_(true)
{
    t_tasks.stack.push_back(this);
    t_tasks.arena[id_] = this;
}

Task::Task(root_t, MailboxRef mailbox)
    : id_(g_next_task_id.fetch_add(1))
    , mailbox_(std::move(mailbox))
    , actor_(nullptr)
    , registered_(false)
{
}

Task::~Task()
{
    if (!registered_) {
        return;
    }
    t_tasks.arena.erase(id_);
    auto& stack = t_tasks.stack;
    auto it = std::find(stack.rbegin(), stack.rend(), this);
    if (it != stack.rend()) {
        stack.erase(std::next(it).base());
    }
}

Task& Task::current()
{
    if (!t_tasks.stack.empty()) {
        return *t_tasks.stack.back();
    }
    if (!t_root) {
        t_root.reset(new Task(root_t{}, std::make_shared<Mailbox>()));
    }
    return *t_root;
}

Task* Task::find(TaskId id)
{
    auto it = t_tasks.arena.find(id);
    if (it != t_tasks.arena.end()) {
        return it->second;
    }
    if (t_root && t_root->id_ == id) {
        return t_root.get();
    }
    return nullptr;
}

void Task::resume(TaskId id, Resumption resumption)
{
    Task* task = find(id);
    if (!task) {
        throw TaskError("no " + task_label(id) + " on this thread");
    }
    if (!task->suspended_ || task->resumption_) {
        throw TaskError(task_label(id) + " is not waiting to be resumed");
    }
    task->resumption_ = std::move(resumption);
}

std::any Task::suspend(const char* tag)
{
    if (suspended_) {
        throw TaskError(task_label(id_) + " is already suspended (" + status_ + ")");
    }

    struct Suspension {
        Task& task;
        Suspension(Task& t, const char* tag) : task(t) {
            task.suspended_ = true;
            task.status_ = tag;
        }
        ~Suspension() {
            task.suspended_ = false;
            task.status_ = "running";
        }
    } suspension(*this, tag);

    while (!resumption_) {
        if (actor_ && !exclusive_) {
            if (!actor_->is_alive()) {
                throw TaskTerminated(std::string(actor_->get_name()) + " stopped while " +
                                     task_label(id_) + " was suspended in " + tag);
            }
            actor_->process_next();
        } else {
            await_addressed();
        }
    }

    Resumption resumption = std::move(*resumption_);
    resumption_.reset();
    if (resumption.error) {
        std::rethrow_exception(resumption.error);
    }
    return std::move(resumption.value);
}

void Task::await_addressed()
{
    const TaskId id = id_;
    message_ptr message = mailbox_->receive([id](const Message& m) {
        return m.addressed_to() == id;
    });
    if (auto* dispatchable = dynamic_cast<Dispatchable*>(message.get())) {
        dispatchable->dispatch();
    } else {
        Logger::warn(task_label(id) + " dropped message " + std::to_string(message->get_message_id()));
    }
}

} // namespace conduct
