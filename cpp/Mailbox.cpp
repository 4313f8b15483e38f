/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/Mailbox.hpp"
#include "conduct/Errors.hpp"

namespace conduct {

static bool any_message(const Message&) { return true; }

bool Mailbox::send(message_ptr m)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        messages_.push_back(std::move(m));
    }
    cond_.notify_all();
    return true;
}

message_ptr Mailbox::take(const Predicate& pred)
{
    for (auto it = messages_.begin(); it != messages_.end(); ++it) {
        if (pred(**it)) {
            message_ptr m = std::move(*it);
            messages_.erase(it);
            return m;
        }
    }
    return nullptr;
}

message_ptr Mailbox::receive()
{
    return receive(any_message);
}

message_ptr Mailbox::receive(const Predicate& pred)
{
    std::unique_lock<std::mutex> lock(mutex_);
    message_ptr m;
    cond_.wait(lock, [&] {
        m = take(pred);
        return m || closed_;
    });
    if (!m) {
        throw MailboxError("receive on a closed mailbox");
    }
    return m;
}

message_ptr Mailbox::receive(const Predicate& pred, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    message_ptr m;
    cond_.wait_for(lock, timeout, [&] {
        m = take(pred);
        return m || closed_;
    });
    return m;
}

std::vector<message_ptr> Mailbox::close()
{
    std::vector<message_ptr> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        remaining.assign(messages_.begin(), messages_.end());
        messages_.clear();
    }
    cond_.notify_all();
    return remaining;
}

bool Mailbox::is_closed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t Mailbox::length() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

} // namespace conduct
