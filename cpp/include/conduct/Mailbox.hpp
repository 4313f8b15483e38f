/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <vector>

#include "conduct/Message.hpp"

namespace conduct {

/**
 * Mailbox - an actor's inbound queue with selective receive
 *
 * Any thread may send; one thread (the owner) receives. receive(pred) takes
 * the oldest message matching pred and leaves the others in arrival order,
 * so a task waiting for its response does not reorder unrelated traffic.
 *
 * Once closed, sends are rejected (send() returns false) and a blocked
 * receiver fails with MailboxError.
 */
class Mailbox {
public:
    using Predicate = std::function<bool(const Message&)>;

    Mailbox() = default;
    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /// Enqueue m. Returns false if the mailbox is closed.
    bool send(message_ptr m);

    /// Takes ownership of m.
    bool send(Message* m) { return send(message_ptr(m)); }

    message_ptr receive();
    message_ptr receive(const Predicate& pred);

    /// Returns nullptr if nothing matching arrives within timeout.
    message_ptr receive(const Predicate& pred, std::chrono::milliseconds timeout);

    /// Reject further sends and hand back whatever is still queued.
    std::vector<message_ptr> close();

    bool is_closed() const;
    std::size_t length() const;
    bool is_empty() const { return length() == 0; }

private:
    message_ptr take(const Predicate& pred);

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::list<message_ptr> messages_;
    bool closed_ = false;
};

using MailboxRef = std::shared_ptr<Mailbox>;

} // namespace conduct
