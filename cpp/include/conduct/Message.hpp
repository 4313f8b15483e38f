/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski,  & M2 Tech
Contact:
v@m2te.ch
mayeski@gmail.com
https://www.linkedin.com/in/vmayeski/
http://m2te.ch/

Permission is hereby granted, free of charge, to any person
obtaining a copy of this software and associated documentation
files (the "Software"), to deal in the Software without
restriction, including without limitation the rights to use,
copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the
Software is furnished to do so, subject to the following
conditions:

The above copyright notice and this permission notice shall be
included in all copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
OTHER DEALINGS IN THE SOFTWARE.

https://opensource.org/licenses/MIT

*/

#pragma once

#include <cstdint>
#include <memory>

namespace conduct
{
  class Actor;

  /// Opaque handle of a waiting task. Zero never names a task.
  using TaskId = std::uint64_t;
  constexpr TaskId NO_TASK = 0;

  /**
   * Base class for all messages in the actor system
   *
   * Messages are the only way actors communicate.
   * Each message type has a unique ID; 800-899 belong to the call protocol.
   * Messages travel between mailboxes as shared pointers (message_ptr) so a
   * response can hand itself to the task it resumes.
   */
  struct Message : public std::enable_shared_from_this<Message>
  {
    virtual int get_message_id() const = 0;
    mutable Actor *sender = nullptr;
    mutable Actor *destination = nullptr;

    Message() = default;

    Message(const Message& other)
      : std::enable_shared_from_this<Message>()
      , sender(other.sender)
      , destination(nullptr)
    {}

    Message& operator=(const Message& other) {
      if (this != &other) {
        sender = other.sender;
        destination = nullptr;
      }
      return *this;
    }

    /**
     * Waiting task this message is routed to.
     * Selective receive matches on it; NO_TASK for messages that are not
     * part of a pending exchange.
     */
    virtual TaskId addressed_to() const { return NO_TASK; }

    virtual ~Message() = default;
  };

  /**
   * Template for creating message types with a specific ID
   *
   * Usage:
   *   struct MyMessage : public conduct::Message_N<100> {
   *     int data;
   *     MyMessage(int d) : data(d) {}
   *   };
   */
  template <int N>
  struct Message_N : public Message
  {
    constexpr int get_message_id() const override { return N; }
  };

  /**
   * A message that carries its own handling: responses resume the task they
   * are addressed to, block calls run a closure and reply.
   */
  struct Dispatchable : public Message
  {
    virtual void dispatch() = 0;
  };

  using message_ptr = std::shared_ptr<Message>;
}
