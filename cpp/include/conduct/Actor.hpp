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

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <type_traits>

#include "conduct/Mailbox.hpp"
#include "conduct/Message.hpp"
#include "conduct/Operation.hpp"
#include "conduct/msg/SystemEvent.hpp"

/**
 * Register member function fn as the operation named #fn.
 * The remaining arguments initialize its Arity: required, optional, variadic.
 *
 *   CONDUCT_OPERATION(add, 2);          // exactly two arguments
 *   CONDUCT_OPERATION(sum, 0, 0, true); // any number
 */
#define CONDUCT_OPERATION(fn, ...) \
  define_operation(#fn, &std::remove_pointer_t<decltype(this)>::fn, conduct::Arity{__VA_ARGS__})

namespace conduct
{
  class Call;

  /**
   * Actor - an isolated unit of state served by one thread
   *
   * An actor publishes operations in a capability table filled in its
   * constructor. Calls name an operation; the actor checks them against the
   * table and runs them one at a time, each in its own Task.
   *
   * Usage:
   *   class Calculator : public conduct::Actor {
   *   public:
   *     Calculator() {
   *       strncpy(name, "calc", sizeof(name));
   *       CONDUCT_OPERATION(add, 2);
   *     }
   *     std::any add(const conduct::Args& args, const conduct::Block&) {
   *       return std::any_cast<int>(args[0]) + std::any_cast<int>(args[1]);
   *     }
   *   };
   *
   * A call that throws anything other than AbortError faults the actor: it
   * stops, and every call still queued is answered with DeadActorError.
   */
  class Actor
  {
  public:
    Actor();
    virtual ~Actor();

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    /// Event loop. Runs on the actor's thread until the actor stops.
    void operator()();

    /// Deliver m (takes ownership). A call to a stopped actor is cleaned up at once.
    void send(Message* m, Actor* sender = nullptr);
    void send(message_ptr m, Actor* sender = nullptr);

    /// Ask the actor to stop (sends msg::Shutdown).
    void terminate();

    bool is_alive() const noexcept { return alive_.load(); }

    /// Exception that faulted the actor, or null.
    std::exception_ptr crash_reason() const;

    const char* get_name() const noexcept { return name; }
    std::string class_name() const;
    std::size_t queue_length() const { return mailbox_->length(); }
    const MailboxRef& mailbox() const noexcept { return mailbox_; }

    /// Capability table lookup; nullptr if the actor has no such operation.
    const Operation* find_operation(const std::string& op) const;

    /// Description used in diagnostics. Overrides may fail on inconsistent state.
    virtual std::string inspect() const;

    /// Field dump built from the base class only; never fails.
    std::string simulated_inspect() const;

    /**
     * Lifecycle events. The default stops the actor on msg::Shutdown and
     * ignores msg::Start. An exception thrown here crashes the actor.
     */
    virtual void handle_system_event(const msg::SystemEvent& ev);

    /// Receive and handle one message. Used by the loop and by suspended tasks.
    void process_next();

    bool is_managed = false;
    std::atomic<bool> terminated{false};
    std::atomic<int> msg_cnt{0};

  protected:
    char name[64];

    /// Messages that are neither calls, responses nor system events. Throwing crashes the actor.
    virtual void process_message(const Message* m);

    template <typename T>
    void define_operation(const std::string& op, std::any (T::*fn)(const Args&, const Block&), Arity arity)
    {
      T* self = static_cast<T*>(this);
      define_operation(op, arity, [self, fn](const Args& args, const Block& block) {
        return (self->*fn)(args, block);
      });
    }

    void define_operation(const std::string& op, Arity arity, Handler handler);

    /// Run fn with the current task in exclusive mode: no other message is served while it waits.
    void exclusive(const std::function<void()>& fn);

  private:
    void handle(const message_ptr& m);
    void run_call(Call& call);
    void crash(std::exception_ptr ex, const std::string& context);

    MailboxRef mailbox_;
    std::map<std::string, Operation> operations_;
    std::atomic<bool> alive_{true};
    mutable std::mutex mutex_;
    std::exception_ptr crash_reason_;
  };

  typedef Actor* actor_ptr;
}
