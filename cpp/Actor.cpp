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

#include <cstdint>
#include <cstring>
#include <sstream>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include "conduct/Actor.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Logger.hpp"
#include "conduct/Task.hpp"
#include "conduct/call/Call.hpp"
#include "conduct/msg/Shutdown.hpp"

using namespace conduct;
using namespace std;

Actor::Actor() : mailbox_(make_shared<Mailbox>())
{
  strncpy(name, "actor", sizeof(name));
}

Actor::~Actor()
{
  // Calls nobody will ever run still owe their senders an answer.
  for (auto& m : mailbox_->close())
  {
    if (auto* call = dynamic_cast<Call*>(m.get()))
      call->cleanup();
  }
}

void Actor::operator()()
{
  Task root(mailbox_, this);
  Logger::info(string(name) + " started");

  while (alive_)
    process_next();

  for (auto& m : mailbox_->close())
  {
    if (auto* call = dynamic_cast<Call*>(m.get()))
      call->cleanup();
  }

  terminated = true;
  Logger::info(string(name) + " stopped");
}

void Actor::process_next()
{
  handle(mailbox_->receive());
}

void Actor::handle(const message_ptr& m)
{
  ++msg_cnt;

  try
  {
    if (auto* ev = dynamic_cast<const msg::SystemEvent*>(m.get()))
    {
      handle_system_event(*ev);
    }
    else if (auto* call = dynamic_cast<Call*>(m.get()))
    {
      run_call(*call);
    }
    else if (auto* dispatchable = dynamic_cast<Dispatchable*>(m.get()))
    {
      try
      {
        dispatchable->dispatch();
      }
      catch (const TaskError& e)
      {
        Logger::warn(string(name) + ": dropping message " + to_string(m->get_message_id()) + ": " + e.what());
      }
    }
    else
    {
      process_message(m.get());
    }
  }
  catch (...)
  {
    crash(current_exception(), "message " + to_string(m->get_message_id()));
  }
}

void Actor::run_call(Call& call)
{
  if (!alive_)
  {
    call.cleanup();
    return;
  }

  Task task(mailbox_, this);
  try
  {
    call.dispatch(*this);
  }
  catch (...)
  {
    crash(current_exception(), "task " + to_string(task.id()));
  }
}

void Actor::crash(exception_ptr ex, const string& context)
{
  if (!alive_)
  {
    Logger::debug(string(name) + ": " + context + " unwound after stop: " + Logger::format_exception(ex));
    return;
  }

  {
    lock_guard<mutex> lock(mutex_);
    crash_reason_ = ex;
  }
  Logger::error(string(name) + " crashed!\n" + Logger::format_exception(ex));
  alive_ = false;
}

exception_ptr Actor::crash_reason() const
{
  lock_guard<mutex> lock(mutex_);
  return crash_reason_;
}

void Actor::send(Message* m, Actor* sender)
{
  send(message_ptr(m), sender);
}

void Actor::send(message_ptr m, Actor* sender)
{
  m->sender = sender;
  m->destination = this;

  if (mailbox_->send(m))
    return;

  if (auto* call = dynamic_cast<Call*>(m.get()))
    call->cleanup();
  else
    Logger::debug(string(name) + ": mailbox closed, dropped message " + to_string(m->get_message_id()));
}

void Actor::terminate()
{
  send(new msg::Shutdown());
}

void Actor::handle_system_event(const msg::SystemEvent& ev)
{
  if (dynamic_cast<const msg::Shutdown*>(&ev))
    alive_ = false;
}

void Actor::process_message(const Message* m)
{
  Logger::warn(string(name) + ": unhandled message id " + to_string(m->get_message_id()));
}

string Actor::class_name() const
{
  return boost::core::demangle(typeid(*this).name());
}

const Operation* Actor::find_operation(const string& op) const
{
  auto it = operations_.find(op);
  if (it != operations_.end())
    return &it->second;
  return nullptr;
}

void Actor::define_operation(const string& op, Arity arity, Handler handler)
{
  operations_[op] = Operation{arity, std::move(handler)};
}

string Actor::inspect() const
{
  return "#<" + class_name() + " name=" + name + ">";
}

string Actor::simulated_inspect() const
{
  ostringstream out;
  out << "#<" << class_name() << ":0x" << hex << reinterpret_cast<uintptr_t>(this) << dec
      << " name=" << name
      << " alive=" << (is_alive() ? "true" : "false")
      << " mailbox=" << queue_length() << ">";
  return out.str();
}

void Actor::exclusive(const function<void()>& fn)
{
  struct Exclusive
  {
    Task& task;
    bool previous;
    explicit Exclusive(Task& t) : task(t), previous(t.exclusive()) { task.set_exclusive(true); }
    ~Exclusive() { task.set_exclusive(previous); }
  } guard(Task::current());

  fn();
}
