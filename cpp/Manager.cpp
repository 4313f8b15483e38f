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

#include <list>
#include <map>
#include <string>

#include "conduct/Actor.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Logger.hpp"
#include "conduct/act/Manager.hpp"
#include "conduct/msg/Start.hpp"

using namespace conduct;
using namespace std;

Manager::Manager() {}

Manager::~Manager()
{
  bool running = false;
  for (auto& t : thread_list)
    running = running || t.joinable();

  if (running)
  {
    shutdown();
    end();
  }
}

void Manager::init()
{
  if (started)
    throw ConfigurationError("Manager::init called twice");
  started = true;

  for (auto& actor : actor_list)
  {
    Logger::info(string("Manager::init sending start to ") + actor->get_name());
    actor->send(new msg::Start());
  }

  for (auto& actor : actor_list)
  {
    Actor* a = actor.get();
    thread_list.emplace_back([a]() { (*a)(); });
  }
}

void Manager::shutdown()
{
  for (auto& actor : actor_list)
  {
    if (!actor->terminated)
      actor->terminate();
  }
}

void Manager::end()
{
  for (auto& t : thread_list)
  {
    if (t.joinable())
      t.join();
  }
}

void Manager::manage(actor_ptr actor)
{
  if (actor == nullptr)
    throw ConfigurationError("cannot manage null actor");

  // already owned by a manager; rejecting must not delete it
  if (actor->is_managed)
    throw ConfigurationError(string("actor already managed: ") + actor->get_name());

  unique_ptr<Actor> owned(actor);

  if (started)
    throw ConfigurationError(string("cannot manage ") + actor->get_name() + " after init()");

  if (managed_name_map.find(actor->get_name()) != managed_name_map.end())
    throw ConfigurationError(string("actor with this name already managed: ") + actor->get_name());

  managed_name_map[actor->get_name()] = actor;
  actor->is_managed = true;
  actor_list.push_back(std::move(owned));
}

list<string> Manager::get_managed_names() const noexcept
{
  list<string> ret;
  for (auto &[name, _] : managed_name_map)
    ret.push_back(name);
  return ret;
}

actor_ptr Manager::get_local_actor(const string &name) const noexcept
{
  auto it = managed_name_map.find(name);
  if (it != managed_name_map.end())
    return it->second;
  return nullptr;
}

ActorRef Manager::get_actor_by_name(const string &name) const
{
  if (auto* local = get_local_actor(name))
    return ActorRef(local);

  throw ActorNotFoundError(name);
}

size_t Manager::total_queue_length() const
{
  size_t total = 0;
  for (auto& actor : actor_list)
    total += actor->queue_length();
  return total;
}

map<string, size_t> Manager::get_queue_lengths() const
{
  map<string, size_t> ret;
  for (auto &[name, actor] : managed_name_map)
    ret[name] = actor->queue_length();
  return ret;
}

map<string, int> Manager::get_message_counts() const noexcept
{
  map<string, int> ret;
  for (auto &[name, actor] : managed_name_map)
    ret[name] = actor->msg_cnt;
  return ret;
}
