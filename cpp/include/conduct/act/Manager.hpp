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

#include <list>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include "conduct/Actor.hpp"
#include "conduct/ActorRef.hpp"

namespace conduct
{

  /**
   * Manager - Manages the lifecycle of actors
   *
   * The Manager:
   * - Takes ownership of actors and starts one thread per actor
   * - Coordinates startup and shutdown
   * - Provides actor lookup by name
   *
   * Usage:
   *   class MyManager : public conduct::Manager {
   *   public:
   *     MyManager() {
   *       manage(new Calculator());
   *       manage(new Printer());
   *     }
   *   };
   *
   *   MyManager mgr;
   *   mgr.init();  // Start all actors
   *
   *   ActorRef calc = mgr.get_actor_by_name("calc");
   *   auto sum = std::any_cast<int>(calc.call("add", {1, 2}));
   *
   *   mgr.shutdown();
   *   mgr.end();   // Wait for actors to finish
   */
  class Manager
  {
    std::list<std::unique_ptr<Actor>> actor_list;
    std::list<std::thread> thread_list;
    std::map<std::string, actor_ptr> managed_name_map;
    bool started = false;

  public:
    Manager();
    virtual ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    /**
     * Start all managed actors
     * Sends Start to each actor and launches their threads.
     * Call this after registering all actors with manage().
     */
    void init();

    /**
     * Ask every actor to stop
     * Calls still queued are answered with DeadActorError.
     */
    void shutdown();

    /**
     * Wait for all actors to finish
     * Blocks until all actor threads have terminated.
     */
    void end();

    /**
     * Register an actor to be managed
     * @param actor The actor to manage (takes ownership)
     * @throws ConfigurationError for a null actor, a duplicate name, or after init().
     *         An actor that is already managed is rejected and left to its owner.
     */
    void manage(actor_ptr actor);

    /**
     * Find an actor by name.
     * @throws ActorNotFoundError if no managed actor has that name
     */
    ActorRef get_actor_by_name(const std::string& name) const;

    /**
     * Find an actor by name.
     * @return Pointer to actor, or nullptr if not found
     */
    actor_ptr get_local_actor(const std::string& name) const noexcept;

    const std::map<std::string, actor_ptr>& get_name_map() const noexcept {
      return managed_name_map;
    }

    std::list<std::string> get_managed_names() const noexcept;

    /**
     * Get total pending messages across all actors
     * Useful for monitoring backpressure.
     */
    std::size_t total_queue_length() const;

    /**
     * Get pending message count per actor
     * @return Map of actor name to queue length
     */
    std::map<std::string, std::size_t> get_queue_lengths() const;

    /**
     * Get handled message count per actor
     * @return Map of actor name to message count
     */
    std::map<std::string, int> get_message_counts() const noexcept;
  };
}
