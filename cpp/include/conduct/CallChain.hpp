/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <string>

namespace conduct {

class Task;

/**
 * CallChain - correlation id linking a chain of nested calls
 *
 * The id lives in the current Task, not in global state, so every task has
 * its own slot and nothing is shared between actors. An empty string means
 * no chain is active.
 */
class CallChain {
public:
    static std::string current_id();
    static void set_current_id(std::string id);

    /// A fresh random UUID string.
    static std::string generate();

    /// Sets the current task's id for its lifetime and clears it on every exit path.
    class Scope {
    public:
        explicit Scope(std::string id);
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
    private:
        Task& task_;
    };
};

} // namespace conduct
