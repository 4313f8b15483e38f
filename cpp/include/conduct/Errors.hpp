/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <cstddef>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace conduct {

/// Backtrace line marking where a failure crossed from callee to caller.
extern const char* const REMOTE_CALL_FRAME;

/**
 * Error - base of every failure raised by the call protocol
 *
 * Carries a backtrace captured where the error was constructed. When a
 * failure is re-raised on the caller's side of a sync call, the backtrace is
 * extended with REMOTE_CALL_FRAME and the caller's own stack, so a single
 * exception object shows both halves of the hop.
 *
 * The same object is shared by the callee (crash reporting) and the caller
 * (re-raise), so the backtrace is guarded and read as a snapshot.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg);
    Error(const Error& other);
    Error& operator=(const Error& other);

    /// Copy of the frames recorded so far.
    std::vector<std::string> backtrace() const;

    /// Append a boundary frame followed by the current call stack.
    void extend_backtrace(const std::string& boundary);

private:
    mutable std::mutex mutex_;
    std::vector<std::string> backtrace_;
};

/// Misuse detected while building a call or configuring the runtime.
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg) : Error(msg) {}
};

class MethodMissingError : public Error {
public:
    MethodMissingError(const std::string& method, const std::string& description)
        : Error("undefined operation `" + method + "' for " + description)
        , method_(method) {}
    const std::string& method() const { return method_; }
private:
    std::string method_;
};

class ArgumentCountError : public Error {
public:
    ArgumentCountError(std::size_t given, const std::string& expected)
        : Error("wrong number of arguments (" + std::to_string(given) + " for " + expected + ")")
        , given_(given) {}
    std::size_t given() const { return given_; }
private:
    std::size_t given_;
};

/**
 * AbortError - the caller broke the protocol
 *
 * Wraps the original failure. A sync callee reports it and survives; an
 * async callee only logs it. Callers never see AbortError itself: the
 * response unwraps it to the cause.
 */
class AbortError : public Error {
public:
    explicit AbortError(std::exception_ptr cause);
    const std::exception_ptr& cause() const { return cause_; }
private:
    std::exception_ptr cause_;
};

class DeadActorError : public Error {
public:
    explicit DeadActorError(const std::string& msg) : Error(msg) {}
};

/// A suspended task was torn down because its actor stopped.
class TaskTerminated : public DeadActorError {
public:
    explicit TaskTerminated(const std::string& msg) : DeadActorError(msg) {}
};

/// Suspend/resume misuse: unknown task, double resume, nested suspend.
class TaskError : public Error {
public:
    explicit TaskError(const std::string& msg) : Error(msg) {}
};

class MailboxError : public Error {
public:
    explicit MailboxError(const std::string& msg) : Error(msg) {}
};

class ActorNotFoundError : public Error {
public:
    explicit ActorNotFoundError(const std::string& name)
        : Error("Actor not found: " + name), actor_name_(name) {}
    const std::string& actor_name() const { return actor_name_; }
private:
    std::string actor_name_;
};

/// what() of the exception held by ex, or a placeholder for non-std types.
std::string describe_exception(const std::exception_ptr& ex);

} // namespace conduct
