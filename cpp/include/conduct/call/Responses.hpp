/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <exception>
#include <string>

#include "conduct/Message.hpp"
#include "conduct/call/Protocol.hpp"

namespace conduct {

class SyncCall;

/**
 * Response - terminal answer to a sync call
 *
 * Dispatching a response resumes the waiting task exactly once, handing it
 * the response itself; the task then asks for value().
 */
class Response : public Dispatchable {
public:
    TaskId task() const { return task_; }
    TaskId addressed_to() const override { return task_; }

    void dispatch() override;

    /// The call's result. May throw instead of returning (ErrorResponse).
    virtual std::any value() const = 0;

protected:
    explicit Response(TaskId task) : task_(task) {}

private:
    TaskId task_;
};

/// Call completed successfully.
class SuccessResponse : public Response {
public:
    SuccessResponse(TaskId task, std::any value) : Response(task), value_(std::move(value)) {}

    int get_message_id() const override { return MSG_SUCCESS_RESPONSE; }
    std::any value() const override { return value_; }

private:
    std::any value_;
};

/**
 * ErrorResponse - the call failed
 *
 * value() never returns. An AbortError is unwrapped to its cause; the
 * exception raised is the very object the callee threw, with REMOTE_CALL_FRAME
 * and the caller's stack appended to its backtrace when it is a conduct::Error.
 */
class ErrorResponse : public Response {
public:
    ErrorResponse(const SyncCall& call, std::exception_ptr error);

    int get_message_id() const override { return MSG_ERROR_RESPONSE; }
    [[noreturn]] std::any value() const override;

    const std::exception_ptr& error() const { return error_; }
    const std::string& method() const { return method_; }

private:
    std::exception_ptr error_;
    std::string method_;
};

/**
 * BlockResponse - result of a block invoked across the boundary
 *
 * Resumes the invoking task with the raw result. A closure failure travels
 * back unchanged: no Abort unwrapping, no backtrace annotation.
 */
class BlockResponse : public Dispatchable {
public:
    BlockResponse(TaskId task, std::any result) : task_(task), result_(std::move(result)) {}
    BlockResponse(TaskId task, std::exception_ptr error) : task_(task), error_(std::move(error)) {}

    int get_message_id() const override { return MSG_BLOCK_RESPONSE; }
    TaskId task() const { return task_; }
    TaskId addressed_to() const override { return task_; }

    void dispatch() override;

    const std::any& result() const { return result_; }
    const std::exception_ptr& error() const { return error_; }

private:
    TaskId task_;
    std::any result_;
    std::exception_ptr error_;
};

} // namespace conduct
