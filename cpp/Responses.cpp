/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/call/Responses.hpp"
#include "conduct/Errors.hpp"
#include "conduct/Task.hpp"
#include "conduct/call/SyncCall.hpp"

namespace conduct {

[[noreturn]] static void raise_remote(const std::exception_ptr& ex)
{
    try {
        std::rethrow_exception(ex);
    } catch (Error& err) {
        err.extend_backtrace(REMOTE_CALL_FRAME);
        throw;
    }
}

void Response::dispatch()
{
    std::shared_ptr<const Response> self = std::static_pointer_cast<const Response>(shared_from_this());
    Task::resume(task_, Resumption{std::any(self), nullptr});
}

ErrorResponse::ErrorResponse(const SyncCall& call, std::exception_ptr error)
    : Response(call.task())
    , error_(std::move(error))
    , method_(call.method())
{
}

std::any ErrorResponse::value() const
{
    try {
        std::rethrow_exception(error_);
    } catch (const AbortError& abort) {
        raise_remote(abort.cause());
    } catch (Error& err) {
        err.extend_backtrace(REMOTE_CALL_FRAME);
        throw;
    }
}

void BlockResponse::dispatch()
{
    Task::resume(task_, Resumption{result_, error_});
}

} // namespace conduct
