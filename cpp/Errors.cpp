/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#include "conduct/Errors.hpp"

#include <boost/stacktrace.hpp>

namespace conduct {

const char* const REMOTE_CALL_FRAME = "(conduct):0:in `remote procedure call'";

static void capture_stack(std::vector<std::string>& out)
{
    for (const auto& frame : boost::stacktrace::stacktrace()) {
        out.push_back(boost::stacktrace::to_string(frame));
    }
}

Error::Error(const std::string& msg) : std::runtime_error(msg)
{
    capture_stack(backtrace_);
}

Error::Error(const Error& other)
    : std::runtime_error(other)
    , backtrace_(other.backtrace())
{
}

Error& Error::operator=(const Error& other)
{
    if (this != &other) {
        std::runtime_error::operator=(other);
        std::vector<std::string> frames = other.backtrace();
        std::lock_guard<std::mutex> lock(mutex_);
        backtrace_ = std::move(frames);
    }
    return *this;
}

std::vector<std::string> Error::backtrace() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return backtrace_;
}

void Error::extend_backtrace(const std::string& boundary)
{
    std::vector<std::string> frames{boundary};
    capture_stack(frames);

    std::lock_guard<std::mutex> lock(mutex_);
    backtrace_.insert(backtrace_.end(), frames.begin(), frames.end());
}

AbortError::AbortError(std::exception_ptr cause)
    : Error(describe_exception(cause))
    , cause_(std::move(cause))
{
}

std::string describe_exception(const std::exception_ptr& ex)
{
    if (!ex) {
        return "no exception";
    }
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace conduct
