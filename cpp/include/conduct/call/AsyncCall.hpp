/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <string>

#include "conduct/call/Call.hpp"

namespace conduct {

/**
 * AsyncCall - fire and forget
 *
 * The sender never hears back. A protocol error (AbortError) is logged at
 * debug level and dropped, since the caller is not waiting and the callee is
 * not at fault. Any other failure is the callee's bug and propagates.
 *
 * A block may only be attached with ExecutionSite::sender; a receiver-site
 * block throws ConfigurationError from the constructor.
 */
class AsyncCall : public Call {
public:
    explicit AsyncCall(std::string method, Args arguments = {}, Block block = nullptr,
                       ExecutionSite execution = ExecutionSite::receiver);

    int get_message_id() const override { return MSG_ASYNC_CALL; }

    /// Runs under a fresh call-chain id. The result is discarded; returns an empty value.
    std::any dispatch(Actor& target) override;

    void cleanup() override;
};

} // namespace conduct
