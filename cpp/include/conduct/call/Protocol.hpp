/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

namespace conduct {

// Message IDs 800-899 reserved for the call protocol
constexpr int MSG_SYNC_CALL = 800;
constexpr int MSG_ASYNC_CALL = 801;
constexpr int MSG_BLOCK_CALL = 802;
constexpr int MSG_SUCCESS_RESPONSE = 803;
constexpr int MSG_ERROR_RESPONSE = 804;
constexpr int MSG_BLOCK_RESPONSE = 805;

/**
 * Where a call's block runs.
 *
 * receiver: the operation is handed a callable; invoking it makes a
 *           synchronous round trip back to the task that supplied the block.
 * sender:   the operation gets no block at all.
 */
enum class ExecutionSite { sender, receiver };

} // namespace conduct
