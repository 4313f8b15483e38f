/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include "conduct/Message.hpp"

namespace conduct::msg {

/**
 * SystemEvent - lifecycle notification handled by the actor itself
 *
 * System events are never dispatched as calls. A task waiting on a sync call
 * hands them to Actor::handle_system_event and keeps waiting.
 */
struct SystemEvent : public Message {};

template <int N>
struct SystemEvent_N : public SystemEvent
{
  constexpr int get_message_id() const override { return N; }
};

} // namespace conduct::msg
