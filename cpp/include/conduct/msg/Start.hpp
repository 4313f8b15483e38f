/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include "conduct/msg/SystemEvent.hpp"

namespace conduct::msg {

/// Sent by the Manager to every actor before its thread starts.
struct Start : public SystemEvent_N<6> {};

} // namespace conduct::msg
