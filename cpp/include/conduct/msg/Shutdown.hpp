/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include "conduct/msg/SystemEvent.hpp"

namespace conduct::msg {

/// Stops the receiving actor; undelivered calls are answered with DeadActorError.
struct Shutdown : public SystemEvent_N<5> {};

} // namespace conduct::msg
