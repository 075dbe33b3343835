//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file app_event.hpp
/// The messages a channel sends to its render task

#include "tuihost/types.hpp"

#include <variant>

namespace tuihost
{

/// \brief Redraw the application with its current state
struct render_event
{
};

/// \brief The remote terminal reported a new size, in character cells
struct resize_event
{
	uint16_t width;
	uint16_t height;
};

/// \brief Raw bytes typed at the remote terminal, passed on unmodified
struct input_event
{
	blob data;
};

/// \brief Reserved, no render task handles this yet
struct shutdown_event
{
};

using app_event = std::variant<render_event, resize_event, input_event, shutdown_event>;

/// \brief A short name for an event, for logging
const char *event_name(const app_event &event);

} // namespace tuihost
