//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file error.hpp
/// The error codes reported by channels and sessions

#include "tuihost/asio.hpp"

namespace tuihost::error
{

/// \brief The errors a session, its channel or its render task may report
enum channel_errors
{
	channel_already_open = 1, ///< A second session channel was requested on a connection
	no_channel,               ///< A channel request arrived before any channel was opened
	unknown_channel,          ///< The request names a channel that does not exist
	not_authenticated,        ///< The request requires an authenticated session
	pty_not_created,          ///< The channel has no pseudo terminal yet
	pty_already_created,      ///< The channel already has a pseudo terminal
	invalid_dimensions,       ///< A terminal size of zero or out of range
	channel_closed,           ///< The channel, or its render task, is gone
	unsupported_event,        ///< The render task received an event it does not handle
	end_of_stream,            ///< All producers of an event queue are gone
	protocol_error,           ///< The peer sent a malformed or unexpected message
	render_failed             ///< The application or backend failed while rendering
};

system_ns::error_category &channel_category();

inline system_ns::error_code make_error_code(channel_errors e)
{
	return system_ns::error_code(static_cast<int>(e), channel_category());
}

} // namespace tuihost::error

namespace boost::system
{

template <>
struct is_error_code_enum<tuihost::error::channel_errors>
{
	static const bool value = true;
};

} // namespace boost::system
