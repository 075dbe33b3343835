//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file session_handler.hpp
/// The per connection protocol state machine
///
/// A session moves from unauthenticated to authenticated, then to
/// channel_requested once its single channel is open and finally to
/// pty_ready. Only one channel is ever opened on a connection.

#include "tuihost/channel_bridge.hpp"

#include <string>

namespace tuihost
{

enum class session_state
{
	unauthenticated,
	authenticated,
	channel_requested,
	pty_ready
};

enum class auth_method
{
	none,
	password,
	public_key
};

enum class auth_reply
{
	accept,
	reject
};

enum class channel_reply
{
	success,
	failure
};

/// \brief Map the outcome of a channel request onto the reply for the peer
channel_reply to_channel_reply(const system_ns::error_code &ec);

const char *to_string(session_state state);
const char *to_string(auth_method method);

// --------------------------------------------------------------------

class session_handler
{
  public:
	session_handler(asio_ns::any_io_executor executor, channel_settings settings);

	session_handler(const session_handler &) = delete;
	session_handler &operator=(const session_handler &) = delete;

	session_state state() const { return m_state; }

	/// \brief The bridge of the open channel, or nullptr
	channel_bridge *bridge() const { return m_bridge.get(); }

	const std::string &user() const { return m_user; }

	/// \brief Authenticate \a user, all supported methods are accepted
	auth_reply authenticate(auth_method method, const std::string &user);

	/// \brief Open the session's channel
	///
	/// Returns false when the session is not authenticated. Throws a
	/// system_error with error::channel_already_open when a channel was
	/// opened before on this connection, the existing channel is kept.
	bool open_channel(uint32_t channel_id);

	channel_reply forward_input(uint32_t channel_id, const blob &data);

	channel_reply request_pty(uint32_t channel_id, std::shared_ptr<output_sink> sink, uint32_t cols, uint32_t rows);

	channel_reply request_resize(uint32_t channel_id, uint32_t cols, uint32_t rows);

	/// \brief Drop the channel, its render task ends once drained
	channel_reply close_channel(uint32_t channel_id);

  private:
	system_ns::error_code find_channel(uint32_t channel_id) const;

	asio_ns::any_io_executor m_executor;
	channel_settings m_settings;

	session_state m_state = session_state::unauthenticated;
	std::string m_user;
	bool m_channel_opened = false;
	std::unique_ptr<channel_bridge> m_bridge;
};

} // namespace tuihost
