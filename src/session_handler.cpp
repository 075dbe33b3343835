//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/session_handler.hpp>

#include <spdlog/spdlog.h>

#include <limits>

namespace tuihost
{

namespace
{
	bool valid_dimensions(uint32_t cols, uint32_t rows)
	{
		const uint32_t kMax = std::numeric_limits<uint16_t>::max();
		return cols > 0 and rows > 0 and cols <= kMax and rows <= kMax;
	}
} // namespace

channel_reply to_channel_reply(const system_ns::error_code &ec)
{
	return ec ? channel_reply::failure : channel_reply::success;
}

const char *to_string(session_state state)
{
	switch (state)
	{
		case session_state::unauthenticated: return "unauthenticated";
		case session_state::authenticated: return "authenticated";
		case session_state::channel_requested: return "channel_requested";
		case session_state::pty_ready: return "pty_ready";
	}

	return "unknown";
}

const char *to_string(auth_method method)
{
	switch (method)
	{
		case auth_method::none: return "none";
		case auth_method::password: return "password";
		case auth_method::public_key: return "publickey";
	}

	return "unknown";
}

// --------------------------------------------------------------------

session_handler::session_handler(asio_ns::any_io_executor executor, channel_settings settings)
	: m_executor(executor)
	, m_settings(std::move(settings))
{
}

auth_reply session_handler::authenticate(auth_method method, const std::string &user)
{
	spdlog::info("user '{}' authenticated with method {}", user, to_string(method));

	m_user = user;
	if (m_state == session_state::unauthenticated)
		m_state = session_state::authenticated;

	return auth_reply::accept;
}

bool session_handler::open_channel(uint32_t channel_id)
{
	if (m_state == session_state::unauthenticated)
	{
		spdlog::warn("channel {}: open rejected, session is not authenticated", channel_id);
		return false;
	}

	if (m_channel_opened)
	{
		spdlog::error("channel {}: a channel was already opened on this connection", channel_id);
		throw system_ns::system_error(error::make_error_code(error::channel_already_open));
	}

	m_bridge = std::make_unique<channel_bridge>(channel_id, m_executor, m_settings);
	m_channel_opened = true;
	m_state = session_state::channel_requested;

	spdlog::info("channel {}: opened", channel_id);

	return true;
}

system_ns::error_code session_handler::find_channel(uint32_t channel_id) const
{
	system_ns::error_code ec;

	if (not m_bridge)
		ec = error::no_channel;
	else if (m_bridge->id() != channel_id)
		ec = error::unknown_channel;

	return ec;
}

channel_reply session_handler::forward_input(uint32_t channel_id, const blob &data)
{
	auto ec = find_channel(channel_id);
	if (not ec)
		ec = m_bridge->send_stdin(data);

	if (ec)
		spdlog::warn("channel {}: input of {} bytes rejected: {}", channel_id, data.size(), ec.message());

	return to_channel_reply(ec);
}

channel_reply session_handler::request_pty(uint32_t channel_id, std::shared_ptr<output_sink> sink, uint32_t cols, uint32_t rows)
{
	auto ec = find_channel(channel_id);
	if (not ec and not valid_dimensions(cols, rows))
		ec = error::invalid_dimensions;
	if (not ec)
		ec = m_bridge->create_pty(std::move(sink), static_cast<uint16_t>(cols), static_cast<uint16_t>(rows));

	if (ec)
		spdlog::warn("channel {}: pty request rejected: {}", channel_id, ec.message());
	else
		m_state = session_state::pty_ready;

	return to_channel_reply(ec);
}

channel_reply session_handler::request_resize(uint32_t channel_id, uint32_t cols, uint32_t rows)
{
	auto ec = find_channel(channel_id);
	if (not ec and not valid_dimensions(cols, rows))
		ec = error::invalid_dimensions;
	if (not ec)
		ec = m_bridge->resize(static_cast<uint16_t>(cols), static_cast<uint16_t>(rows));

	if (ec)
		spdlog::warn("channel {}: window change to {}x{} rejected: {}", channel_id, cols, rows, ec.message());

	return to_channel_reply(ec);
}

channel_reply session_handler::close_channel(uint32_t channel_id)
{
	auto ec = find_channel(channel_id);
	if (not ec)
	{
		spdlog::info("channel {}: closed", channel_id);
		m_bridge.reset();
		m_state = session_state::authenticated;
	}

	return to_channel_reply(ec);
}

} // namespace tuihost
