//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/debug.hpp>
#include <tuihost/ssh_session.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <optional>

namespace tuihost
{

channel_data_sink::channel_data_sink(asio_ns::any_io_executor executor, std::shared_ptr<transport> transport,
	uint32_t host_channel_id, uint32_t host_window_size, uint32_t max_packet_size)
	: m_transport(std::move(transport))
	, m_host_channel_id(host_channel_id)
	, m_host_window_size(host_window_size)
	, m_max_packet_size(max_packet_size > 0 ? std::min(max_packet_size, kMaxPacketSize) : kMaxPacketSize)
	, m_window_signal(executor)
{
}

asio_ns::awaitable<void> channel_data_sink::write(std::string data)
{
	std::size_t offset = 0;

	while (offset < data.size())
	{
		if (not m_open)
			throw system_ns::system_error(error::make_error_code(error::channel_closed));

		if (m_host_window_size == 0)
		{
			// wait for a window adjust or close, both cancel the timer
			system_ns::error_code ec;
			m_window_signal.expires_at(asio_ns::steady_timer::time_point::max());
			co_await m_window_signal.async_wait(asio_ns::redirect_error(asio_ns::use_awaitable, ec));
			continue;
		}

		std::size_t n = std::min<std::size_t>({ data.size() - offset, m_host_window_size, m_max_packet_size });

		opacket out(msg_channel_data);
		out << m_host_channel_id << std::string_view(data.data() + offset, n);
		m_transport->send(std::move(out));

		m_host_window_size -= static_cast<uint32_t>(n);
		offset += n;
	}
}

void channel_data_sink::window_adjust(uint32_t extra)
{
	if (extra > std::numeric_limits<uint32_t>::max() - m_host_window_size)
		m_host_window_size = std::numeric_limits<uint32_t>::max();
	else
		m_host_window_size += extra;

	m_window_signal.cancel();
}

void channel_data_sink::close()
{
	m_open = false;
	m_window_signal.cancel();
}

// --------------------------------------------------------------------

ssh_session::ssh_session(asio_ns::any_io_executor executor, std::shared_ptr<transport> transport, channel_settings settings)
	: m_executor(executor)
	, m_transport(std::move(transport))
	, m_handler(executor, std::move(settings))
{
}

ssh_session::~ssh_session()
{
	if (m_sink)
		m_sink->close();
}

void ssh_session::send(opacket out)
{
	if (spdlog::default_logger_raw()->should_log(spdlog::level::trace))
		spdlog::trace("sending {}\n{}", to_string(out.message()), hex_dump(out));

	m_transport->send(std::move(out));
}

void ssh_session::disconnect(disconnect_reason reason, const std::string &description)
{
	if (not m_open)
		return;

	spdlog::info("disconnecting: {}", description);

	close_channel();

	send(opacket(msg_disconnect) << static_cast<uint32_t>(reason) << description << "");
	m_transport->disconnect();

	m_open = false;
}

void ssh_session::close_channel()
{
	if (m_sink)
	{
		m_sink->close();
		m_sink.reset();
	}

	if (m_handler.bridge() != nullptr)
		m_handler.close_channel(m_channel_id);
}

void ssh_session::process(ipacket &in)
{
	if (not m_open)
		return;

	if (spdlog::default_logger_raw()->should_log(spdlog::level::trace))
		spdlog::trace("received {}\n{}", to_string(in.message()), hex_dump(in));

	try
	{
		switch ((message_type)in)
		{
			case msg_disconnect:
			{
				uint32_t reason_code;
				std::string description;
				in >> reason_code >> description;

				spdlog::info("peer disconnected ({}): {}", reason_code, description);

				close_channel();
				m_open = false;
				break;
			}

			case msg_ignore:
			case msg_debug:
			case msg_unimplemented:
				break;

			case msg_service_request:
				process_service_request(in);
				break;

			case msg_userauth_request:
				process_userauth_request(in);
				break;

			case msg_global_request:
				process_global_request(in);
				break;

			case msg_channel_open:
				process_channel_open(in);
				break;

			case msg_channel_request:
				process_channel_request(in);
				break;

			case msg_channel_data:
				process_channel_data(in);
				break;

			case msg_channel_window_adjust:
			{
				uint32_t channel_id, extra;
				in >> channel_id >> extra;

				if (channel_id != m_channel_id or m_handler.bridge() == nullptr)
					break;

				if (m_sink)
					m_sink->window_adjust(extra);
				else if (extra > std::numeric_limits<uint32_t>::max() - m_host_window_size)
					m_host_window_size = std::numeric_limits<uint32_t>::max();
				else
					m_host_window_size += extra;
				break;
			}

			case msg_channel_eof:
			{
				uint32_t channel_id;
				in >> channel_id;
				spdlog::debug("channel {}: end of input", channel_id);
				break;
			}

			case msg_channel_close:
				process_channel_close(in);
				break;

			default:
				spdlog::debug("unimplemented message {} (#{})", static_cast<int>(in.message()), in.nr());
				send(opacket(msg_unimplemented) << in.nr());
				break;
		}
	}
	catch (const packet_exception &ex)
	{
		spdlog::error("malformed {} message: {}", to_string(in.message()), ex.what());
		disconnect(disconnect_protocol_error, error::make_error_code(error::protocol_error).message());
	}
}

void ssh_session::process_service_request(ipacket &in)
{
	std::string service;
	in >> service;

	send(opacket(msg_service_accept) << service);
}

void ssh_session::process_userauth_request(ipacket &in)
{
	std::string user, service, method;
	in >> user >> service >> method;

	std::optional<auth_method> m;
	if (method == "none")
		m = auth_method::none;
	else if (method == "password")
		m = auth_method::password;
	else if (method == "publickey")
		m = auth_method::public_key;

	if (m and m_handler.authenticate(*m, user) == auth_reply::accept)
		send(opacket(msg_userauth_success));
	else
	{
		spdlog::warn("user '{}': unsupported authentication method '{}'", user, method);
		send(opacket(msg_userauth_failure) << std::vector<std::string>{ "none", "password", "publickey" } << false);
	}
}

void ssh_session::process_global_request(ipacket &in)
{
	std::string request;
	bool want_reply;
	in >> request >> want_reply;

	spdlog::debug("global request '{}' declined", request);

	if (want_reply)
		send(opacket(msg_request_failure));
}

void ssh_session::process_channel_open(ipacket &in)
{
	std::string type;
	uint32_t host_channel_id, window_size, max_packet_size;
	in >> type >> host_channel_id >> window_size >> max_packet_size;

	auto reject = [&](open_failure_reason reason, const std::string &description)
	{
		spdlog::warn("channel open of type '{}' rejected: {}", type, description);
		send(opacket(msg_channel_open_failure) << host_channel_id << static_cast<uint32_t>(reason) << description << "en");
	};

	if (type != "session")
	{
		reject(open_unknown_channel_type, "unsupported channel type");
		return;
	}

	try
	{
		if (not m_handler.open_channel(m_channel_id))
		{
			reject(open_administratively_prohibited, "not authenticated");
			return;
		}
	}
	catch (const system_ns::system_error &ex)
	{
		if (ex.code() != error::channel_already_open)
			throw;

		reject(open_administratively_prohibited, ex.code().message());
		disconnect(disconnect_protocol_error, ex.code().message());
		return;
	}

	m_host_channel_id = host_channel_id;
	m_host_window_size = window_size;
	m_max_send_packet_size = max_packet_size;
	m_my_window_size = kWindowSize;

	send(opacket(msg_channel_open_confirmation) << m_host_channel_id << m_channel_id << kWindowSize << kMaxPacketSize);
}

void ssh_session::process_channel_request(ipacket &in)
{
	uint32_t channel_id;
	std::string request;
	bool want_reply = false;

	in >> channel_id >> request >> want_reply;

	opacket out;
	handle_channel_request(channel_id, request, in, out);

	if (want_reply)
	{
		if (out.empty())
			out = opacket(msg_channel_failure) << m_host_channel_id;
		send(std::move(out));
	}
}

void ssh_session::handle_channel_request(uint32_t channel_id, const std::string &request, ipacket &in, opacket &out)
{
	channel_reply reply = channel_reply::failure;

	if (request == "pty-req")
	{
		std::string term;
		uint32_t cols, rows;
		in >> term >> cols >> rows >> skip(8) >> skip_str;

		spdlog::debug("channel {}: pty-req for {} {}x{}", channel_id, term, cols, rows);

		auto sink = std::make_shared<channel_data_sink>(m_executor, m_transport,
			m_host_channel_id, m_host_window_size, m_max_send_packet_size);

		reply = m_handler.request_pty(channel_id, sink, cols, rows);
		if (reply == channel_reply::success)
			m_sink = sink;
	}
	else if (request == "window-change")
	{
		uint32_t cols, rows;
		in >> cols >> rows >> skip(8);

		reply = m_handler.request_resize(channel_id, cols, rows);
	}
	else if (request == "shell")
	{
		if (m_handler.bridge() != nullptr and m_handler.bridge()->id() == channel_id)
			reply = channel_reply::success;
	}
	else
		spdlog::debug("channel {}: unsupported request '{}'", channel_id, request);

	if (reply == channel_reply::success)
		out = opacket(msg_channel_success) << m_host_channel_id;
}

void ssh_session::process_channel_data(ipacket &in)
{
	uint32_t channel_id;
	std::pair<const char *, std::size_t> data;
	in >> channel_id >> data;

	if (m_handler.forward_input(channel_id, blob(data.first, data.first + data.second)) == channel_reply::failure)
		send(opacket(msg_channel_failure) << m_host_channel_id);

	if (m_handler.bridge() == nullptr)
		return;

	m_my_window_size -= static_cast<uint32_t>(std::min<std::size_t>(data.second, m_my_window_size));

	if (m_my_window_size < kWindowSize - 2 * kMaxPacketSize)
	{
		uint32_t adjust = kWindowSize - m_my_window_size;
		m_my_window_size += adjust;

		send(opacket(msg_channel_window_adjust) << m_host_channel_id << adjust);
	}
}

void ssh_session::process_channel_close(ipacket &in)
{
	uint32_t channel_id;
	in >> channel_id;

	if (m_handler.bridge() == nullptr or m_handler.bridge()->id() != channel_id)
	{
		spdlog::warn("channel {}: close for unknown channel", channel_id);
		return;
	}

	close_channel();

	send(opacket(msg_channel_close) << m_host_channel_id);
}

} // namespace tuihost
