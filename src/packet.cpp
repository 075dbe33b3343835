//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/packet.hpp>

#include <boost/algorithm/string.hpp>

namespace ba = boost::algorithm;

namespace tuihost
{

const char *to_string(message_type msg)
{
	switch (msg)
	{
		case msg_disconnect: return "disconnect";
		case msg_ignore: return "ignore";
		case msg_unimplemented: return "unimplemented";
		case msg_debug: return "debug";
		case msg_service_request: return "service_request";
		case msg_service_accept: return "service_accept";
		case msg_userauth_request: return "userauth_request";
		case msg_userauth_failure: return "userauth_failure";
		case msg_userauth_success: return "userauth_success";
		case msg_userauth_banner: return "userauth_banner";
		case msg_global_request: return "global_request";
		case msg_request_success: return "request_success";
		case msg_request_failure: return "request_failure";
		case msg_channel_open: return "channel_open";
		case msg_channel_open_confirmation: return "channel_open_confirmation";
		case msg_channel_open_failure: return "channel_open_failure";
		case msg_channel_window_adjust: return "channel_window_adjust";
		case msg_channel_data: return "channel_data";
		case msg_channel_extended_data: return "channel_extended_data";
		case msg_channel_eof: return "channel_eof";
		case msg_channel_close: return "channel_close";
		case msg_channel_request: return "channel_request";
		case msg_channel_success: return "channel_success";
		case msg_channel_failure: return "channel_failure";
		default: return "undefined";
	}
}

// --------------------------------------------------------------------

opacket::opacket(message_type message)
	: m_data(1)
{
	m_data[0] = message;
}

opacket &opacket::operator<<(bool v)
{
	m_data.push_back(v ? 1 : 0);
	return *this;
}

opacket &opacket::operator<<(std::string_view v)
{
	operator<<(static_cast<uint32_t>(v.length()));
	const uint8_t *s = reinterpret_cast<const uint8_t *>(v.data());
	m_data.insert(m_data.end(), s, s + v.length());
	return *this;
}

opacket &opacket::operator<<(const std::vector<std::string> &v)
{
	return operator<<(ba::join(v, ","));
}

opacket &opacket::operator<<(const blob &v)
{
	operator<<(static_cast<uint32_t>(v.size()));
	m_data.insert(m_data.end(), v.begin(), v.end());
	return *this;
}

// --------------------------------------------------------------------

ipacket::ipacket(uint32_t nr, blob payload)
	: m_message(payload.empty() ? msg_undefined : static_cast<message_type>(payload[0]))
	, m_number(nr)
	, m_offset(payload.empty() ? 0 : 1)
	, m_data(std::move(payload))
{
}

ipacket::ipacket(const opacket &p, uint32_t nr)
	: ipacket(nr, static_cast<blob>(p))
{
}

ipacket &ipacket::operator>>(bool &v)
{
	if (m_offset + 1 > m_data.size())
		throw packet_exception();

	v = m_data[m_offset++] != 0;

	return *this;
}

ipacket &ipacket::operator>>(std::string &v)
{
	std::pair<const char *, std::size_t> s;
	operator>>(s);
	v.assign(s.first, s.second);

	return *this;
}

ipacket &ipacket::operator>>(blob &v)
{
	uint32_t l;
	operator>>(l);

	if (l > m_data.size() - m_offset)
		throw packet_exception();

	v.assign(m_data.begin() + m_offset, m_data.begin() + m_offset + l);
	m_offset += l;

	return *this;
}

ipacket &ipacket::operator>>(std::pair<const char *, std::size_t> &v)
{
	uint32_t l;
	operator>>(l);

	if (l > m_data.size() - m_offset)
		throw packet_exception();

	v.first = reinterpret_cast<const char *>(m_data.data() + m_offset);
	v.second = l;
	m_offset += l;

	return *this;
}

ipacket &ipacket::operator>>(skip_offset s)
{
	if (s.m_offset == -1)
	{
		uint32_t len;
		operator>>(len);
		if (len > m_data.size() - m_offset)
			throw packet_exception();
		m_offset += len;
	}
	else
	{
		if (static_cast<std::size_t>(s.m_offset) > m_data.size() - m_offset)
			throw packet_exception();
		m_offset += s.m_offset;
	}

	return *this;
}

} // namespace tuihost
