//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \brief Encapsulation of the payload of a decrypted SSH packet

#include "tuihost/asio.hpp"
#include "tuihost/types.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace tuihost
{

/// forward declarations
class ipacket;
class opacket;

/// \brief exception thrown in case of an invalid packet
class packet_exception : public std::exception
{
  public:
	const char *what() const noexcept override { return "invalid or truncated packet"; }
};

/// \brief The messages known, the transport and connection protocol subset
enum message_type : uint8_t
{
	msg_undefined,

	msg_disconnect = 1,
	msg_ignore,
	msg_unimplemented,
	msg_debug,
	msg_service_request,
	msg_service_accept,

	msg_userauth_request = 50,
	msg_userauth_failure,
	msg_userauth_success,
	msg_userauth_banner,

	msg_global_request = 80,
	msg_request_success,
	msg_request_failure,

	msg_channel_open = 90,
	msg_channel_open_confirmation,
	msg_channel_open_failure,
	msg_channel_window_adjust,
	msg_channel_data,
	msg_channel_extended_data,
	msg_channel_eof,
	msg_channel_close,
	msg_channel_request,
	msg_channel_success,
	msg_channel_failure
};

/// \brief Disconnect reason codes, RFC 4253 section 11.1
enum disconnect_reason : uint32_t
{
	disconnect_protocol_error = 2,
	disconnect_by_application = 11
};

/// \brief Channel open failure reason codes, RFC 4254 section 5.1
enum open_failure_reason : uint32_t
{
	open_administratively_prohibited = 1,
	open_connect_failed,
	open_unknown_channel_type,
	open_resource_shortage
};

const char *to_string(message_type msg);

/// \brief the outgoing packet
class opacket
{
  public:
	/// \brief Simple constructor, create fully empty packet
	opacket() {}

	/// \brief Construtor
	///
	/// \param message	The data will start with this message
	opacket(message_type message);

	/// \brief Construtor
	///
	/// \param message	The data will start with message \a message and will contain the optional data elements \a v
	template <typename... Ts>
	opacket(message_type message, Ts... v)
		: opacket(message)
	{
		(operator<<(v), ...);
	}

	opacket(const opacket &rhs) = default;
	opacket(opacket &&rhs) = default;
	opacket &operator=(const opacket &rhs) = default;
	opacket &operator=(opacket &&rhs) = default;

	/// \brief View the contents of this packet
	operator blob() const { return m_data; }

	/// \brief Return if this packet contains any sensible data
	bool empty() const { return m_data.empty() or static_cast<message_type>(m_data[0]) == msg_undefined; }

	/// \brief The message byte of this packet
	message_type message() const { return empty() ? msg_undefined : static_cast<message_type>(m_data[0]); }

	const uint8_t *data() const { return m_data.data(); }
	std::size_t size() const { return m_data.size(); }

	explicit operator bool() const { return not empty(); }

	/// \brief Store the value \a v
	template <typename T, typename std::enable_if_t<std::is_integral_v<T>, int> = 0>
	opacket &operator<<(T v)
	{
		for (int i = sizeof(T) - 1; i >= 0; --i)
			m_data.push_back(static_cast<uint8_t>(v >> (i * 8)));

		return *this;
	}

	opacket &operator<<(bool v);
	opacket &operator<<(std::string_view v);
	opacket &operator<<(const char *v) { return operator<<(std::string_view(v)); }
	opacket &operator<<(const std::string &v) { return operator<<(std::string_view(v)); }
	opacket &operator<<(const std::vector<std::string> &v);
	opacket &operator<<(const blob &v);

  protected:
	blob m_data;
};

struct skip_string_t
{
};

struct skip_offset
{
	constexpr skip_offset(int offset)
		: m_offset(offset)
	{
	}
	constexpr skip_offset(skip_string_t)
		: m_offset(-1)
	{
	}
	int m_offset;
};

constexpr skip_offset skip_str = skip_offset(skip_string_t{});
constexpr skip_offset skip(int offset) { return skip_offset(offset); }

/// \brief Incomming packet, the payload after decryption and decompression
class ipacket
{
  public:
	/// \brief Constructor taking a sequence number and the payload
	ipacket(uint32_t nr, blob payload);

	/// \brief Constructor for an outgoing packet's contents, for loopback and tests
	ipacket(const opacket &p, uint32_t nr = 0);

	ipacket(const ipacket &rhs) = default;
	ipacket(ipacket &&rhs) = default;
	ipacket &operator=(const ipacket &rhs) = default;
	ipacket &operator=(ipacket &&rhs) = default;

	/// \brief Return the packet sequence number
	uint32_t nr() const { return m_number; }

	/// \brief The size of the payload
	std::size_t size() const { return m_data.size(); }

	/// \brief Number of bytes not read yet
	std::size_t remaining() const { return m_data.size() - m_offset; }

	/// \brief Get the message byte of this packet
	message_type message() const { return m_message; }

	/// \brief Get the message byte of this packet
	operator message_type() const { return m_message; }

	bool operator==(message_type msg) const { return m_message == msg; }

	/// \brief Return a copy of the payload as a blob
	operator blob() const { return m_data; }

	/// \brief Read data values from an ipacket
	template <typename T, typename std::enable_if_t<std::is_integral_v<T>, int> = 0>
	ipacket &operator>>(T &v)
	{
		v = 0;

		if (m_offset + sizeof(T) > m_data.size())
			throw packet_exception();

		for (int i = sizeof(T) - 1; i >= 0; --i)
			v = static_cast<T>(v << 8 | m_data[m_offset++]);

		return *this;
	}

	ipacket &operator>>(bool &v);
	ipacket &operator>>(std::string &v);
	ipacket &operator>>(blob &v);

	/// \brief Read a string without copying, the result points into this packet
	ipacket &operator>>(std::pair<const char *, std::size_t> &v);

	/// \brief Skip over data in a packet.
	///
	/// Skip over a fixed number of bytes, or a string
	/// \param s	Skip offset, can be either skip(offset) or skip_str
	ipacket &operator>>(skip_offset s);

  protected:
	message_type m_message;
	uint32_t m_number;
	std::size_t m_offset;
	blob m_data;
};

} // namespace tuihost
