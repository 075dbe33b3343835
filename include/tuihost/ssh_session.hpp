//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file ssh_session.hpp
/// The SSH connection protocol on top of a session_handler
///
/// An ssh_session receives the decrypted payloads of one connection,
/// drives the session_handler with them and sends the replies through
/// the transport. Key exchange, encryption and packet framing are the
/// business of the transport.

#include "tuihost/packet.hpp"
#include "tuihost/session_handler.hpp"

namespace tuihost
{

const uint32_t kMaxPacketSize = 0x8000, kWindowSize = 4 * kMaxPacketSize;

/// \brief The interface to the encrypted transport of a connection
class transport
{
  public:
	virtual ~transport() {}

	/// \brief Queue \a out for sending, never blocks
	virtual void send(opacket &&out) = 0;

	/// \brief Close the connection after sending what was queued
	virtual void disconnect() = 0;
};

// --------------------------------------------------------------------
/// \brief The output sink writing channel_data packets
///
/// Data is split into packets no larger than the peer's maximum packet
/// size and writing suspends while the peer's window is exhausted.

class channel_data_sink : public output_sink
{
  public:
	channel_data_sink(asio_ns::any_io_executor executor, std::shared_ptr<transport> transport,
		uint32_t host_channel_id, uint32_t host_window_size, uint32_t max_packet_size);

	asio_ns::awaitable<void> write(std::string data) override;

	/// \brief The peer granted \a extra more bytes
	void window_adjust(uint32_t extra);

	/// \brief The channel is gone, pending and future writes fail
	void close();

	uint32_t host_window_size() const { return m_host_window_size; }
	bool is_open() const { return m_open; }

  private:
	std::shared_ptr<transport> m_transport;
	uint32_t m_host_channel_id;
	uint32_t m_host_window_size;
	uint32_t m_max_packet_size;
	bool m_open = true;
	asio_ns::steady_timer m_window_signal;
};

// --------------------------------------------------------------------

class ssh_session
{
  public:
	ssh_session(asio_ns::any_io_executor executor, std::shared_ptr<transport> transport, channel_settings settings);
	~ssh_session();

	ssh_session(const ssh_session &) = delete;
	ssh_session &operator=(const ssh_session &) = delete;

	/// \brief Handle one incomming payload
	void process(ipacket &in);

	const session_handler &handler() const { return m_handler; }

	/// \brief False once either side disconnected
	bool is_open() const { return m_open; }

	/// \brief The sink of the channel's render task, if a pty was created
	std::shared_ptr<channel_data_sink> sink() const { return m_sink; }

	/// \brief Send a disconnect message and close the transport
	void disconnect(disconnect_reason reason, const std::string &description);

  private:
	void process_service_request(ipacket &in);
	void process_userauth_request(ipacket &in);
	void process_channel_open(ipacket &in);
	void process_channel_request(ipacket &in);
	void process_channel_data(ipacket &in);
	void process_channel_close(ipacket &in);
	void process_global_request(ipacket &in);

	void handle_channel_request(uint32_t channel_id, const std::string &request, ipacket &in, opacket &out);

	void send(opacket out);
	void close_channel();

	asio_ns::any_io_executor m_executor;
	std::shared_ptr<transport> m_transport;
	session_handler m_handler;
	bool m_open = true;

	// the one channel of this connection
	uint32_t m_channel_id = 0;
	uint32_t m_host_channel_id = 0;
	uint32_t m_host_window_size = 0;
	uint32_t m_max_send_packet_size = 0;
	uint32_t m_my_window_size = 0;
	std::shared_ptr<channel_data_sink> m_sink;
};

} // namespace tuihost
