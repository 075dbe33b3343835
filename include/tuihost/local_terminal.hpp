//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file local_terminal.hpp
/// Host the application on the terminal this process runs in
///
/// The local terminal plays the part of an SSH client: it authenticates,
/// opens the one channel, requests a pty with the terminal's size and
/// then forwards keystrokes and window changes.

#include "tuihost/config.hpp"
#include "tuihost/session_handler.hpp"

#include <termios.h>

#include <array>

namespace tuihost
{

/// \brief Puts a terminal in raw mode for as long as this object lives
class raw_mode
{
  public:
	explicit raw_mode(int fd);
	~raw_mode();

	raw_mode(const raw_mode &) = delete;
	raw_mode &operator=(const raw_mode &) = delete;

	/// \brief False if \a fd is not a terminal
	bool active() const { return m_active; }

  private:
	int m_fd;
	bool m_active = false;
	struct termios m_saved;
};

// --------------------------------------------------------------------
/// \brief An output sink writing to a stream descriptor

class stream_sink : public output_sink
{
  public:
	explicit stream_sink(std::shared_ptr<asio_ns::posix::stream_descriptor> out)
		: m_out(std::move(out))
	{
	}

	asio_ns::awaitable<void> write(std::string data) override;

  private:
	std::shared_ptr<asio_ns::posix::stream_descriptor> m_out;
};

// --------------------------------------------------------------------
/// \brief Passes local keystrokes and window changes on to a session channel

class terminal_forwarder
{
  public:
	terminal_forwarder(session_handler &session, uint32_t channel_id, uint8_t detach_key)
		: m_session(session)
		, m_channel_id(channel_id)
		, m_detach_key(detach_key)
	{
	}

	/// \brief Forward the bytes up to the detach key
	///
	/// Returns false if the detach key was typed or the channel no
	/// longer accepts input.
	bool input(const uint8_t *data, std::size_t length);

	/// \brief Forward a window change, a refused size keeps the previous one
	bool resize(uint16_t cols, uint16_t rows);

  private:
	session_handler &m_session;
	uint32_t m_channel_id;
	uint8_t m_detach_key;
};

// --------------------------------------------------------------------

class local_terminal
{
  public:
	local_terminal(asio_ns::any_io_executor executor, const options &opts);
	~local_terminal();

	local_terminal(const local_terminal &) = delete;
	local_terminal &operator=(const local_terminal &) = delete;

	/// \brief Open the channel and start forwarding input and window changes
	void start();

	/// \brief Close the channel, the render task ends after its last frame
	void stop();

	bool is_open() const { return m_open; }

	/// \brief The size of the terminal, 80x24 if it cannot be determined
	static std::pair<uint16_t, uint16_t> window_size(int fd);

  private:
	static constexpr uint32_t kChannelId = 0;

	void read_input();
	void wait_for_signal();

	asio_ns::posix::stream_descriptor m_input;
	std::shared_ptr<asio_ns::posix::stream_descriptor> m_output;
	asio_ns::signal_set m_signals;
	session_handler m_session;
	terminal_forwarder m_forwarder;
	std::unique_ptr<raw_mode> m_raw_mode;
	std::array<uint8_t, 1024> m_buffer;
	bool m_open = false;
};

} // namespace tuihost
