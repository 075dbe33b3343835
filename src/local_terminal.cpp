//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/local_terminal.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <sys/ioctl.h>
#include <unistd.h>

namespace tuihost
{

namespace
{
	int duplicate(int fd)
	{
		int result = ::dup(fd);
		if (result < 0)
			throw system_ns::system_error(errno, system_ns::system_category(), "dup");
		return result;
	}

	std::string local_user()
	{
		const char *user = ::getenv("USER");
		return user != nullptr ? user : "local";
	}
} // namespace

raw_mode::raw_mode(int fd)
	: m_fd(fd)
{
	if (::isatty(m_fd) and ::tcgetattr(m_fd, &m_saved) == 0)
	{
		struct termios tty = m_saved;
		::cfmakeraw(&tty);
		m_active = ::tcsetattr(m_fd, TCSANOW, &tty) == 0;
	}
}

raw_mode::~raw_mode()
{
	if (m_active)
		::tcsetattr(m_fd, TCSANOW, &m_saved);
}

// --------------------------------------------------------------------

asio_ns::awaitable<void> stream_sink::write(std::string data)
{
	co_await asio_ns::async_write(*m_out, asio_ns::buffer(data), asio_ns::use_awaitable);
}

// --------------------------------------------------------------------

bool terminal_forwarder::input(const uint8_t *data, std::size_t length)
{
	auto end = data + length;
	auto detach = std::find(data, end, m_detach_key);

	if (detach != data and
		m_session.forward_input(m_channel_id, blob(data, detach)) != channel_reply::success)
	{
		// the render task is gone, nothing reads the input anymore
		spdlog::error("channel {}: input not accepted, stopping", m_channel_id);
		return false;
	}

	if (detach != end)
	{
		spdlog::info("detach key pressed");
		return false;
	}

	return true;
}

bool terminal_forwarder::resize(uint16_t cols, uint16_t rows)
{
	if (m_session.request_resize(m_channel_id, cols, rows) != channel_reply::success)
	{
		spdlog::warn("channel {}: terminal size {}x{} not accepted, keeping the previous size", m_channel_id, cols, rows);
		return false;
	}

	return true;
}

// --------------------------------------------------------------------

local_terminal::local_terminal(asio_ns::any_io_executor executor, const options &opts)
	: m_input(executor, duplicate(STDIN_FILENO))
	, m_output(std::make_shared<asio_ns::posix::stream_descriptor>(executor, duplicate(STDOUT_FILENO)))
	, m_signals(executor, SIGWINCH, SIGINT, SIGTERM)
	, m_session(executor, opts.make_channel_settings())
	, m_forwarder(m_session, kChannelId, opts.detach_key)
{
}

local_terminal::~local_terminal()
{
	m_raw_mode.reset();

	// the render backend hides the cursor
	const char kRestore[] = "\x1b[0m\x1b[?25h\r\n";
	if (::write(STDOUT_FILENO, kRestore, sizeof(kRestore) - 1) < 0)
		spdlog::debug("could not restore the cursor: {}", std::strerror(errno));
}

std::pair<uint16_t, uint16_t> local_terminal::window_size(int fd)
{
	struct winsize ws = {};
	if (::ioctl(fd, TIOCGWINSZ, &ws) == 0 and ws.ws_col > 0 and ws.ws_row > 0)
		return { ws.ws_col, ws.ws_row };

	return { 80, 24 };
}

void local_terminal::start()
{
	m_raw_mode = std::make_unique<raw_mode>(STDIN_FILENO);
	if (not m_raw_mode->active())
		spdlog::warn("stdin is not a terminal, input is not in raw mode");

	m_session.authenticate(auth_method::none, local_user());

	if (not m_session.open_channel(kChannelId))
		throw system_ns::system_error(error::make_error_code(error::not_authenticated));

	auto [cols, rows] = window_size(STDOUT_FILENO);

	if (m_session.request_pty(kChannelId, std::make_shared<stream_sink>(m_output), cols, rows) != channel_reply::success)
		throw system_ns::system_error(error::make_error_code(error::pty_not_created));

	m_open = true;

	read_input();
	wait_for_signal();
}

void local_terminal::stop()
{
	if (not m_open)
		return;

	m_open = false;

	if (m_session.close_channel(kChannelId) != channel_reply::success)
		spdlog::debug("channel {} was already closed", kChannelId);

	system_ns::error_code ec;
	m_input.cancel(ec);
	m_signals.cancel(ec);

	m_raw_mode.reset();
}

void local_terminal::read_input()
{
	m_input.async_read_some(asio_ns::buffer(m_buffer),
		[this](const system_ns::error_code &ec, std::size_t length)
		{
			if (ec)
			{
				if (ec != asio_ns::error::operation_aborted)
				{
					spdlog::info("input closed: {}", ec.message());
					stop();
				}
				return;
			}

			if (not m_forwarder.input(m_buffer.data(), length))
				stop();
			else if (m_open)
				read_input(); });
}

void local_terminal::wait_for_signal()
{
	m_signals.async_wait(
		[this](const system_ns::error_code &ec, int signal)
		{
			if (ec)
				return;

			if (signal == SIGWINCH)
			{
				auto [cols, rows] = window_size(STDOUT_FILENO);
				m_forwarder.resize(cols, rows);
				wait_for_signal();
			}
			else
			{
				spdlog::info("stopping on signal {}", signal);
				stop();
			} });
}

} // namespace tuihost
