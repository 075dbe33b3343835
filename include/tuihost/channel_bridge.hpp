//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file channel_bridge.hpp
/// The per channel link between the protocol handler and a render task

#include "tuihost/render_loop.hpp"

#include <chrono>
#include <optional>

namespace tuihost
{

/// \brief How a channel's render task is set up
struct channel_settings
{
	application_factory make_application;

	/// Interval for periodic render events, zero means only render on demand
	std::chrono::milliseconds render_interval{ 0 };
};

/// Upper bound for cols * rows, larger terminals are refused
const uint32_t kMaxTerminalCells = 0x40000;

// --------------------------------------------------------------------
/// \brief Enqueues a render event at a fixed interval

class render_ticker : public std::enable_shared_from_this<render_ticker>
{
  public:
	render_ticker(asio_ns::any_io_executor executor, event_sender events, std::chrono::milliseconds interval)
		: m_timer(executor)
		, m_events(std::move(events))
		, m_interval(interval)
	{
	}

	render_ticker(const render_ticker &) = delete;
	render_ticker &operator=(const render_ticker &) = delete;

	void start();
	void stop();

	std::size_t ticks() const { return m_ticks; }

  private:
	void time_out(const system_ns::error_code &ec);

	asio_ns::steady_timer m_timer;
	std::optional<event_sender> m_events;
	std::chrono::milliseconds m_interval;
	std::size_t m_ticks = 0;
};

// --------------------------------------------------------------------
/// \brief Per channel state, the producer end of the channel's render task
///
/// A bridge starts without a pseudo terminal. Creating one spawns the
/// render task, after that input and resize events can be forwarded.
/// Destroying the bridge ends the render task once its queue is drained.

class channel_bridge
{
  public:
	channel_bridge(uint32_t channel_id, asio_ns::any_io_executor executor, channel_settings settings);
	~channel_bridge();

	channel_bridge(const channel_bridge &) = delete;
	channel_bridge &operator=(const channel_bridge &) = delete;

	uint32_t id() const { return m_id; }

	bool pty_created() const { return m_pty_created; }
	uint16_t cols() const { return m_cols; }
	uint16_t rows() const { return m_rows; }

	/// \brief Forward raw bytes typed at the remote terminal to the application
	system_ns::error_code send_stdin(const blob &data);

	/// \brief Spawn the render task writing to \a sink and queue the initial size
	system_ns::error_code create_pty(std::shared_ptr<output_sink> sink, uint16_t cols, uint16_t rows);

	/// \brief Queue a new terminal size, does not wait for the render
	system_ns::error_code resize(uint16_t cols, uint16_t rows);

	/// \brief The render task, empty before create_pty or after the task ended
	std::weak_ptr<render_loop> render_task() const { return m_render_loop; }

  private:
	system_ns::error_code send(app_event event);

	uint32_t m_id;
	asio_ns::any_io_executor m_executor;
	channel_settings m_settings;

	bool m_pty_created = false;
	uint16_t m_cols = 0, m_rows = 0;

	std::optional<event_sender> m_events;
	std::weak_ptr<render_loop> m_render_loop;
	std::shared_ptr<render_ticker> m_ticker;
};

} // namespace tuihost
