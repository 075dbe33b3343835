//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file render_loop.hpp
/// The task that owns a channel's viewport and writes all of its output
///
/// A render_loop is the single consumer of its channel's event queue and
/// the single writer of the channel's output sink. It runs as a coroutine
/// until every producer of its queue is gone.

#include "tuihost/application.hpp"
#include "tuihost/event_queue.hpp"
#include "tuihost/output_sink.hpp"
#include "tuihost/render_backend.hpp"

#include <optional>

namespace tuihost
{

class render_loop
{
  public:
	render_loop(uint32_t channel_id, event_receiver events, std::shared_ptr<output_sink> sink,
		std::unique_ptr<application> app, std::unique_ptr<render_backend> backend);

	render_loop(const render_loop &) = delete;
	render_loop &operator=(const render_loop &) = delete;

	/// \brief The body of the render task, use with co_spawn
	///
	/// Takes shared ownership of \a self for as long as the task runs.
	static asio_ns::awaitable<void> run(std::shared_ptr<render_loop> self);

	/// \brief The current viewport, always at origin 0, 0
	const rect &viewport() const { return m_viewport; }

	/// \brief The area of the last frame written to the sink
	const rect &last_frame() const { return m_last_frame; }

	std::size_t frames_rendered() const { return m_frames_rendered; }

	/// \brief True once the task has ended
	bool finished() const { return m_finished; }

	/// \brief Why the task ended, error::end_of_stream for a regular end
	system_ns::error_code result() const { return m_result; }

  private:
	asio_ns::awaitable<void> process(app_event event);
	asio_ns::awaitable<void> render();

	void release();

	uint32_t m_channel_id;
	std::optional<event_receiver> m_events;
	std::shared_ptr<output_sink> m_sink;
	std::unique_ptr<application> m_application;
	std::unique_ptr<render_backend> m_backend;

	rect m_viewport;
	rect m_last_frame;
	std::size_t m_frames_rendered = 0;
	bool m_finished = false;
	system_ns::error_code m_result;
};

} // namespace tuihost
