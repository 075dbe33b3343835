//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/render_loop.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace tuihost
{

render_loop::render_loop(uint32_t channel_id, event_receiver events, std::shared_ptr<output_sink> sink,
	std::unique_ptr<application> app, std::unique_ptr<render_backend> backend)
	: m_channel_id(channel_id)
	, m_events(std::move(events))
	, m_sink(std::move(sink))
	, m_application(std::move(app))
	, m_backend(std::move(backend))
{
}

asio_ns::awaitable<void> render_loop::run(std::shared_ptr<render_loop> self)
{
	spdlog::debug("channel {}: render task started", self->m_channel_id);

	try
	{
		for (;;)
		{
			system_ns::error_code ec;
			app_event event = co_await self->m_events->async_receive(
				asio_ns::redirect_error(asio_ns::use_awaitable, ec));

			if (ec == error::end_of_stream)
			{
				self->m_result = ec;
				break;
			}

			if (ec)
				throw system_ns::system_error(ec);

			co_await self->process(std::move(event));
		}

		spdlog::info("channel {}: render task finished after {} frames", self->m_channel_id, self->m_frames_rendered);
	}
	catch (const system_ns::system_error &ex)
	{
		self->m_result = ex.code();
		if (ex.code() == error::channel_closed)
			spdlog::info("channel {}: render task stopped, channel closed", self->m_channel_id);
		else
			spdlog::error("channel {}: render task stopped: {}", self->m_channel_id, ex.code().message());
	}
	catch (const std::exception &ex)
	{
		self->m_result = error::make_error_code(error::render_failed);
		spdlog::error("channel {}: render task failed: {}", self->m_channel_id, ex.what());
	}

	self->release();
}

void render_loop::release()
{
	m_finished = true;
	m_events.reset();
	m_backend.reset();
	m_application.reset();
	m_sink.reset();
}

asio_ns::awaitable<void> render_loop::process(app_event event)
{
	spdlog::debug("channel {}: {} event", m_channel_id, event_name(event));

	if (auto resize = std::get_if<resize_event>(&event))
	{
		// the remote terminal's size is authoritative, replace, don't merge
		m_viewport = { 0, 0, resize->width, resize->height };
		co_await render();
	}
	else if (std::holds_alternative<render_event>(event))
		co_await render();
	else if (auto input = std::get_if<input_event>(&event))
	{
		if (m_application->handle_input(input->data))
			co_await render();
	}
	else
		throw system_ns::system_error(error::make_error_code(error::unsupported_event), event_name(event));
}

asio_ns::awaitable<void> render_loop::render()
{
	if (m_viewport.empty())
		co_return;

	terminal_buffer buffer(m_viewport);
	frame f(buffer);
	m_application->draw(f);

	std::string bytes = m_backend->draw(buffer);

	co_await m_sink->write(std::move(bytes));

	m_last_frame = buffer.area();
	++m_frames_rendered;
}

} // namespace tuihost
