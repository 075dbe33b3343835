//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/channel_bridge.hpp>

#include <spdlog/spdlog.h>

namespace tuihost
{

namespace
{
	bool valid_size(uint16_t cols, uint16_t rows)
	{
		return cols > 0 and rows > 0 and static_cast<uint32_t>(cols) * rows <= kMaxTerminalCells;
	}
} // namespace

void render_ticker::start()
{
	m_timer.expires_after(m_interval);
	m_timer.async_wait(std::bind(&render_ticker::time_out, shared_from_this(), std::placeholders::_1));
}

void render_ticker::stop()
{
	m_events.reset();
	m_timer.cancel();
}

void render_ticker::time_out(const system_ns::error_code &ec)
{
	if (ec == asio_ns::error::operation_aborted or not m_events)
		return;

	if (auto err = m_events->send(render_event{}); err)
	{
		spdlog::debug("render ticker stopped: {}", err.message());
		m_events.reset();
		return;
	}

	++m_ticks;

	m_timer.expires_after(m_interval);
	m_timer.async_wait(std::bind(&render_ticker::time_out, shared_from_this(), std::placeholders::_1));
}

// --------------------------------------------------------------------

channel_bridge::channel_bridge(uint32_t channel_id, asio_ns::any_io_executor executor, channel_settings settings)
	: m_id(channel_id)
	, m_executor(executor)
	, m_settings(std::move(settings))
{
}

channel_bridge::~channel_bridge()
{
	if (m_ticker)
		m_ticker->stop();
}

system_ns::error_code channel_bridge::send_stdin(const blob &data)
{
	if (not m_pty_created)
		return error::make_error_code(error::pty_not_created);

	return send(input_event{ data });
}

system_ns::error_code channel_bridge::create_pty(std::shared_ptr<output_sink> sink, uint16_t cols, uint16_t rows)
{
	if (m_pty_created)
		return error::make_error_code(error::pty_already_created);

	if (not valid_size(cols, rows))
		return error::make_error_code(error::invalid_dimensions);

	auto [sender, receiver] = make_event_queue(m_executor);

	std::unique_ptr<application> app;
	if (m_settings.make_application)
		app = m_settings.make_application();
	else
		app = std::make_unique<greeting_application>();

	auto loop = std::make_shared<render_loop>(m_id, std::move(receiver), std::move(sink),
		std::move(app), std::make_unique<ansi_backend>());

	asio_ns::co_spawn(m_executor, render_loop::run(loop),
		[id = m_id](std::exception_ptr ex)
		{
			if (ex)
			{
				try
				{
					std::rethrow_exception(ex);
				}
				catch (const std::exception &e)
				{
					spdlog::error("channel {}: render task failed: {}", id, e.what());
				}
			} });

	m_render_loop = loop;
	m_events = std::move(sender);

	m_pty_created = true;
	m_cols = cols;
	m_rows = rows;

	spdlog::info("channel {}: pty created, {}x{}", m_id, cols, rows);

	if (auto ec = send(resize_event{ cols, rows }); ec)
		return ec;

	if (auto ec = send(render_event{}); ec)
		return ec;

	if (m_settings.render_interval > std::chrono::milliseconds(0))
	{
		m_ticker = std::make_shared<render_ticker>(m_executor, *m_events, m_settings.render_interval);
		m_ticker->start();
	}

	return {};
}

system_ns::error_code channel_bridge::resize(uint16_t cols, uint16_t rows)
{
	if (not m_pty_created)
		return error::make_error_code(error::pty_not_created);

	if (not valid_size(cols, rows))
		return error::make_error_code(error::invalid_dimensions);

	auto ec = send(resize_event{ cols, rows });
	if (not ec)
	{
		m_cols = cols;
		m_rows = rows;
	}

	return ec;
}

system_ns::error_code channel_bridge::send(app_event event)
{
	if (not m_events)
		return error::make_error_code(error::channel_closed);

	auto ec = m_events->send(std::move(event));
	if (ec)
		spdlog::warn("channel {}: cannot queue event: {}", m_id, ec.message());

	return ec;
}

} // namespace tuihost
