//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <catch2/catch.hpp>

#include <tuihost/event_queue.hpp>
#include <tuihost/output_sink.hpp>

#include <string>
#include <vector>

namespace test
{

/// \brief Run every handler that is ready, without blocking on pending work
inline void drain(asio_ns::io_context &io_context)
{
	for (;;)
	{
		io_context.restart();
		if (io_context.poll() == 0)
			break;
	}
}

/// \brief An output sink that keeps everything written to it
class recording_sink : public tuihost::output_sink
{
  public:
	asio_ns::awaitable<void> write(std::string data) override
	{
		m_writes.push_back(std::move(data));
		co_return;
	}

	std::vector<std::string> m_writes;
};

/// \brief An output sink whose writes always fail
class failing_sink : public tuihost::output_sink
{
  public:
	asio_ns::awaitable<void> write(std::string data) override
	{
		throw system_ns::system_error(asio_ns::error::broken_pipe);
		co_return;
	}
};

/// \brief Receive from \a events until it fails, the error ends up in \a result
inline asio_ns::awaitable<void> collect(tuihost::event_receiver &events,
	std::vector<tuihost::app_event> &received, system_ns::error_code &result)
{
	for (;;)
	{
		system_ns::error_code ec;
		auto event = co_await events.async_receive(asio_ns::redirect_error(asio_ns::use_awaitable, ec));
		if (ec)
		{
			result = ec;
			break;
		}

		received.push_back(std::move(event));
	}
}

} // namespace test
