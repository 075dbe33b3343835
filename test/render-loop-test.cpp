//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "test-support.hpp"

#include <tuihost/render_loop.hpp>

#include <optional>
#include <stdexcept>

using namespace tuihost;

namespace
{

struct render_loop_fixture
{
	explicit render_loop_fixture(std::shared_ptr<output_sink> output = std::make_shared<test::recording_sink>())
		: sink(output)
	{
		auto q = make_event_queue(io_context.get_executor());
		events.emplace(std::move(q.first));

		loop = std::make_shared<render_loop>(1, std::move(q.second), output,
			std::make_unique<greeting_application>(), std::make_unique<ansi_backend>());

		asio_ns::co_spawn(io_context, render_loop::run(loop), asio_ns::detached);
	}

	const std::vector<std::string> &writes() const
	{
		return std::static_pointer_cast<test::recording_sink>(sink)->m_writes;
	}

	asio_ns::io_context io_context;
	std::shared_ptr<output_sink> sink;
	std::optional<event_sender> events;
	std::shared_ptr<render_loop> loop;
};

} // namespace

TEST_CASE_METHOD(render_loop_fixture, "a resize replaces the viewport", "[render-loop]")
{
	CHECK_FALSE(events->send(resize_event{ 80, 24 }));
	CHECK_FALSE(events->send(resize_event{ 40, 10 }));

	test::drain(io_context);

	CHECK(loop->viewport() == rect{ 0, 0, 40, 10 });
	CHECK(loop->last_frame() == rect{ 0, 0, 40, 10 });
	CHECK(loop->frames_rendered() == 2);
	CHECK(writes().size() == 2);
	CHECK_FALSE(loop->finished());
}

TEST_CASE_METHOD(render_loop_fixture, "a resize renders immediately", "[render-loop]")
{
	CHECK_FALSE(events->send(resize_event{ 13, 3 }));
	test::drain(io_context);

	REQUIRE(writes().size() == 1);
	CHECK(writes()[0].find("hello world") != std::string::npos);

	CHECK_FALSE(events->send(render_event{}));
	test::drain(io_context);

	REQUIRE(writes().size() == 2);
	CHECK(writes()[0] == writes()[1]);
}

TEST_CASE_METHOD(render_loop_fixture, "nothing is rendered into an empty viewport", "[render-loop]")
{
	CHECK_FALSE(events->send(render_event{}));
	CHECK_FALSE(events->send(resize_event{ 0, 10 }));
	CHECK_FALSE(events->send(render_event{}));

	test::drain(io_context);

	CHECK(writes().empty());
	CHECK(loop->frames_rendered() == 0);
}

TEST_CASE_METHOD(render_loop_fixture, "input is passed to the application", "[render-loop]")
{
	CHECK_FALSE(events->send(resize_event{ 30, 4 }));
	CHECK_FALSE(events->send(input_event{}));
	test::drain(io_context);

	CHECK(writes().size() == 1);

	CHECK_FALSE(events->send(input_event{ { 'a', 'b' } }));
	test::drain(io_context);

	REQUIRE(writes().size() == 2);
	CHECK(writes()[1].find("received 2 bytes") != std::string::npos);
}

TEST_CASE_METHOD(render_loop_fixture, "the loop ends when the senders are gone", "[render-loop]")
{
	CHECK_FALSE(events->send(resize_event{ 20, 5 }));
	CHECK_FALSE(events->send(render_event{}));
	events.reset();

	test::drain(io_context);

	CHECK(loop->finished());
	CHECK(loop->result() == error::end_of_stream);
	CHECK(loop->frames_rendered() == 2);
	CHECK(writes().size() == 2);

	// the loop released its sink
	CHECK(sink.use_count() == 1);

	test::drain(io_context);
	CHECK(writes().size() == 2);
}

TEST_CASE_METHOD(render_loop_fixture, "an unsupported event stops only this loop", "[render-loop]")
{
	CHECK_FALSE(events->send(resize_event{ 20, 5 }));
	CHECK_FALSE(events->send(shutdown_event{}));
	test::drain(io_context);

	CHECK(loop->finished());
	CHECK(loop->result() == error::unsupported_event);
	CHECK(writes().size() == 1);

	CHECK(events->send(render_event{}) == error::channel_closed);
	CHECK_FALSE(events->is_open());
}

TEST_CASE("a failing sink stops the loop", "[render-loop]")
{
	render_loop_fixture fixture(std::make_shared<test::failing_sink>());

	CHECK_FALSE(fixture.events->send(resize_event{ 20, 5 }));
	test::drain(fixture.io_context);

	CHECK(fixture.loop->finished());
	CHECK(fixture.loop->result() == asio_ns::error::broken_pipe);
	CHECK(fixture.loop->frames_rendered() == 0);
}

namespace
{

class throwing_application : public application
{
  public:
	void draw(frame &f) override
	{
		throw std::runtime_error("draw failed");
	}
};

class closed_sink : public output_sink
{
  public:
	asio_ns::awaitable<void> write(std::string data) override
	{
		throw system_ns::system_error(error::make_error_code(error::channel_closed));
		co_return;
	}
};

} // namespace

TEST_CASE("a throwing application stops the loop and releases it", "[render-loop]")
{
	asio_ns::io_context io_context;
	auto sink = std::make_shared<test::recording_sink>();
	auto [sender, receiver] = make_event_queue(io_context.get_executor());

	auto loop = std::make_shared<render_loop>(1, std::move(receiver), sink,
		std::make_unique<throwing_application>(), std::make_unique<ansi_backend>());
	asio_ns::co_spawn(io_context, render_loop::run(loop), asio_ns::detached);

	CHECK_FALSE(sender.send(resize_event{ 20, 5 }));
	test::drain(io_context);

	CHECK(loop->finished());
	CHECK(loop->result() == error::render_failed);
	CHECK(sink->m_writes.empty());
	CHECK(sink.use_count() == 1);

	CHECK(sender.send(render_event{}) == error::channel_closed);
}

TEST_CASE("a closed channel ends the loop", "[render-loop]")
{
	render_loop_fixture fixture(std::make_shared<closed_sink>());

	CHECK_FALSE(fixture.events->send(resize_event{ 20, 5 }));
	CHECK_FALSE(fixture.events->send(render_event{}));
	test::drain(fixture.io_context);

	CHECK(fixture.loop->finished());
	CHECK(fixture.loop->result() == error::channel_closed);
	CHECK(fixture.sink.use_count() == 1);
}
