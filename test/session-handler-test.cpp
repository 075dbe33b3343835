//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "test-support.hpp"

#include <tuihost/session_handler.hpp>

using namespace tuihost;

TEST_CASE("the reply adapter maps errors to failures", "[session-handler]")
{
	CHECK(to_channel_reply({}) == channel_reply::success);
	CHECK(to_channel_reply(error::make_error_code(error::pty_not_created)) == channel_reply::failure);
	CHECK(to_channel_reply(asio_ns::error::broken_pipe) == channel_reply::failure);
}

TEST_CASE("all authentication methods are accepted", "[session-handler]")
{
	asio_ns::io_context io_context;

	for (auto method : { auth_method::none, auth_method::password, auth_method::public_key })
	{
		session_handler session(io_context.get_executor(), {});
		CHECK(session.state() == session_state::unauthenticated);
		CHECK(session.authenticate(method, "alice") == auth_reply::accept);
		CHECK(session.state() == session_state::authenticated);
		CHECK(session.user() == "alice");
	}
}

TEST_CASE("a channel cannot be opened before authentication", "[session-handler]")
{
	asio_ns::io_context io_context;
	session_handler session(io_context.get_executor(), {});

	CHECK_FALSE(session.open_channel(0));
	CHECK(session.bridge() == nullptr);
	CHECK(session.state() == session_state::unauthenticated);
}

TEST_CASE("the session walks through its states", "[session-handler]")
{
	asio_ns::io_context io_context;
	auto sink = std::make_shared<test::recording_sink>();

	session_handler session(io_context.get_executor(), {});
	session.authenticate(auth_method::none, "bob");

	CHECK(session.open_channel(3));
	CHECK(session.state() == session_state::channel_requested);
	REQUIRE(session.bridge() != nullptr);
	CHECK(session.bridge()->id() == 3);

	CHECK(session.request_pty(3, sink, 80, 24) == channel_reply::success);
	CHECK(session.state() == session_state::pty_ready);

	CHECK(session.request_resize(3, 100, 40) == channel_reply::success);
	CHECK(session.forward_input(3, { 'q' }) == channel_reply::success);

	test::drain(io_context);

	auto task = session.bridge()->render_task().lock();
	REQUIRE(task);
	CHECK(task->viewport() == rect{ 0, 0, 100, 40 });
	CHECK(sink->m_writes.size() == 4);
}

TEST_CASE("a second channel open is a protocol violation", "[session-handler]")
{
	asio_ns::io_context io_context;
	auto sink = std::make_shared<test::recording_sink>();

	session_handler session(io_context.get_executor(), {});
	session.authenticate(auth_method::password, "carol");

	REQUIRE(session.open_channel(1));
	REQUIRE(session.request_pty(1, sink, 80, 24) == channel_reply::success);

	auto first = session.bridge();

	try
	{
		session.open_channel(2);
		FAIL("expected an exception");
	}
	catch (const system_ns::system_error &ex)
	{
		CHECK(ex.code() == error::channel_already_open);
	}

	CHECK(session.bridge() == first);
	CHECK(session.bridge()->id() == 1);
	CHECK(session.bridge()->pty_created());
	CHECK(session.state() == session_state::pty_ready);

	// not even after the first one was closed
	CHECK(session.close_channel(1) == channel_reply::success);
	CHECK_THROWS_AS(session.open_channel(1), system_ns::system_error);
}

TEST_CASE("requests before the channel is ready fail", "[session-handler]")
{
	asio_ns::io_context io_context;
	auto sink = std::make_shared<test::recording_sink>();

	session_handler session(io_context.get_executor(), {});

	CHECK(session.forward_input(0, { 'x' }) == channel_reply::failure);
	CHECK(session.request_pty(0, sink, 80, 24) == channel_reply::failure);
	CHECK(session.request_resize(0, 80, 24) == channel_reply::failure);
	CHECK(session.close_channel(0) == channel_reply::failure);

	session.authenticate(auth_method::none, "dave");
	REQUIRE(session.open_channel(0));

	// input before the pty is rejected, not buffered
	CHECK(session.forward_input(0, { 'x' }) == channel_reply::failure);
	CHECK(session.request_resize(0, 80, 24) == channel_reply::failure);

	// wrong channel
	CHECK(session.request_pty(9, sink, 80, 24) == channel_reply::failure);
	CHECK_FALSE(session.bridge()->pty_created());

	// out of range dimensions
	CHECK(session.request_pty(0, sink, 0, 24) == channel_reply::failure);
	CHECK(session.request_pty(0, sink, 70000, 24) == channel_reply::failure);
	CHECK(session.request_pty(0, sink, 80, 65536) == channel_reply::failure);
	CHECK(session.request_pty(0, sink, 65535, 65535) == channel_reply::failure);
	CHECK(session.state() == session_state::channel_requested);
	CHECK_FALSE(session.bridge()->pty_created());

	CHECK(session.request_pty(0, sink, 65535, 2) == channel_reply::success);
	CHECK(session.request_pty(0, sink, 80, 24) == channel_reply::failure);
	CHECK(session.request_resize(0, 1, 0x10000) == channel_reply::failure);
	CHECK(session.request_resize(0, 20000, 20000) == channel_reply::failure);
	CHECK(session.bridge()->cols() == 65535);
	CHECK(session.bridge()->rows() == 2);
}

TEST_CASE("closing the channel ends its render task", "[session-handler]")
{
	asio_ns::io_context io_context;
	auto sink = std::make_shared<test::recording_sink>();

	session_handler session(io_context.get_executor(), {});
	session.authenticate(auth_method::public_key, "erin");
	REQUIRE(session.open_channel(0));
	REQUIRE(session.request_pty(0, sink, 20, 5) == channel_reply::success);

	auto task = session.bridge()->render_task();

	CHECK(session.close_channel(0) == channel_reply::success);
	CHECK(session.bridge() == nullptr);
	CHECK(session.state() == session_state::authenticated);

	test::drain(io_context);

	CHECK(task.expired());
	CHECK(session.forward_input(0, { 'x' }) == channel_reply::failure);
}
