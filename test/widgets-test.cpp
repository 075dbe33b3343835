//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "test-support.hpp"

#include <tuihost/application.hpp>

using namespace tuihost;

TEST_CASE("rect geometry", "[widgets]")
{
	rect r{ 2, 3, 10, 4 };

	CHECK(r.right() == 12);
	CHECK(r.bottom() == 7);
	CHECK(r.area() == 40);
	CHECK(r.inner(1) == rect{ 3, 4, 8, 2 });
	CHECK(r.inner(2).empty());
	CHECK(rect{ 0, 0, 0, 5 }.empty());
}

TEST_CASE("cell access outside the buffer throws", "[widgets]")
{
	terminal_buffer buffer({ 0, 0, 3, 2 });

	CHECK(buffer.at(2, 1).symbol == " ");
	CHECK_THROWS_AS(buffer.at(3, 0), std::out_of_range);
	CHECK_THROWS_AS(buffer.at(0, 2), std::out_of_range);
}

TEST_CASE("strings are clipped and stored one code point per cell", "[widgets]")
{
	terminal_buffer buffer({ 0, 0, 5, 1 });

	CHECK(buffer.set_string(1, 0, "h\xc3\xa9llo world", {}) == 4);
	CHECK(buffer.at(2, 0).symbol == "\xc3\xa9");
	CHECK(buffer.row_text(0) == " h\xc3\xa9ll");

	CHECK(buffer.set_string(0, 0, "xyz", {}, 2) == 2);
	CHECK(buffer.row_text(0) == "xy\xc3\xa9ll");

	CHECK(buffer.set_string(0, 1, "out of range", {}) == 0);
}

TEST_CASE("a bordered block draws a frame with its title", "[widgets]")
{
	terminal_buffer buffer({ 0, 0, 6, 3 });

	auto b = block::bordered();
	b.title("ab");
	b.render(buffer.area(), buffer);

	CHECK(buffer.row_text(0) == "\xe2\x94\x8c" "ab" "\xe2\x94\x80\xe2\x94\x80\xe2\x94\x90");
	CHECK(buffer.row_text(1) == "\xe2\x94\x82    \xe2\x94\x82");
	CHECK(buffer.row_text(2) == "\xe2\x94\x94\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x80\xe2\x94\x98");

	CHECK(b.inner(buffer.area()) == rect{ 1, 1, 4, 1 });
	CHECK(block().inner(buffer.area()) == buffer.area());
}

TEST_CASE("a paragraph is split at newlines and clipped to its area", "[widgets]")
{
	paragraph p("first line\nsecond\nthird");
	REQUIRE(p.lines().size() == 3);

	terminal_buffer buffer({ 0, 0, 5, 2 });
	p.render(buffer.area(), buffer);

	CHECK(buffer.row_text(0) == "first");
	CHECK(buffer.row_text(1) == "secon");
}

TEST_CASE("the greeting application reports received input", "[widgets]")
{
	greeting_application app("hi");

	CHECK_FALSE(app.handle_input({}));
	CHECK(app.handle_input({ 'a', 'b', 'c' }));
	CHECK(app.received() == 3);

	terminal_buffer buffer({ 0, 0, 20, 4 });
	frame f(buffer);
	app.draw(f);

	CHECK(buffer.row_text(1) == "\xe2\x94\x82hi                \xe2\x94\x82");
	CHECK(buffer.row_text(2) == "\xe2\x94\x82received 3 bytes  \xe2\x94\x82");
}

TEST_CASE("drawing into a tiny area does not fail", "[widgets]")
{
	greeting_application app;

	for (uint16_t w = 1; w < 4; ++w)
	{
		for (uint16_t h = 1; h < 4; ++h)
		{
			terminal_buffer buffer({ 0, 0, w, h });
			frame f(buffer);
			CHECK_NOTHROW(app.draw(f));
		}
	}
}
