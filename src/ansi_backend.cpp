//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/render_backend.hpp>

namespace tuihost
{

const char
	kHideCursor[] = "\x1b[?25l",
	kResetStyle[] = "\x1b[0m";

std::string ansi_backend::sgr(const struct style &s)
{
	std::string result = "\x1b[0";

	if (s.bold)
		result += ";1";

	if (s.fg != color::reset)
		result += ";" + std::to_string(30 + static_cast<int>(s.fg) - static_cast<int>(color::black));

	result += 'm';
	return result;
}

std::string ansi_backend::draw(const terminal_buffer &buffer)
{
	const rect &area = buffer.area();

	std::string result = kHideCursor;
	result.reserve(area.area() + 16 * area.height);

	const struct style plain;

	for (uint16_t y = area.top(); y < area.bottom(); ++y)
	{
		result += "\x1b[" + std::to_string(y + 1) + ';' + std::to_string(area.left() + 1) + 'H';

		struct style current = plain;

		for (uint16_t x = area.left(); x < area.right(); ++x)
		{
			auto &c = buffer.at(x, y);

			if (c.style != current)
			{
				result += sgr(c.style);
				current = c.style;
			}

			result += c.symbol;
		}

		if (current != plain)
			result += kResetStyle;
	}

	return result;
}

} // namespace tuihost
