//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/terminal_buffer.hpp>

#include <stdexcept>

namespace tuihost
{

namespace
{

	// length of the UTF-8 sequence starting with byte \a ch, invalid
	// lead bytes are treated as a sequence of one
	std::size_t sequence_length(uint8_t ch)
	{
		if ((ch & 0x80) == 0)
			return 1;
		if ((ch & 0xE0) == 0xC0)
			return 2;
		if ((ch & 0xF0) == 0xE0)
			return 3;
		if ((ch & 0xF8) == 0xF0)
			return 4;
		return 1;
	}

} // namespace

terminal_buffer::terminal_buffer(rect area)
	: m_area(area)
	, m_cells(area.area())
{
}

bool terminal_buffer::contains(uint16_t x, uint16_t y) const
{
	return x >= m_area.left() and x < m_area.right() and y >= m_area.top() and y < m_area.bottom();
}

std::size_t terminal_buffer::index_of(uint16_t x, uint16_t y) const
{
	return std::size_t(y - m_area.y) * m_area.width + (x - m_area.x);
}

cell &terminal_buffer::at(uint16_t x, uint16_t y)
{
	if (not contains(x, y))
		throw std::out_of_range("cell position outside of buffer");
	return m_cells[index_of(x, y)];
}

const cell &terminal_buffer::at(uint16_t x, uint16_t y) const
{
	if (not contains(x, y))
		throw std::out_of_range("cell position outside of buffer");
	return m_cells[index_of(x, y)];
}

void terminal_buffer::set_symbol(uint16_t x, uint16_t y, std::string_view symbol, struct style style)
{
	if (contains(x, y))
	{
		auto &c = m_cells[index_of(x, y)];
		c.symbol.assign(symbol);
		c.style = style;
	}
}

uint16_t terminal_buffer::set_string(uint16_t x, uint16_t y, std::string_view text, struct style style,
	uint16_t max_width)
{
	uint16_t written = 0;

	if (y < m_area.top() or y >= m_area.bottom())
		return written;

	std::size_t offset = 0;
	while (offset < text.length() and written < max_width and x < m_area.right())
	{
		std::size_t n = sequence_length(static_cast<uint8_t>(text[offset]));
		if (offset + n > text.length())
			n = text.length() - offset;

		set_symbol(x, y, text.substr(offset, n), style);

		offset += n;
		++x;
		++written;
	}

	return written;
}

std::string terminal_buffer::row_text(uint16_t y) const
{
	std::string result;

	for (uint16_t x = m_area.left(); x < m_area.right(); ++x)
		result += at(x, y).symbol;

	return result;
}

} // namespace tuihost
