//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/widgets.hpp>

#include <boost/algorithm/string.hpp>

namespace ba = boost::algorithm;

namespace tuihost
{

namespace
{
	const char
		kHorizontal[] = "\xe2\x94\x80",  // ─
		kVertical[] = "\xe2\x94\x82",    // │
		kTopLeft[] = "\xe2\x94\x8c",     // ┌
		kTopRight[] = "\xe2\x94\x90",    // ┐
		kBottomLeft[] = "\xe2\x94\x94",  // └
		kBottomRight[] = "\xe2\x94\x98"; // ┘
} // namespace

block block::bordered()
{
	block result;
	result.m_borders = true;
	return result;
}

rect block::inner(rect area) const
{
	return m_borders ? area.inner(1) : area;
}

void block::render(rect area, terminal_buffer &buffer) const
{
	if (area.empty() or not m_borders)
		return;

	uint16_t right = area.right() - 1;
	uint16_t bottom = area.bottom() - 1;

	for (uint16_t x = area.left(); x <= right; ++x)
	{
		buffer.set_symbol(x, area.top(), kHorizontal, m_border_style);
		buffer.set_symbol(x, bottom, kHorizontal, m_border_style);
	}

	for (uint16_t y = area.top(); y <= bottom; ++y)
	{
		buffer.set_symbol(area.left(), y, kVertical, m_border_style);
		buffer.set_symbol(right, y, kVertical, m_border_style);
	}

	if (area.width >= 2 and area.height >= 2)
	{
		buffer.set_symbol(area.left(), area.top(), kTopLeft, m_border_style);
		buffer.set_symbol(right, area.top(), kTopRight, m_border_style);
		buffer.set_symbol(area.left(), bottom, kBottomLeft, m_border_style);
		buffer.set_symbol(right, bottom, kBottomRight, m_border_style);
	}

	if (not m_title.empty() and area.width > 2)
		buffer.set_string(area.left() + 1, area.top(), m_title, m_border_style, area.width - 2);
}

// --------------------------------------------------------------------

paragraph::paragraph(std::string_view text)
{
	std::string s(text);
	ba::split(m_lines, s, ba::is_any_of("\n"));
}

void paragraph::render(rect area, terminal_buffer &buffer) const
{
	if (m_block)
	{
		m_block->render(area, buffer);
		area = m_block->inner(area);
	}

	for (std::size_t i = 0; i < m_lines.size() and i < area.height; ++i)
		buffer.set_string(area.x, area.y + i, m_lines[i], m_style, area.width);
}

} // namespace tuihost
