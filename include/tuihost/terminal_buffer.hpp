//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file terminal_buffer.hpp
/// A grid of character cells, the unit a rendering backend serializes

#include "tuihost/types.hpp"

#include <string>
#include <string_view>

namespace tuihost
{

/// \brief The eight basic ANSI colors, plus the terminal's default
enum class color : uint8_t
{
	reset,
	black,
	red,
	green,
	yellow,
	blue,
	magenta,
	cyan,
	white
};

/// \brief The way a cell is drawn
struct style
{
	color fg = color::reset;
	bool bold = false;

	bool operator==(const style &rhs) const = default;
};

/// \brief One character cell, \a symbol holds a single UTF-8 encoded code point
struct cell
{
	std::string symbol = " ";
	struct style style;
};

// --------------------------------------------------------------------

class terminal_buffer
{
  public:
	/// \brief Create a buffer covering \a area, filled with blanks
	explicit terminal_buffer(rect area);

	const rect &area() const { return m_area; }

	/// \brief The cell at absolute position \a x, \a y
	cell &at(uint16_t x, uint16_t y);
	const cell &at(uint16_t x, uint16_t y) const;

	/// \brief Write \a text starting at \a x, \a y, one code point per cell
	///
	/// Writing stops at the right edge of the buffer or after \a max_width
	/// cells, whichever comes first. Returns the number of cells written.
	uint16_t set_string(uint16_t x, uint16_t y, std::string_view text, struct style style,
		uint16_t max_width = UINT16_MAX);

	/// \brief Set the symbol and style of a single cell, ignored outside the buffer
	void set_symbol(uint16_t x, uint16_t y, std::string_view symbol, struct style style);

	/// \brief The symbols of row \a y concatenated, without styling
	std::string row_text(uint16_t y) const;

  private:
	bool contains(uint16_t x, uint16_t y) const;
	std::size_t index_of(uint16_t x, uint16_t y) const;

	rect m_area;
	std::vector<cell> m_cells;
};

} // namespace tuihost
