//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file types.hpp
/// Common types in this library

#include <cstdint>
#include <vector>

namespace tuihost
{

/// \brief Class containing a number of unsigned bytes
using blob = std::vector<uint8_t>;

/// \brief A rectangular area on a terminal, in character cells
struct rect
{
	uint16_t x = 0;
	uint16_t y = 0;
	uint16_t width = 0;
	uint16_t height = 0;

	/// \brief Return true if the area contains no cells
	bool empty() const { return width == 0 or height == 0; }

	/// \brief Number of cells covered
	std::size_t area() const { return std::size_t(width) * height; }

	uint16_t left() const { return x; }
	uint16_t top() const { return y; }
	uint16_t right() const { return x + width; }
	uint16_t bottom() const { return y + height; }

	/// \brief The area inside a border of \a margin cells on every side
	rect inner(uint16_t margin) const
	{
		if (width < 2 * margin or height < 2 * margin)
			return { x, y, 0, 0 };
		return { uint16_t(x + margin), uint16_t(y + margin), uint16_t(width - 2 * margin), uint16_t(height - 2 * margin) };
	}

	bool operator==(const rect &rhs) const = default;
};

} // namespace tuihost
