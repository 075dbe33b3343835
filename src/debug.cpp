//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include "tuihost/debug.hpp"

#include <algorithm>
#include <sstream>

namespace tuihost
{

void print(std::ostream &os, const blob &b)
{
	os << "dumping buffer of " << b.size() << " bytes" << std::endl;

	const char kHex[] = "0123456789abcdef";
	char s[] = "xxxxxxxx  cccc cccc cccc cccc  cccc cccc cccc cccc  |................|";
	const int kHexOffset[] = { 10, 12, 15, 17, 20, 22, 25, 27, 31, 33, 36, 38, 41, 43, 46, 48 };
	const int kAsciiOffset = 53;

	std::size_t offset = 0;

	while (offset < b.size())
	{
		std::size_t n = std::min<std::size_t>(b.size() - offset, 16);

		std::size_t o = offset;
		for (char *t = s + 7; t >= s; --t)
		{
			*t = kHex[o % 16];
			o /= 16;
		}

		for (std::size_t i = 0; i < 16; ++i)
		{
			if (i < n)
			{
				uint8_t ch = b[offset + i];

				s[kHexOffset[i] + 0] = kHex[ch >> 4];
				s[kHexOffset[i] + 1] = kHex[ch & 0x0f];
				s[kAsciiOffset + i] = (ch >= 0x20 and ch < 0x7f) ? static_cast<char>(ch) : '.';
			}
			else
			{
				s[kHexOffset[i] + 0] = ' ';
				s[kHexOffset[i] + 1] = ' ';
				s[kAsciiOffset + i] = ' ';
			}
		}

		os << s << std::endl;

		offset += n;
	}
}

std::string hex_dump(const blob &b)
{
	std::ostringstream s;
	print(s, b);
	return s.str();
}

} // namespace tuihost
