//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "tuihost/types.hpp"

#include <iostream>
#include <string>

namespace tuihost
{

/// \brief hex dump \a b to \a os, sixteen bytes per line
void print(std::ostream &os, const blob &b);

/// \brief the same hex dump, as a string for the log
std::string hex_dump(const blob &b);

} // namespace tuihost
