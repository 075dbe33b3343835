//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "tuihost/config.hpp"

namespace tuihost
{

/// \brief Install the default logger described by \a opts
///
/// The terminal is owned by the hosted application, so unless
/// log_to_stderr is set the log goes to a file.
void setup_logging(const options &opts);

} // namespace tuihost
