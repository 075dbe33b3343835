//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file tuihost.hpp
/// Generic header, not much here

#include "tuihost/types.hpp"

#ifndef NDEBUG
#include "tuihost/debug.hpp"
#endif
