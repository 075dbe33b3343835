//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file output_sink.hpp
/// The destination of a channel's outbound byte stream

#include "tuihost/asio.hpp"

#include <string>

namespace tuihost
{

/// \brief Abstract base class for the byte sink a render task writes to
///
/// A sink has exactly one writer, the render task of its channel. Errors
/// are reported by throwing system_ns::system_error from write.
class output_sink
{
  public:
	virtual ~output_sink() {}

	/// \brief Write all of \a data, suspending until it has been accepted
	virtual asio_ns::awaitable<void> write(std::string data) = 0;
};

} // namespace tuihost
