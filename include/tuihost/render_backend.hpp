//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file render_backend.hpp
/// Conversion of a terminal_buffer into the bytes a remote terminal understands

#include "tuihost/terminal_buffer.hpp"

namespace tuihost
{

/// \brief Abstract base class for rendering backends
///
/// A backend serializes a complete buffer, there is no diffing against
/// previous frames. The output depends on nothing but the buffer.
class render_backend
{
  public:
	virtual ~render_backend() {}

	/// \brief Return the terminal control bytes that draw \a buffer
	virtual std::string draw(const terminal_buffer &buffer) = 0;
};

// --------------------------------------------------------------------
/// \brief A backend emitting ANSI (ECMA-48) control sequences
///
/// The cursor is hidden, each row is drawn after an absolute cursor
/// movement and SGR sequences are only emitted where the style changes.

class ansi_backend : public render_backend
{
  public:
	std::string draw(const terminal_buffer &buffer) override;

	/// \brief The SGR sequence selecting \a s
	static std::string sgr(const struct style &s);
};

} // namespace tuihost
