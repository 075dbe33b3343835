//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file application.hpp
/// The interactive application hosted on a channel

#include "tuihost/widgets.hpp"

#include <functional>
#include <memory>

namespace tuihost
{

/// \brief Abstract base class for hosted applications
class application
{
  public:
	virtual ~application() {}

	/// \brief Draw the current state into \a f
	virtual void draw(frame &f) = 0;

	/// \brief Handle raw bytes typed at the remote terminal
	///
	/// The bytes are passed as received, no keystroke decoding is done.
	/// Return true if the application needs to be redrawn.
	virtual bool handle_input(const blob &data) { return false; }
};

/// \brief Creates the application for a new channel
using application_factory = std::function<std::unique_ptr<application>()>;

// --------------------------------------------------------------------
/// \brief Shows a greeting in a bordered block, and the amount of input received

class greeting_application : public application
{
  public:
	explicit greeting_application(std::string greeting = "hello world")
		: m_greeting(std::move(greeting))
	{
	}

	void draw(frame &f) override;
	bool handle_input(const blob &data) override;

	uint64_t received() const { return m_received; }

  private:
	std::string m_greeting;
	uint64_t m_received = 0;
};

} // namespace tuihost
