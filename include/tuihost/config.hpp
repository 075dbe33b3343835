//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file config.hpp
/// Command line and configuration file options

#include "tuihost/channel_bridge.hpp"

#include <boost/program_options/options_description.hpp>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>

namespace tuihost
{

struct options
{
	std::string log_level = "info";
	std::string log_file;
	bool log_to_stderr = false;

	std::string greeting = "hello world";
	std::chrono::milliseconds render_interval{ 0 };

	/// The byte that ends a local session, Ctrl-] by default
	uint8_t detach_key = 0x1d;

	/// \brief The channel settings these options describe
	channel_settings make_channel_settings() const;
};

/// \brief The options understood on the command line
boost::program_options::options_description options_description();

/// \brief Parse the command line and the configuration file it names
///
/// Values on the command line win over those in the file. Returns an
/// empty optional when --help or --version was handled. Invalid input
/// throws boost::program_options::error.
std::optional<options> parse_options(int argc, const char *const argv[], std::ostream &out);

} // namespace tuihost
