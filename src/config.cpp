//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/config.hpp>

#include <boost/program_options.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;

namespace tuihost
{

namespace
{
	const char kVersion[] = "tuihost 1.0.0";
	const char *const kLogLevels[] = { "trace", "debug", "info", "warn", "error", "critical", "off" };
} // namespace

channel_settings options::make_channel_settings() const
{
	channel_settings result;

	result.make_application = [greeting = greeting]()
	{
		return std::make_unique<greeting_application>(greeting);
	};
	result.render_interval = render_interval;

	return result;
}

po::options_description options_description()
{
	po::options_description desc("tuihost options");

	// clang-format off
	desc.add_options()
		("help,h", "Display this help message")
		("version", "Print version")
		("config,c", po::value<std::string>(), "Read options from this file")
		("log-level", po::value<std::string>()->default_value("info"), "Log level: trace, debug, info, warn, error, critical or off")
		("log-file", po::value<std::string>(), "Write the log to this file, default is tuihost.log in the temp directory")
		("log-to-stderr", po::bool_switch(), "Write the log to stderr instead of a file")
		("greeting", po::value<std::string>()->default_value("hello world"), "The text shown by the application")
		("render-interval", po::value<uint32_t>()->default_value(0), "Render every so many milliseconds, 0 renders on demand only")
		("detach-key", po::value<uint32_t>()->default_value(0x1d), "Byte value that ends the local session, 29 is Ctrl-]");
	// clang-format on

	return desc;
}

std::optional<options> parse_options(int argc, const char *const argv[], std::ostream &out)
{
	auto desc = options_description();

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);

	if (vm.count("help"))
	{
		out << desc << std::endl;
		return {};
	}

	if (vm.count("version"))
	{
		out << kVersion << std::endl;
		return {};
	}

	if (vm.count("config"))
	{
		auto file = vm["config"].as<std::string>();

		std::ifstream in(file);
		if (not in.is_open())
			throw po::error("cannot open configuration file " + file);

		// store keeps the values already set from the command line
		po::store(po::parse_config_file(in, desc), vm);
	}

	po::notify(vm);

	options result;

	result.log_level = vm["log-level"].as<std::string>();
	if (std::find(std::begin(kLogLevels), std::end(kLogLevels), result.log_level) == std::end(kLogLevels))
		throw po::invalid_option_value(result.log_level);

	if (vm.count("log-file"))
		result.log_file = vm["log-file"].as<std::string>();
	result.log_to_stderr = vm["log-to-stderr"].as<bool>();

	result.greeting = vm["greeting"].as<std::string>();
	result.render_interval = std::chrono::milliseconds(vm["render-interval"].as<uint32_t>());

	auto detach_key = vm["detach-key"].as<uint32_t>();
	if (detach_key > 0xff)
		throw po::invalid_option_value(std::to_string(detach_key));
	result.detach_key = static_cast<uint8_t>(detach_key);

	return result;
}

} // namespace tuihost
