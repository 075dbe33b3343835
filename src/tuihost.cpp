//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/local_terminal.hpp>
#include <tuihost/log.hpp>

#include <boost/program_options/errors.hpp>

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char *const argv[])
{
	try
	{
		auto opts = tuihost::parse_options(argc, argv, std::cout);
		if (not opts)
			return 0;

		tuihost::setup_logging(*opts);

		asio_ns::io_context io_context;

		tuihost::local_terminal terminal(io_context.get_executor(), *opts);
		terminal.start();

		io_context.run();

		spdlog::info("session ended");
	}
	catch (const boost::program_options::error &ex)
	{
		std::cerr << ex.what() << std::endl
				  << std::endl
				  << tuihost::options_description() << std::endl;
		return 1;
	}
	catch (const std::exception &ex)
	{
		spdlog::error("{}", ex.what());
		std::cerr << ex.what() << std::endl;
		return 1;
	}

	return 0;
}
