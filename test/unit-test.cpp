//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#define CATCH_CONFIG_RUNNER

#include "test-support.hpp"

#include <tuihost/log.hpp>

int main(int argc, char *argv[])
{
	Catch::Session session;

	int result = session.applyCommandLine(argc, argv);
	if (result != 0)
		return result;

	tuihost::options opts;
	opts.log_level = "warn";
	opts.log_to_stderr = true;
	tuihost::setup_logging(opts);

	return session.run();
}
