//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/log.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace tuihost
{

void setup_logging(const options &opts)
{
	spdlog::drop("tuihost");

	std::shared_ptr<spdlog::logger> logger;

	if (opts.log_to_stderr)
		logger = spdlog::stderr_color_mt("tuihost");
	else
	{
		std::string path = opts.log_file;
		if (path.empty())
			path = (fs::temp_directory_path() / "tuihost.log").string();

		logger = spdlog::basic_logger_mt("tuihost", path);
	}

	logger->set_level(spdlog::level::from_str(opts.log_level));
	logger->flush_on(spdlog::level::warn);

	spdlog::set_default_logger(logger);
}

} // namespace tuihost
