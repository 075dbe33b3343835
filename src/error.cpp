//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/error.hpp>

namespace tuihost::error
{

namespace detail
{

	class channel_category : public system_ns::error_category
	{
	  public:
		const char *name() const BOOST_SYSTEM_NOEXCEPT
		{
			return "tuihost";
		}

		std::string message(int value) const
		{
			switch (value)
			{
				case channel_already_open:
					return "only a single session channel can be created";
				case no_channel:
					return "no channel has been opened";
				case unknown_channel:
					return "unknown channel";
				case not_authenticated:
					return "not authenticated";
				case pty_not_created:
					return "no pseudo terminal was requested for this channel";
				case pty_already_created:
					return "a pseudo terminal was already created for this channel";
				case invalid_dimensions:
					return "invalid terminal dimensions";
				case channel_closed:
					return "channel closed";
				case unsupported_event:
					return "unsupported event";
				case end_of_stream:
					return "end of stream";
				case protocol_error:
					return "protocol error";
				case render_failed:
					return "render failed";
				default:
					return "unknown channel error";
			}
		}
	};

} // namespace detail

system_ns::error_category &channel_category()
{
	static detail::channel_category impl;
	return impl;
}

} // namespace tuihost::error
