//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \brief helper function and classes for async operations

#include "tuihost/asio.hpp"

#include <tuple>

namespace tuihost::detail
{

// --------------------------------------------------------------------
/// \brief Keeps the executors of a pending handler busy and delivers its completion
///
/// Completions are always posted, never dispatched, so the code that
/// triggers a completion never runs the waiting handler inline.

template <typename Handler, typename IoExecutor,
	typename HandlerExecutor = typename asio_ns::associated_executor_t<Handler, IoExecutor>>
class handler_work
{
  public:
	handler_work(const handler_work &) = delete;
	handler_work &operator=(const handler_work &) = delete;

	handler_work(Handler &handler, const IoExecutor &io_ex) noexcept
		: m_io_executor(io_ex)
		, m_executor(asio_ns::get_associated_executor(handler, m_io_executor))
		, m_ex_guard(m_executor)
		, m_ex_io_guard(m_io_executor)
	{
	}

	template <typename Function>
	void complete(Function &&function)
	{
		asio_ns::post(m_executor, std::forward<Function>(function));
	}

  private:
	IoExecutor m_io_executor;
	HandlerExecutor m_executor;
	asio_ns::executor_work_guard<HandlerExecutor> m_ex_guard;
	asio_ns::executor_work_guard<IoExecutor> m_ex_io_guard;
};

// --------------------------------------------------------------------
/// \brief Alternative to boost's binder1 and binder2, takes any nr of arguments

template <typename Handler, typename... Args>
struct binder
{
	binder(Handler &&handler, Args &&...args)
		: m_handler(std::move(handler))
		, m_args(std::move(args)...)
	{
	}

	binder(binder &&other) = default;

	void operator()()
	{
		std::apply(m_handler, std::move(m_args));
	}

	Handler m_handler;
	std::tuple<Args...> m_args;
};

} // namespace tuihost::detail
