//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file event_queue.hpp
/// An unbounded multi-producer, single-consumer queue of app_event messages
///
/// The producer end is the copyable event_sender, the consumer end is the
/// event_receiver. Receiving is an asynchronous operation that completes
/// with error::end_of_stream once every sender is gone and all messages
/// have been delivered.

#include "tuihost/app_event.hpp"
#include "tuihost/error.hpp"
#include "tuihost/operations.hpp"

#include <deque>
#include <memory>
#include <mutex>

namespace tuihost
{

class event_sender;
class event_receiver;

namespace detail
{

	// internal classes to implement the asynchronous receive

	class receive_event_op
	{
	  public:
		virtual ~receive_event_op() {}

		virtual void complete(const system_ns::error_code &ec, app_event &&event) = 0;
	};

	template <typename Handler, typename IoExecutor>
	class receive_event_handler : public receive_event_op
	{
	  public:
		receive_event_handler(Handler &&h, const IoExecutor &io_ex)
			: m_handler(std::move(h))
			, m_work(m_handler, io_ex)
		{
		}

		void complete(const system_ns::error_code &ec, app_event &&event) override
		{
			m_work.complete(binder<Handler, system_ns::error_code, app_event>(
				std::move(m_handler), system_ns::error_code(ec), std::move(event)));
		}

	  private:
		Handler m_handler;
		handler_work<Handler, IoExecutor> m_work;
	};

	/// \brief The state shared by the senders and the receiver of one queue
	class event_queue_state
	{
	  public:
		event_queue_state(asio_ns::any_io_executor executor)
			: m_executor(executor)
		{
		}

		event_queue_state(const event_queue_state &) = delete;
		event_queue_state &operator=(const event_queue_state &) = delete;

		asio_ns::any_io_executor get_executor() const { return m_executor; }

		system_ns::error_code push(app_event &&event);
		void receive(std::unique_ptr<receive_event_op> op);

		void add_sender();
		void remove_sender();
		void close_receiver();

		std::size_t pending() const;
		bool receiver_open() const;

	  private:
		asio_ns::any_io_executor m_executor;

		mutable std::mutex m_mutex;
		std::deque<app_event> m_events;
		std::unique_ptr<receive_event_op> m_waiting;
		std::size_t m_senders = 0;
		bool m_receiver_open = true;
	};

} // namespace detail

/// \brief Create a new queue whose receive operations complete on \a executor
std::pair<event_sender, event_receiver> make_event_queue(asio_ns::any_io_executor executor);

// --------------------------------------------------------------------
/// \brief The producer end of an event queue
///
/// Copies share the same queue. The queue counts its live senders, when the
/// last one is destroyed the receiver sees end of stream.

class event_sender
{
  public:
	event_sender(const event_sender &rhs);
	event_sender(event_sender &&rhs) noexcept;
	event_sender &operator=(const event_sender &rhs);
	event_sender &operator=(event_sender &&rhs) noexcept;
	~event_sender();

	/// \brief Append \a event to the queue, never blocks
	///
	/// Fails with error::channel_closed when the receiver is gone.
	system_ns::error_code send(app_event event) const;

	/// \brief Return true if the receiver still exists
	bool is_open() const;

  private:
	friend std::pair<event_sender, event_receiver> make_event_queue(asio_ns::any_io_executor);

	explicit event_sender(std::shared_ptr<detail::event_queue_state> state);

	void release();

	std::shared_ptr<detail::event_queue_state> m_state;
};

// --------------------------------------------------------------------
/// \brief The consumer end of an event queue

class event_receiver
{
  public:
	using executor_type = asio_ns::any_io_executor;

	event_receiver(event_receiver &&rhs) noexcept = default;
	event_receiver &operator=(event_receiver &&rhs) = delete;
	event_receiver(const event_receiver &) = delete;
	event_receiver &operator=(const event_receiver &) = delete;

	~event_receiver();

	executor_type get_executor() const { return m_state->get_executor(); }

	/// \brief Number of messages waiting to be received
	std::size_t pending() const { return m_state->pending(); }

	/// \brief Asynchronously receive the next message
	///
	/// \param handler	The completion handler, should be of form
	///               	void (boost::system::error_code, app_event)
	template <typename Handler>
	auto async_receive(Handler &&handler)
	{
		return asio_ns::async_initiate<Handler, void(system_ns::error_code, app_event)>(
			async_receive_impl{}, handler, this);
	}

  private:
	friend std::pair<event_sender, event_receiver> make_event_queue(asio_ns::any_io_executor);

	explicit event_receiver(std::shared_ptr<detail::event_queue_state> state)
		: m_state(std::move(state))
	{
	}

	struct async_receive_impl
	{
		template <typename Handler>
		void operator()(Handler &&handler, event_receiver *receiver)
		{
			using handler_type = std::decay_t<Handler>;

			receiver->m_state->receive(
				std::make_unique<detail::receive_event_handler<handler_type, executor_type>>(
					std::move(handler), receiver->get_executor()));
		}
	};

	std::shared_ptr<detail::event_queue_state> m_state;
};

} // namespace tuihost
