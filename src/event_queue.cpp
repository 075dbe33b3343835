//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/event_queue.hpp>

namespace tuihost
{

const char *event_name(const app_event &event)
{
	struct
	{
		const char *operator()(const render_event &) const { return "render"; }
		const char *operator()(const resize_event &) const { return "resize"; }
		const char *operator()(const input_event &) const { return "input"; }
		const char *operator()(const shutdown_event &) const { return "shutdown"; }
	} visitor;

	return std::visit(visitor, event);
}

namespace detail
{

	system_ns::error_code event_queue_state::push(app_event &&event)
	{
		std::unique_lock lock(m_mutex);

		if (not m_receiver_open)
			return error::make_error_code(error::channel_closed);

		if (m_waiting)
		{
			// the queue is empty if someone is waiting
			auto op = std::move(m_waiting);
			lock.unlock();

			op->complete({}, std::move(event));
		}
		else
			m_events.push_back(std::move(event));

		return {};
	}

	void event_queue_state::receive(std::unique_ptr<receive_event_op> op)
	{
		std::unique_lock lock(m_mutex);

		if (m_waiting)
		{
			lock.unlock();
			op->complete(asio_ns::error::already_started, {});
		}
		else if (not m_events.empty())
		{
			app_event event = std::move(m_events.front());
			m_events.pop_front();
			lock.unlock();

			op->complete({}, std::move(event));
		}
		else if (m_senders == 0)
		{
			lock.unlock();
			op->complete(error::make_error_code(error::end_of_stream), {});
		}
		else
			m_waiting = std::move(op);
	}

	void event_queue_state::add_sender()
	{
		std::lock_guard lock(m_mutex);
		++m_senders;
	}

	void event_queue_state::remove_sender()
	{
		std::unique_lock lock(m_mutex);

		if (--m_senders == 0 and m_waiting)
		{
			auto op = std::move(m_waiting);
			lock.unlock();

			op->complete(error::make_error_code(error::end_of_stream), {});
		}
	}

	void event_queue_state::close_receiver()
	{
		std::unique_lock lock(m_mutex);

		m_receiver_open = false;
		m_events.clear();

		// a waiting handler is dropped outside the lock
		auto op = std::move(m_waiting);
		lock.unlock();
	}

	std::size_t event_queue_state::pending() const
	{
		std::lock_guard lock(m_mutex);
		return m_events.size();
	}

	bool event_queue_state::receiver_open() const
	{
		std::lock_guard lock(m_mutex);
		return m_receiver_open;
	}

} // namespace detail

// --------------------------------------------------------------------

std::pair<event_sender, event_receiver> make_event_queue(asio_ns::any_io_executor executor)
{
	auto state = std::make_shared<detail::event_queue_state>(executor);
	return { event_sender(state), event_receiver(state) };
}

// --------------------------------------------------------------------

event_sender::event_sender(std::shared_ptr<detail::event_queue_state> state)
	: m_state(std::move(state))
{
	m_state->add_sender();
}

event_sender::event_sender(const event_sender &rhs)
	: m_state(rhs.m_state)
{
	if (m_state)
		m_state->add_sender();
}

event_sender::event_sender(event_sender &&rhs) noexcept
	: m_state(std::move(rhs.m_state))
{
}

event_sender &event_sender::operator=(const event_sender &rhs)
{
	if (this != &rhs)
	{
		release();

		m_state = rhs.m_state;
		if (m_state)
			m_state->add_sender();
	}

	return *this;
}

event_sender &event_sender::operator=(event_sender &&rhs) noexcept
{
	if (this != &rhs)
	{
		release();
		m_state = std::move(rhs.m_state);
	}

	return *this;
}

event_sender::~event_sender()
{
	release();
}

void event_sender::release()
{
	if (m_state)
	{
		m_state->remove_sender();
		m_state.reset();
	}
}

system_ns::error_code event_sender::send(app_event event) const
{
	if (not m_state)
		return error::make_error_code(error::channel_closed);

	return m_state->push(std::move(event));
}

bool event_sender::is_open() const
{
	return m_state and m_state->receiver_open();
}

// --------------------------------------------------------------------

event_receiver::~event_receiver()
{
	if (m_state)
		m_state->close_receiver();
}

} // namespace tuihost
