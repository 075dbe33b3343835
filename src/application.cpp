//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#include <tuihost/tuihost.hpp>

#include <tuihost/application.hpp>

namespace tuihost
{

void greeting_application::draw(frame &f)
{
	std::string text = m_greeting;
	if (m_received > 0)
		text += "\nreceived " + std::to_string(m_received) + " bytes";

	paragraph p(text);
	p.block(block::bordered());

	f.render_widget(p, f.area());
}

bool greeting_application::handle_input(const blob &data)
{
	m_received += data.size();
	return not data.empty();
}

} // namespace tuihost
