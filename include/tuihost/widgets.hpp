//        Copyright Maarten L. Hekkelman 2013-2021
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file widgets.hpp
/// The widget tree an application draws into a frame

#include "tuihost/terminal_buffer.hpp"

#include <optional>

namespace tuihost
{

/// \brief Base class for everything that can be drawn into a terminal_buffer
class widget
{
  public:
	virtual ~widget() {}

	/// \brief Draw this widget in \a area of \a buffer
	virtual void render(rect area, terminal_buffer &buffer) const = 0;
};

// --------------------------------------------------------------------
/// \brief A box, optionally bordered and titled, that surrounds other widgets

class block : public widget
{
  public:
	block() = default;

	/// \brief A block with a border drawn on all four sides
	static block bordered();

	block &title(std::string title)
	{
		m_title = std::move(title);
		return *this;
	}

	block &border_style(struct style style)
	{
		m_border_style = style;
		return *this;
	}

	bool has_borders() const { return m_borders; }

	/// \brief The area left for the contents of this block
	rect inner(rect area) const;

	void render(rect area, terminal_buffer &buffer) const override;

  private:
	bool m_borders = false;
	std::string m_title;
	struct style m_border_style;
};

// --------------------------------------------------------------------
/// \brief Lines of text, clipped to the area they are drawn in

class paragraph : public widget
{
  public:
	/// \brief Create a paragraph, \a text is split into lines at newlines
	explicit paragraph(std::string_view text);

	paragraph &block(class block b)
	{
		m_block = std::move(b);
		return *this;
	}

	paragraph &style(struct style s)
	{
		m_style = s;
		return *this;
	}

	const std::vector<std::string> &lines() const { return m_lines; }

	void render(rect area, terminal_buffer &buffer) const override;

  private:
	std::vector<std::string> m_lines;
	std::optional<class block> m_block;
	struct style m_style;
};

// --------------------------------------------------------------------
/// \brief What an application draws into, one per rendered frame

class frame
{
  public:
	explicit frame(terminal_buffer &buffer)
		: m_buffer(buffer)
	{
	}

	/// \brief The full area of the viewport
	rect area() const { return m_buffer.area(); }

	void render_widget(const widget &w, rect area)
	{
		w.render(area, m_buffer);
	}

	terminal_buffer &buffer() { return m_buffer; }

  private:
	terminal_buffer &m_buffer;
};

} // namespace tuihost
