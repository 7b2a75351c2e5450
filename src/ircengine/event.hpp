/* ircengine
* Copyright (C) 2015 Leetsoftwerx.
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA
*/

#ifndef IRCENGINE_EVENT_HPP
#define IRCENGINE_EVENT_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <boost/signals2/signal.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant.hpp>
#include "context.hpp"
#include "message.hpp"

namespace ircengine
{
	namespace events
	{
		/// Every successfully parsed line, before anything derived from it
		struct raw_message { message msg; };

		/// The status in the accompanying context changed
		struct status_change {};

		struct welcome_msg { std::string text; };
		struct error_msg { std::string text; };
		struct notice { std::string text; };

		/// The MOTD in the accompanying context is complete
		struct motd {};

		/// A command that has no semantic handling
		struct unhandled_message { message msg; };

		/// A line that could not be parsed or applied, processing continues
		struct protocol_error
		{
			boost::system::error_code code;
			std::string line;
		};

		/// Followed by the final status_change to disconnected
		struct transport_error { boost::system::error_code code; };
	} // namespace events

	typedef boost::variant<
		events::raw_message,
		events::status_change,
		events::welcome_msg,
		events::error_msg,
		events::notice,
		events::motd,
		events::unhandled_message,
		events::protocol_error,
		events::transport_error
	> event;

	typedef boost::signals2::signal<void(const context&, const event&)> event_signal;
} // namespace ircengine

#endif // IRCENGINE_EVENT_HPP
