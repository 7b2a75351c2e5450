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

#ifndef IRCENGINE_DETAIL_INBOUND_HPP
#define IRCENGINE_DETAIL_INBOUND_HPP

#ifdef _MSC_VER
#pragma once
#endif
#include <string>
#include <boost/system/error_code.hpp>
#include "connection_detail.hpp"

namespace ircengine
{
	namespace detail
	{
		namespace inbound
		{
			/// Parse one line, apply it to the connection state, answer PING
			/// and dispatch the resulting events. Protocol errors are
			/// dispatched and swallowed; the returned error is a failed write
			/// and ends the connection.
			boost::system::error_code handle_inbound_message(connection_detail& con, const std::string& line);
		} // inbound
	}// detail

}// ircengine

#endif
