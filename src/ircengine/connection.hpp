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

#ifndef IRCENGINE_CONNECTION_HPP
#define IRCENGINE_CONNECTION_HPP

#include <boost/system/error_code.hpp>
#include <boost/utility/string_ref_fwd.hpp>

namespace ircengine
{
	/// Write side of a connection, raw bytes must already be CRLF terminated
	class connection
	{
	public:
		virtual ~connection(){}
	public:
		virtual void send(const boost::string_ref& raw, boost::system::error_code& ec) = 0;
	};
}

#endif // IRCENGINE_CONNECTION_HPP
