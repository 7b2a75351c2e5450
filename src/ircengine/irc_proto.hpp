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

#ifndef IRCENGINE_IRC_PROTO_HPP
#define IRCENGINE_IRC_PROTO_HPP

#include <boost/system/error_code.hpp>
#include <boost/utility/string_ref_fwd.hpp>
#include "command.hpp"
#include "connection.hpp"

namespace ircengine
{
	namespace proto
	{
		void send(::ircengine::connection& con, const ::ircengine::command& cmd, boost::system::error_code& ec);

		void join(::ircengine::connection& con, const ::boost::string_ref& channel, const ::boost::string_ref& key, boost::system::error_code& ec);
		void nick(::ircengine::connection& con, const ::boost::string_ref& nick, boost::system::error_code& ec);
		void notice(::ircengine::connection& con, const ::boost::string_ref& target, const ::boost::string_ref& text, boost::system::error_code& ec);
		void part(::ircengine::connection& con, const ::boost::string_ref& channel, const ::boost::string_ref& reason, boost::system::error_code& ec);
		void pass(::ircengine::connection& con, const ::boost::string_ref& password, boost::system::error_code& ec);
		void pong(::ircengine::connection& con, const ::boost::string_ref& token, boost::system::error_code& ec);
		void privmsg(::ircengine::connection& con, const ::boost::string_ref& target, const ::boost::string_ref& text, boost::system::error_code& ec);
		void quit(::ircengine::connection& con, const ::boost::string_ref& reason, boost::system::error_code& ec);
		void user(::ircengine::connection& con, const ::boost::string_ref& username, const ::boost::string_ref& realname, boost::system::error_code& ec);
	} // namespace proto
} // namespace ircengine

#endif // IRCENGINE_IRC_PROTO_HPP
