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

#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>
#include <boost/utility/string_ref.hpp>
#include "irc_proto.hpp"
#include "message.hpp"

namespace
{
	ircengine::generic_command generic(const char* name, std::vector<std::string> params,
		boost::optional<std::string> trailing = boost::none)
	{
		return ircengine::generic_command{ std::string(name), std::move(params), std::move(trailing) };
	}
}

namespace ircengine
{
	namespace proto
	{
		void send(::ircengine::connection& con, const ::ircengine::command& cmd, boost::system::error_code& ec)
		{
			auto line = serialize(cmd, ec);
			if (ec)
				return;
			con.send(line, ec);
		}

		void join(::ircengine::connection& con, const ::boost::string_ref& channel, const ::boost::string_ref& key, boost::system::error_code& ec)
		{
			std::vector<std::string> params{ channel.to_string() };
			if (!key.empty())
				params.push_back(key.to_string());
			send(con, generic("JOIN", std::move(params)), ec);
		}

		void nick(::ircengine::connection& con, const ::boost::string_ref& nick, boost::system::error_code& ec)
		{
			send(con, commands::nick{ nick.to_string() }, ec);
		}

		void notice(::ircengine::connection& con, const ::boost::string_ref& target, const ::boost::string_ref& text, boost::system::error_code& ec)
		{
			send(con, commands::notice{ target.to_string(), text.to_string() }, ec);
		}

		void part(::ircengine::connection& con, const ::boost::string_ref& channel, const ::boost::string_ref& reason, boost::system::error_code& ec)
		{
			boost::optional<std::string> trailing;
			if (!reason.empty())
				trailing = reason.to_string();
			send(con, generic("PART", { channel.to_string() }, trailing), ec);
		}

		void pass(::ircengine::connection& con, const ::boost::string_ref& password, boost::system::error_code& ec)
		{
			send(con, commands::pass{ password.to_string() }, ec);
		}

		void pong(::ircengine::connection& con, const ::boost::string_ref& token, boost::system::error_code& ec)
		{
			send(con, commands::pong{ token.to_string(), boost::none }, ec);
		}

		void privmsg(::ircengine::connection& con, const ::boost::string_ref& target, const ::boost::string_ref& text, boost::system::error_code& ec)
		{
			send(con, generic("PRIVMSG", { target.to_string() }, text.to_string()), ec);
		}

		void quit(::ircengine::connection& con, const ::boost::string_ref& reason, boost::system::error_code& ec)
		{
			boost::optional<std::string> trailing;
			if (!reason.empty())
				trailing = reason.to_string();
			send(con, generic("QUIT", {}, trailing), ec);
		}

		void user(::ircengine::connection& con, const ::boost::string_ref& username, const ::boost::string_ref& realname, boost::system::error_code& ec)
		{
			send(con, make_user(username.to_string(), realname.to_string()), ec);
		}
	} // namespace proto
} // namespace ircengine
