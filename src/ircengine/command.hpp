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

#ifndef IRCENGINE_COMMAND_HPP
#define IRCENGINE_COMMAND_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <boost/variant.hpp>
#include <boost/mpl/limits/list.hpp>

// command below has more alternatives than the default mpl::list limit
#if BOOST_MPL_LIMIT_LIST_SIZE < 30
#error "ircengine needs BOOST_MPL_CFG_NO_PREPROCESSED_HEADERS and BOOST_MPL_LIMIT_LIST_SIZE=30"
#endif

namespace ircengine
{
	enum numeric_reply : std::uint16_t
	{
		RPL_WELCOME = 1,
		RPL_YOURHOST,
		RPL_CREATED,
		RPL_MYINFO,
		RPL_ISUPPORT,

		RPL_LUSERCLIENT = 251,
		RPL_LUSEROP,
		RPL_LUSERUNKNOWN,
		RPL_LUSERCHANNELS,
		RPL_LUSERME,

		RPL_LOCALUSERS = 265,
		RPL_GLOBALUSERS,

		RPL_MOTD = 372,
		RPL_MOTDSTART = 375,
		RPL_ENDOFMOTD,

		RPL_HOSTHIDDEN = 396
	};

	/// A text command ("PRIVMSG") or a numeric reply code in 0..999
	typedef boost::variant<std::string, std::uint16_t> command_code;

	/// Wire form of a command code, numerics are zero padded to three digits
	std::string to_string(const command_code& code);

	struct generic_command
	{
		command_code code;
		std::vector<std::string> params;
		boost::optional<std::string> trailing;
	};

	bool operator==(const generic_command& lhs, const generic_command& rhs);

	namespace commands
	{
		struct pass { std::string password; };
		struct nick { std::string nickname; };
		struct user
		{
			std::string username;
			std::string mode;
			std::string unused;
			std::string realname;
		};
		struct ping
		{
			std::string token;
			boost::optional<std::string> target;
		};
		struct pong
		{
			std::string token;
			boost::optional<std::string> target;
		};
		struct notice
		{
			std::string target;
			std::string text;
		};
		struct error_msg { std::string text; };

		struct welcome { std::string client; std::string text; };
		struct your_host { std::string client; std::string text; };
		struct created { std::string client; std::string text; };
		struct my_info
		{
			std::string client;
			std::string server_name;
			std::string server_version;
			std::string user_modes;
			std::string channel_modes;
			boost::optional<std::string> channel_mode_params;
		};
		struct isupport
		{
			std::string client;
			std::vector<std::string> tokens;
			std::string text;
		};

		struct luser_client { std::string client; std::string text; };
		struct luser_op { std::string client; unsigned operators; std::string text; };
		struct luser_unknown { std::string client; unsigned connections; std::string text; };
		struct luser_channels { std::string client; unsigned channels; std::string text; };
		struct luser_me { std::string client; std::string text; };

		/// (current, max)
		typedef std::pair<unsigned, unsigned> user_counts;
		struct local_users
		{
			std::string client;
			boost::optional<user_counts> counts;
			std::string text;
		};
		struct global_users
		{
			std::string client;
			boost::optional<user_counts> counts;
			std::string text;
		};

		struct motd { std::string client; std::string text; };
		struct motd_start { std::string client; std::string text; };
		struct end_of_motd { std::string client; std::string text; };
		struct host_hidden { std::string client; std::string host; std::string text; };

		bool operator==(const pass& lhs, const pass& rhs);
		bool operator==(const nick& lhs, const nick& rhs);
		bool operator==(const user& lhs, const user& rhs);
		bool operator==(const ping& lhs, const ping& rhs);
		bool operator==(const pong& lhs, const pong& rhs);
		bool operator==(const notice& lhs, const notice& rhs);
		bool operator==(const error_msg& lhs, const error_msg& rhs);
		bool operator==(const welcome& lhs, const welcome& rhs);
		bool operator==(const your_host& lhs, const your_host& rhs);
		bool operator==(const created& lhs, const created& rhs);
		bool operator==(const my_info& lhs, const my_info& rhs);
		bool operator==(const isupport& lhs, const isupport& rhs);
		bool operator==(const luser_client& lhs, const luser_client& rhs);
		bool operator==(const luser_op& lhs, const luser_op& rhs);
		bool operator==(const luser_unknown& lhs, const luser_unknown& rhs);
		bool operator==(const luser_channels& lhs, const luser_channels& rhs);
		bool operator==(const luser_me& lhs, const luser_me& rhs);
		bool operator==(const local_users& lhs, const local_users& rhs);
		bool operator==(const global_users& lhs, const global_users& rhs);
		bool operator==(const motd& lhs, const motd& rhs);
		bool operator==(const motd_start& lhs, const motd_start& rhs);
		bool operator==(const end_of_motd& lhs, const end_of_motd& rhs);
		bool operator==(const host_hidden& lhs, const host_hidden& rhs);
	} // namespace commands

	typedef boost::variant<
		generic_command,
		commands::pass,
		commands::nick,
		commands::user,
		commands::ping,
		commands::pong,
		commands::notice,
		commands::error_msg,
		commands::welcome,
		commands::your_host,
		commands::created,
		commands::my_info,
		commands::isupport,
		commands::luser_client,
		commands::luser_op,
		commands::luser_unknown,
		commands::luser_channels,
		commands::luser_me,
		commands::local_users,
		commands::global_users,
		commands::motd,
		commands::motd_start,
		commands::end_of_motd,
		commands::host_hidden
	> command;

	/// Promote a generic command to its typed form. Unknown codes are
	/// returned unchanged as a generic_command. A known code with a missing
	/// or malformed parameter sets ec and returns the generic form untouched.
	command to_command(const generic_command& generic, boost::system::error_code& ec);
	command to_command(const generic_command& generic);

	/// The designated trailing field of a typed command always becomes the
	/// trailing parameter; optional fields that are absent are not emitted.
	generic_command to_generic(const command& cmd);

	/// True when the command stayed generic
	bool is_generic(const command& cmd);

	commands::user make_user(const std::string& username, const std::string& realname);
} // namespace ircengine

#endif // IRCENGINE_COMMAND_HPP
