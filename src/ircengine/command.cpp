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

#include <cstdint>
#include <iterator>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <boost/spirit/include/qi.hpp>
#include <boost/system/system_error.hpp>
#include <boost/variant.hpp>
#include "command.hpp"
#include "error.hpp"

namespace qi = boost::spirit::qi;

namespace
{
	using ircengine::command;
	using ircengine::generic_command;
	namespace commands = ircengine::commands;
	namespace error = ircengine::error;

	/// params followed by the trailing parameter, if any
	typedef std::vector<std::string> arguments;
	typedef command (*promoter)(const arguments&, boost::system::error_code&);

	bool need(const arguments& args, std::size_t count, boost::system::error_code& ec)
	{
		if (args.size() < count)
		{
			ec = error::missing_parameter;
			return false;
		}
		return true;
	}

	/// A fixed shape, extra arguments would be lost on the typed form
	bool exactly(const arguments& args, std::size_t count, boost::system::error_code& ec)
	{
		if (!need(args, count, ec))
			return false;
		if (args.size() > count)
		{
			ec = error::invalid;
			return false;
		}
		return true;
	}

	bool to_number(const std::string& text, unsigned& out, boost::system::error_code& ec)
	{
		auto first = text.cbegin();
		if (!qi::parse(first, text.cend(), qi::uint_, out) || first != text.cend())
		{
			ec = error::invalid;
			return false;
		}
		return true;
	}

	template<class Reply>
	command client_text(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 2, ec))
			return{};
		return Reply{ args[0], args.back() };
	}

	template<class Reply>
	command client_count_text(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 3, ec))
			return{};
		unsigned count = 0;
		if (!to_number(args[1], count, ec))
			return{};
		return Reply{ args[0], count, args.back() };
	}

	template<class Reply>
	command client_users(const arguments& args, boost::system::error_code& ec)
	{
		// <client> [<current> <max>] :<text>
		switch (args.size())
		{
		case 0:
		case 1:
			ec = error::missing_parameter;
			return{};
		case 2:
			return Reply{ args[0], boost::none, args[1] };
		case 4:
		{
			unsigned current = 0;
			unsigned max = 0;
			if (!to_number(args[1], current, ec) || !to_number(args[2], max, ec))
				return{};
			return Reply{ args[0], commands::user_counts(current, max), args[3] };
		}
		default:
			ec = error::invalid;
			return{};
		}
	}

	template<class Keepalive>
	command keepalive(const arguments& args, boost::system::error_code& ec)
	{
		if (!need(args, 1, ec))
			return{};
		if (args.size() > 2)
		{
			ec = error::invalid;
			return{};
		}
		if (args.size() == 2)
			return Keepalive{ args[0], args[1] };
		return Keepalive{ args[0], boost::none };
	}

	command promote_pass(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 1, ec))
			return{};
		return commands::pass{ args[0] };
	}

	command promote_nick(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 1, ec))
			return{};
		return commands::nick{ args[0] };
	}

	command promote_user(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 4, ec))
			return{};
		return commands::user{ args[0], args[1], args[2], args[3] };
	}

	command promote_notice(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 2, ec))
			return{};
		return commands::notice{ args[0], args.back() };
	}

	command promote_error(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 1, ec))
			return{};
		return commands::error_msg{ args.back() };
	}

	command promote_my_info(const arguments& args, boost::system::error_code& ec)
	{
		// <client> <servername> <version> <user modes> <channel modes> [<channel modes with a parameter>]
		if (!need(args, 5, ec))
			return{};
		if (args.size() > 6)
		{
			ec = error::invalid;
			return{};
		}
		commands::my_info info{ args[0], args[1], args[2], args[3], args[4], boost::none };
		if (args.size() == 6)
			info.channel_mode_params = args[5];
		return info;
	}

	command promote_isupport(const arguments& args, boost::system::error_code& ec)
	{
		// <client> <1-13 tokens> :are supported by this server
		if (!need(args, 2, ec))
			return{};
		return commands::isupport{
			args.front(),
			std::vector<std::string>(std::next(args.begin()), std::prev(args.end())),
			args.back() };
	}

	command promote_host_hidden(const arguments& args, boost::system::error_code& ec)
	{
		if (!exactly(args, 3, ec))
			return{};
		return commands::host_hidden{ args[0], args[1], args.back() };
	}

	const std::map<std::string, promoter>& text_commands()
	{
		static const std::map<std::string, promoter> table = {
			{ "PASS", &promote_pass },
			{ "NICK", &promote_nick },
			{ "USER", &promote_user },
			{ "PING", &keepalive<commands::ping> },
			{ "PONG", &keepalive<commands::pong> },
			{ "NOTICE", &promote_notice },
			{ "ERROR", &promote_error }
		};
		return table;
	}

	const std::map<std::uint16_t, promoter>& numeric_replies()
	{
		static const std::map<std::uint16_t, promoter> table = {
			{ ircengine::RPL_WELCOME, &client_text<commands::welcome> },
			{ ircengine::RPL_YOURHOST, &client_text<commands::your_host> },
			{ ircengine::RPL_CREATED, &client_text<commands::created> },
			{ ircengine::RPL_MYINFO, &promote_my_info },
			{ ircengine::RPL_ISUPPORT, &promote_isupport },
			{ ircengine::RPL_LUSERCLIENT, &client_text<commands::luser_client> },
			{ ircengine::RPL_LUSEROP, &client_count_text<commands::luser_op> },
			{ ircengine::RPL_LUSERUNKNOWN, &client_count_text<commands::luser_unknown> },
			{ ircengine::RPL_LUSERCHANNELS, &client_count_text<commands::luser_channels> },
			{ ircengine::RPL_LUSERME, &client_text<commands::luser_me> },
			{ ircengine::RPL_LOCALUSERS, &client_users<commands::local_users> },
			{ ircengine::RPL_GLOBALUSERS, &client_users<commands::global_users> },
			{ ircengine::RPL_MOTD, &client_text<commands::motd> },
			{ ircengine::RPL_MOTDSTART, &client_text<commands::motd_start> },
			{ ircengine::RPL_ENDOFMOTD, &client_text<commands::end_of_motd> },
			{ ircengine::RPL_HOSTHIDDEN, &promote_host_hidden }
		};
		return table;
	}

	struct find_promoter : boost::static_visitor<promoter>
	{
		promoter operator()(const std::string& text) const
		{
			auto found = text_commands().find(text);
			return found == text_commands().end() ? nullptr : found->second;
		}

		promoter operator()(std::uint16_t numeric) const
		{
			auto found = numeric_replies().find(numeric);
			return found == numeric_replies().end() ? nullptr : found->second;
		}
	};

	generic_command make_generic(ircengine::command_code code,
		std::vector<std::string> params,
		boost::optional<std::string> trailing = boost::none)
	{
		return generic_command{ std::move(code), std::move(params), std::move(trailing) };
	}

	generic_command text_reply(std::uint16_t code, const std::string& client, const std::string& text)
	{
		return make_generic(code, { client }, text);
	}

	generic_command users_reply(std::uint16_t code, const std::string& client,
		const boost::optional<commands::user_counts>& counts, const std::string& text)
	{
		std::vector<std::string> params{ client };
		if (counts)
		{
			params.push_back(std::to_string(counts->first));
			params.push_back(std::to_string(counts->second));
		}
		return make_generic(code, std::move(params), text);
	}

	template<class Keepalive>
	generic_command keepalive_generic(const char* name, const Keepalive& k)
	{
		if (k.target)
			return make_generic(std::string(name), { k.token }, *k.target);
		return make_generic(std::string(name), {}, k.token);
	}

	struct demote : boost::static_visitor<generic_command>
	{
		generic_command operator()(const generic_command& g) const
		{
			return g;
		}

		generic_command operator()(const commands::pass& c) const
		{
			return make_generic(std::string("PASS"), { c.password });
		}

		generic_command operator()(const commands::nick& c) const
		{
			return make_generic(std::string("NICK"), { c.nickname });
		}

		generic_command operator()(const commands::user& c) const
		{
			return make_generic(std::string("USER"), { c.username, c.mode, c.unused }, c.realname);
		}

		generic_command operator()(const commands::ping& c) const
		{
			return keepalive_generic("PING", c);
		}

		generic_command operator()(const commands::pong& c) const
		{
			return keepalive_generic("PONG", c);
		}

		generic_command operator()(const commands::notice& c) const
		{
			return make_generic(std::string("NOTICE"), { c.target }, c.text);
		}

		generic_command operator()(const commands::error_msg& c) const
		{
			return make_generic(std::string("ERROR"), {}, c.text);
		}

		generic_command operator()(const commands::welcome& c) const
		{
			return text_reply(ircengine::RPL_WELCOME, c.client, c.text);
		}

		generic_command operator()(const commands::your_host& c) const
		{
			return text_reply(ircengine::RPL_YOURHOST, c.client, c.text);
		}

		generic_command operator()(const commands::created& c) const
		{
			return text_reply(ircengine::RPL_CREATED, c.client, c.text);
		}

		generic_command operator()(const commands::my_info& c) const
		{
			std::vector<std::string> params{ c.client, c.server_name, c.server_version, c.user_modes, c.channel_modes };
			if (c.channel_mode_params)
				params.push_back(*c.channel_mode_params);
			return make_generic(static_cast<std::uint16_t>(ircengine::RPL_MYINFO), std::move(params));
		}

		generic_command operator()(const commands::isupport& c) const
		{
			std::vector<std::string> params{ c.client };
			params.insert(params.end(), c.tokens.begin(), c.tokens.end());
			return make_generic(static_cast<std::uint16_t>(ircengine::RPL_ISUPPORT), std::move(params), c.text);
		}

		generic_command operator()(const commands::luser_client& c) const
		{
			return text_reply(ircengine::RPL_LUSERCLIENT, c.client, c.text);
		}

		generic_command operator()(const commands::luser_op& c) const
		{
			return make_generic(static_cast<std::uint16_t>(ircengine::RPL_LUSEROP),
				{ c.client, std::to_string(c.operators) }, c.text);
		}

		generic_command operator()(const commands::luser_unknown& c) const
		{
			return make_generic(static_cast<std::uint16_t>(ircengine::RPL_LUSERUNKNOWN),
				{ c.client, std::to_string(c.connections) }, c.text);
		}

		generic_command operator()(const commands::luser_channels& c) const
		{
			return make_generic(static_cast<std::uint16_t>(ircengine::RPL_LUSERCHANNELS),
				{ c.client, std::to_string(c.channels) }, c.text);
		}

		generic_command operator()(const commands::luser_me& c) const
		{
			return text_reply(ircengine::RPL_LUSERME, c.client, c.text);
		}

		generic_command operator()(const commands::local_users& c) const
		{
			return users_reply(ircengine::RPL_LOCALUSERS, c.client, c.counts, c.text);
		}

		generic_command operator()(const commands::global_users& c) const
		{
			return users_reply(ircengine::RPL_GLOBALUSERS, c.client, c.counts, c.text);
		}

		generic_command operator()(const commands::motd& c) const
		{
			return text_reply(ircengine::RPL_MOTD, c.client, c.text);
		}

		generic_command operator()(const commands::motd_start& c) const
		{
			return text_reply(ircengine::RPL_MOTDSTART, c.client, c.text);
		}

		generic_command operator()(const commands::end_of_motd& c) const
		{
			return text_reply(ircengine::RPL_ENDOFMOTD, c.client, c.text);
		}

		generic_command operator()(const commands::host_hidden& c) const
		{
			return make_generic(static_cast<std::uint16_t>(ircengine::RPL_HOSTHIDDEN), { c.client, c.host }, c.text);
		}
	};

	struct code_to_string : boost::static_visitor<std::string>
	{
		std::string operator()(const std::string& text) const
		{
			return text;
		}

		std::string operator()(std::uint16_t numeric) const
		{
			return boost::str(boost::format("%03u") % numeric);
		}
	};
}

namespace ircengine
{
	std::string to_string(const command_code& code)
	{
		return boost::apply_visitor(code_to_string(), code);
	}

	bool operator==(const generic_command& lhs, const generic_command& rhs)
	{
		return lhs.code == rhs.code && lhs.params == rhs.params && lhs.trailing == rhs.trailing;
	}

	command to_command(const generic_command& generic, boost::system::error_code& ec)
	{
		ec.clear();
		auto promote = boost::apply_visitor(find_promoter(), generic.code);
		if (!promote)
			return generic;

		arguments args(generic.params);
		if (generic.trailing)
			args.push_back(*generic.trailing);

		auto promoted = promote(args, ec);
		if (ec)
			return generic;
		return promoted;
	}

	command to_command(const generic_command& generic)
	{
		boost::system::error_code ec;
		auto result = to_command(generic, ec);
		if (ec)
			throw boost::system::system_error(ec, to_string(generic.code));
		return result;
	}

	generic_command to_generic(const command& cmd)
	{
		return boost::apply_visitor(demote(), cmd);
	}

	bool is_generic(const command& cmd)
	{
		return boost::get<generic_command>(&cmd) != nullptr;
	}

	commands::user make_user(const std::string& username, const std::string& realname)
	{
		return commands::user{ username, "0", "*", realname };
	}

	namespace commands
	{
		bool operator==(const pass& lhs, const pass& rhs)
		{
			return lhs.password == rhs.password;
		}

		bool operator==(const nick& lhs, const nick& rhs)
		{
			return lhs.nickname == rhs.nickname;
		}

		bool operator==(const user& lhs, const user& rhs)
		{
			return std::tie(lhs.username, lhs.mode, lhs.unused, lhs.realname) ==
				std::tie(rhs.username, rhs.mode, rhs.unused, rhs.realname);
		}

		bool operator==(const ping& lhs, const ping& rhs)
		{
			return lhs.token == rhs.token && lhs.target == rhs.target;
		}

		bool operator==(const pong& lhs, const pong& rhs)
		{
			return lhs.token == rhs.token && lhs.target == rhs.target;
		}

		bool operator==(const notice& lhs, const notice& rhs)
		{
			return lhs.target == rhs.target && lhs.text == rhs.text;
		}

		bool operator==(const error_msg& lhs, const error_msg& rhs)
		{
			return lhs.text == rhs.text;
		}

		bool operator==(const welcome& lhs, const welcome& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const your_host& lhs, const your_host& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const created& lhs, const created& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const my_info& lhs, const my_info& rhs)
		{
			return std::tie(lhs.client, lhs.server_name, lhs.server_version, lhs.user_modes, lhs.channel_modes) ==
				std::tie(rhs.client, rhs.server_name, rhs.server_version, rhs.user_modes, rhs.channel_modes) &&
				lhs.channel_mode_params == rhs.channel_mode_params;
		}

		bool operator==(const isupport& lhs, const isupport& rhs)
		{
			return lhs.client == rhs.client && lhs.tokens == rhs.tokens && lhs.text == rhs.text;
		}

		bool operator==(const luser_client& lhs, const luser_client& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const luser_op& lhs, const luser_op& rhs)
		{
			return lhs.client == rhs.client && lhs.operators == rhs.operators && lhs.text == rhs.text;
		}

		bool operator==(const luser_unknown& lhs, const luser_unknown& rhs)
		{
			return lhs.client == rhs.client && lhs.connections == rhs.connections && lhs.text == rhs.text;
		}

		bool operator==(const luser_channels& lhs, const luser_channels& rhs)
		{
			return lhs.client == rhs.client && lhs.channels == rhs.channels && lhs.text == rhs.text;
		}

		bool operator==(const luser_me& lhs, const luser_me& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const local_users& lhs, const local_users& rhs)
		{
			return lhs.client == rhs.client && lhs.counts == rhs.counts && lhs.text == rhs.text;
		}

		bool operator==(const global_users& lhs, const global_users& rhs)
		{
			return lhs.client == rhs.client && lhs.counts == rhs.counts && lhs.text == rhs.text;
		}

		bool operator==(const motd& lhs, const motd& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const motd_start& lhs, const motd_start& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const end_of_motd& lhs, const end_of_motd& rhs)
		{
			return lhs.client == rhs.client && lhs.text == rhs.text;
		}

		bool operator==(const host_hidden& lhs, const host_hidden& rhs)
		{
			return lhs.client == rhs.client && lhs.host == rhs.host && lhs.text == rhs.text;
		}
	} // namespace commands
} // namespace ircengine
