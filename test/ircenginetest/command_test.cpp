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

#ifndef _MSC_VER
#define BOOST_TEST_DYN_LINK
#endif
#include <string>
#include <vector>
#include <ircengine/command.hpp>
#include <ircengine/error.hpp>
#include <boost/optional.hpp>
#include <boost/system/system_error.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/variant/get.hpp>

namespace
{
	namespace commands = ircengine::commands;

	ircengine::generic_command numeric(std::uint16_t code, std::vector<std::string> params,
		boost::optional<std::string> trailing = boost::none)
	{
		return ircengine::generic_command{ code, params, trailing };
	}

	ircengine::generic_command text(const char* code, std::vector<std::string> params,
		boost::optional<std::string> trailing = boost::none)
	{
		return ircengine::generic_command{ std::string(code), params, trailing };
	}

	boost::system::error_code promote_error(const ircengine::generic_command& generic)
	{
		boost::system::error_code ec;
		auto result = ircengine::to_command(generic, ec);
		BOOST_CHECK_MESSAGE(result == ircengine::command(generic), "A failed promotion keeps the generic form");
		return ec;
	}
}

BOOST_AUTO_TEST_SUITE(irc_command)

BOOST_AUTO_TEST_CASE(typed_round_trip)
{
	const std::vector<ircengine::command> typed{
		commands::pass{ "secret" },
		commands::nick{ "nick" },
		commands::user{ "guest", "0", "*", "Real Name" },
		commands::ping{ "token", boost::none },
		commands::ping{ "irc.example.net", std::string("token") },
		commands::pong{ "token", boost::none },
		commands::notice{ "*", "*** Looking up your hostname" },
		commands::error_msg{ "Closing Link: timeout" },
		commands::welcome{ "nick", "Welcome to the network nick" },
		commands::your_host{ "nick", "Your host is irc.example.net" },
		commands::created{ "nick", "This server was created today" },
		commands::my_info{ "nick", "irc.example.net", "1.0", "iw", "bklmnopst", boost::none },
		commands::my_info{ "nick", "irc.example.net", "1.0", "iw", "bklmnopst", std::string("bklov") },
		commands::isupport{ "nick", { "CHANTYPES=#", "NICKLEN=30" }, "are supported by this server" },
		commands::isupport{ "nick", {}, "are supported by this server" },
		commands::luser_client{ "nick", "There are 3 users" },
		commands::luser_op{ "nick", 2, "operator(s) online" },
		commands::luser_unknown{ "nick", 1, "unknown connection(s)" },
		commands::luser_channels{ "nick", 12, "channels formed" },
		commands::luser_me{ "nick", "I have 3 clients" },
		commands::local_users{ "nick", boost::none, "Current local users 3, max 5" },
		commands::local_users{ "nick", commands::user_counts(3, 5), "Current local users 3, max 5" },
		commands::global_users{ "nick", commands::user_counts(30, 50), "Current global users 30, max 50" },
		commands::motd{ "nick", "- line" },
		commands::motd_start{ "nick", "- irc.example.net Message of the day -" },
		commands::end_of_motd{ "nick", "End of /MOTD command." },
		commands::host_hidden{ "nick", "user/nick", "is now your displayed host" }
	};
	for (const auto& cmd : typed)
	{
		const auto generic = ircengine::to_generic(cmd);
		BOOST_CHECK_MESSAGE(ircengine::to_command(generic) == cmd,
			ircengine::to_string(generic.code) << " did not promote back to the same value");
		BOOST_CHECK(!ircengine::is_generic(cmd));
	}
}

BOOST_AUTO_TEST_CASE(demote_shapes)
{
	BOOST_CHECK(ircengine::to_generic(commands::user{ "guest", "0", "*", "Real Name" }) ==
		text("USER", { "guest", "0", "*" }, std::string("Real Name")));
	BOOST_CHECK(ircengine::to_generic(commands::pong{ "token", boost::none }) ==
		text("PONG", {}, std::string("token")));
	BOOST_CHECK(ircengine::to_generic(commands::ping{ "irc.example.net", std::string("token") }) ==
		text("PING", { "irc.example.net" }, std::string("token")));
	BOOST_CHECK(ircengine::to_generic(commands::luser_op{ "nick", 2, "operators" }) ==
		numeric(ircengine::RPL_LUSEROP, { "nick", "2" }, std::string("operators")));
}

BOOST_AUTO_TEST_CASE(optional_fields_are_not_synthesized)
{
	auto info = ircengine::to_generic(commands::my_info{ "nick", "srv", "1.0", "iw", "bklmnopst", boost::none });
	BOOST_CHECK_EQUAL(info.params.size(), 5u);
	BOOST_CHECK(!info.trailing);

	auto users = ircengine::to_generic(commands::global_users{ "nick", boost::none, "text" });
	BOOST_CHECK(users.params == std::vector<std::string>{ "nick" });
}

BOOST_AUTO_TEST_CASE(user_helper_defaults)
{
	auto user = ircengine::make_user("guest", "Real Name");
	BOOST_CHECK_EQUAL(user.username, "guest");
	BOOST_CHECK_EQUAL(user.mode, "0");
	BOOST_CHECK_EQUAL(user.unused, "*");
	BOOST_CHECK_EQUAL(user.realname, "Real Name");
}

BOOST_AUTO_TEST_CASE(unknown_codes_stay_generic)
{
	const auto leave = text("LEAVE", {});
	boost::system::error_code ec;
	auto result = ircengine::to_command(leave, ec);
	BOOST_CHECK(!ec);
	BOOST_CHECK(ircengine::is_generic(result));
	BOOST_CHECK(result == ircengine::command(leave));

	const auto topic = numeric(332, { "nick", "#chan" }, std::string("topic"));
	result = ircengine::to_command(topic, ec);
	BOOST_CHECK(!ec);
	BOOST_CHECK(result == ircengine::command(topic));
}

BOOST_AUTO_TEST_CASE(user_counts_branch_on_arity)
{
	auto none = ircengine::to_command(numeric(ircengine::RPL_LOCALUSERS, { "nick" }, std::string("text")));
	auto plain = boost::get<commands::local_users>(&none);
	BOOST_REQUIRE(plain);
	BOOST_CHECK(!plain->counts);

	auto some = ircengine::to_command(numeric(ircengine::RPL_GLOBALUSERS, { "nick", "7", "11" }, std::string("text")));
	auto counted = boost::get<commands::global_users>(&some);
	BOOST_REQUIRE(counted);
	BOOST_REQUIRE(counted->counts);
	BOOST_CHECK_EQUAL(counted->counts->first, 7u);
	BOOST_CHECK_EQUAL(counted->counts->second, 11u);

	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_LOCALUSERS, { "nick", "7" }, std::string("text"))),
		ircengine::error::make_error_code(ircengine::error::invalid));
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_LOCALUSERS, { "nick", "7", "11", "13" }, std::string("text"))),
		ircengine::error::make_error_code(ircengine::error::invalid));
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_LOCALUSERS, {}, std::string("text"))),
		ircengine::error::make_error_code(ircengine::error::missing_parameter));
}

BOOST_AUTO_TEST_CASE(counts_must_be_numbers)
{
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_LUSEROP, { "nick", "many" }, std::string("operators"))),
		ircengine::error::make_error_code(ircengine::error::invalid));
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_GLOBALUSERS, { "nick", "7x", "11" }, std::string("text"))),
		ircengine::error::make_error_code(ircengine::error::invalid));
}

BOOST_AUTO_TEST_CASE(missing_parameters)
{
	const auto missing = ircengine::error::make_error_code(ircengine::error::missing_parameter);
	BOOST_CHECK_EQUAL(promote_error(text("NICK", {})), missing);
	BOOST_CHECK_EQUAL(promote_error(text("PASS", {})), missing);
	BOOST_CHECK_EQUAL(promote_error(text("USER", { "guest", "0" }, std::string("Real Name"))), missing);
	BOOST_CHECK_EQUAL(promote_error(text("PING", {})), missing);
	BOOST_CHECK_EQUAL(promote_error(text("NOTICE", {}, std::string("text"))), missing);
	BOOST_CHECK_EQUAL(promote_error(text("ERROR", {})), missing);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_WELCOME, {}, std::string("Welcome"))), missing);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_MYINFO, { "nick", "srv", "1.0" })), missing);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_ISUPPORT, {}, std::string("supported"))), missing);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_LUSERCHANNELS, { "nick" }, std::string("channels"))), missing);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_HOSTHIDDEN, { "nick" }, std::string("host"))), missing);
}

BOOST_AUTO_TEST_CASE(too_many_parameters)
{
	const auto invalid = ircengine::error::make_error_code(ircengine::error::invalid);
	BOOST_CHECK_EQUAL(promote_error(text("PING", { "a", "b" }, std::string("c"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(text("USER", { "guest", "0", "*", "extra" }, std::string("Real Name"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_MYINFO, { "nick", "srv", "1.0", "iw", "bkl", "bk", "x" })), invalid);
	BOOST_CHECK_EQUAL(promote_error(text("NICK", { "alice", "bob" })), invalid);
	BOOST_CHECK_EQUAL(promote_error(text("PASS", { "secret" }, std::string("more"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(text("NOTICE", { "nick", "extra" }, std::string("text"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(text("ERROR", { "lost" }, std::string("Closing"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_WELCOME, { "nick", "extra", "stuff" }, std::string("Welcome"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_MOTD, { "nick", "extra" }, std::string("line"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_LUSEROP, { "nick", "3", "extra" }, std::string("ops"))), invalid);
	BOOST_CHECK_EQUAL(promote_error(numeric(ircengine::RPL_HOSTHIDDEN, { "nick", "host", "extra" }, std::string("text"))), invalid);
}

BOOST_AUTO_TEST_CASE(extra_parameters_are_kept)
{
	const auto generic = text("NICK", { "alice", "bob" });
	boost::system::error_code ec;
	auto result = ircengine::to_command(generic, ec);
	BOOST_CHECK(ec);
	BOOST_CHECK(ircengine::is_generic(result));
	BOOST_CHECK(ircengine::to_generic(result) == generic);
}

BOOST_AUTO_TEST_CASE(to_command_throws)
{
	BOOST_CHECK_THROW(ircengine::to_command(text("NICK", {})), boost::system::system_error);
}

BOOST_AUTO_TEST_CASE(code_padding)
{
	BOOST_CHECK_EQUAL(ircengine::to_string(ircengine::command_code(std::uint16_t(1))), "001");
	BOOST_CHECK_EQUAL(ircengine::to_string(ircengine::command_code(std::uint16_t(396))), "396");
	BOOST_CHECK_EQUAL(ircengine::to_string(ircengine::command_code(std::string("NOTICE"))), "NOTICE");
}

BOOST_AUTO_TEST_SUITE_END()
