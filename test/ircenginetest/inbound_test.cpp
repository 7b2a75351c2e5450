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
#include <utility>
#include <vector>
#include <ircengine/error.hpp>
#include <ircengine/event.hpp>
#include <ircengine/message.hpp>
#include <ircengine/detail/connection_detail.hpp>
#include <ircengine/detail/inbound.hpp>
#include <boost/asio/error.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/utility/string_ref.hpp>
#include <boost/variant/get.hpp>

namespace
{
	namespace events = ircengine::events;

	struct test_connection : ircengine::detail::connection_detail
	{
		explicit test_connection(std::string nick = "nick")
			:nick(std::move(nick))
		{}

		void send(const boost::string_ref& raw, boost::system::error_code& ec) override final
		{
			if (fail_with)
			{
				ec = fail_with;
				return;
			}
			ec.clear();
			sent.push_back(raw.to_string());
			log.push_back("send " + raw.to_string());
		}

		const std::string& nickname() const noexcept override final
		{
			return nick;
		}

		ircengine::detail::connection_state& state() noexcept override final
		{
			return state_;
		}

		void dispatch(const ircengine::context& ctx, const ircengine::event& ev) override final
		{
			contexts.push_back(ctx);
			received.push_back(ev);
			log.push_back("event");
		}

		boost::system::error_code feed(const std::string& line)
		{
			return ircengine::detail::inbound::handle_inbound_message(*this, line);
		}

		std::string nick;
		ircengine::detail::connection_state state_;
		boost::system::error_code fail_with;
		std::vector<std::string> sent;
		std::vector<ircengine::event> received;
		std::vector<ircengine::context> contexts;
		std::vector<std::string> log;
	};

	template<class Event>
	const Event* as(const ircengine::event& ev)
	{
		return boost::get<Event>(&ev);
	}

	void feed_ok(test_connection& con, const std::string& line)
	{
		BOOST_REQUIRE_MESSAGE(!con.feed(line), "\"" << line << "\" should not end the connection");
	}
} // anonymous namespace

BOOST_AUTO_TEST_SUITE(irc_inbound)

BOOST_AUTO_TEST_CASE(raw_message_comes_first)
{
	test_connection con;
	feed_ok(con, ":irc.example.net NOTICE nick :hello\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 2u);
	auto raw = as<events::raw_message>(con.received[0]);
	BOOST_REQUIRE(raw);
	BOOST_CHECK_EQUAL(*raw->msg.prefix, "irc.example.net");
	auto notice = as<events::notice>(con.received[1]);
	BOOST_REQUIRE(notice);
	BOOST_CHECK_EQUAL(notice->text, "hello");
}

BOOST_AUTO_TEST_CASE(notice_wildcard_target)
{
	test_connection con;
	feed_ok(con, ":irc.example.net NOTICE * :*** Looking up your hostname\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 2u);
	BOOST_REQUIRE(as<events::notice>(con.received[1]));
	BOOST_CHECK_EQUAL(as<events::notice>(con.received[1])->text, "*** Looking up your hostname");
}

BOOST_AUTO_TEST_CASE(notice_for_someone_else)
{
	test_connection con;
	feed_ok(con, ":irc.example.net NOTICE other :not for you\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 1u);
	BOOST_CHECK(as<events::raw_message>(con.received[0]));
}

BOOST_AUTO_TEST_CASE(nickname_case_mapping)
{
	test_connection con("nick{a}");
	feed_ok(con, "NOTICE NICK[A] :folded\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 2u);
	BOOST_CHECK(as<events::notice>(con.received[1]));
}

BOOST_AUTO_TEST_CASE(welcome_registers)
{
	test_connection con;
	BOOST_CHECK(con.state().status() == ircengine::connection_status::connecting);
	feed_ok(con, ":irc.example.net 001 nick :Welcome to the network\r\n");

	BOOST_REQUIRE_EQUAL(con.received.size(), 3u);
	BOOST_CHECK(as<events::raw_message>(con.received[0]));
	BOOST_CHECK(as<events::status_change>(con.received[1]));
	BOOST_CHECK(con.contexts[1].status() == ircengine::connection_status::connected);
	auto welcome = as<events::welcome_msg>(con.received[2]);
	BOOST_REQUIRE(welcome);
	BOOST_CHECK_EQUAL(welcome->text, "Welcome to the network");
	BOOST_CHECK(con.state().status() == ircengine::connection_status::connected);

	// only the first welcome changes anything
	feed_ok(con, ":irc.example.net 001 nick :Welcome again\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 5u);
	BOOST_CHECK(as<events::raw_message>(con.received[3]));
	BOOST_CHECK(as<events::welcome_msg>(con.received[4]));
}

BOOST_AUTO_TEST_CASE(welcome_for_someone_else)
{
	test_connection con;
	feed_ok(con, ":irc.example.net 001 other :Welcome\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 1u);
	BOOST_CHECK(con.state().status() == ircengine::connection_status::connecting);

	feed_ok(con, ":irc.example.net 001 * :Welcome\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 3u);
	BOOST_CHECK(as<events::welcome_msg>(con.received[2]));
	BOOST_CHECK(con.state().status() == ircengine::connection_status::connecting);
}

BOOST_AUTO_TEST_CASE(welcome_family_text)
{
	test_connection con;
	feed_ok(con, ":srv 002 nick :Your host is srv\r\n");
	feed_ok(con, ":srv 252 nick 3 :operator(s) online\r\n");
	feed_ok(con, ":srv 005 nick CHANTYPES=# NICKLEN=30 :are supported by this server\r\n");
	feed_ok(con, ":srv 396 nick user/nick :is now your displayed host\r\n");
	feed_ok(con, ":srv 265 nick 3 5 :Current local users 3, max 5\r\n");

	std::vector<std::string> texts;
	for (const auto& ev : con.received)
	{
		if (auto welcome = as<events::welcome_msg>(ev))
			texts.push_back(welcome->text);
	}
	const std::vector<std::string> expected{
		"Your host is srv",
		"3 operator(s) online",
		"CHANTYPES=#, NICKLEN=30 are supported by this server",
		"user/nick is now your displayed host",
		"Current local users 3, max 5"
	};
	BOOST_CHECK_EQUAL_COLLECTIONS(texts.begin(), texts.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(my_info_fills_server_info)
{
	test_connection con;
	feed_ok(con, ":srv 004 nick irc.example.net ircd-1.0 iw bklmnopst bklov\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 1u);

	const auto server = con.state().snapshot().server();
	BOOST_CHECK_EQUAL(server.server_name, "irc.example.net");
	BOOST_CHECK_EQUAL(server.server_version, "ircd-1.0");
	BOOST_CHECK_EQUAL(server.user_modes, "iw");
	BOOST_CHECK_EQUAL(server.channel_modes, "bklmnopst");
	BOOST_REQUIRE(server.channel_mode_params);
	BOOST_CHECK_EQUAL(*server.channel_mode_params, "bklov");
	BOOST_CHECK(con.state().status() == ircengine::connection_status::connecting);
}

BOOST_AUTO_TEST_CASE(motd_accumulation)
{
	typedef ircengine::motd_state::phase phase;
	test_connection con;
	BOOST_CHECK(con.state().snapshot().motd().current() == phase::empty);

	feed_ok(con, ":srv 375 nick :Welcome\r\n");
	auto motd = con.state().snapshot().motd();
	BOOST_CHECK(motd.current() == phase::building);
	BOOST_CHECK_EQUAL(motd.text(), "Welcome\n");

	feed_ok(con, ":srv 372 nick :line2\r\n");
	motd = con.state().snapshot().motd();
	BOOST_CHECK(motd.current() == phase::building);
	BOOST_CHECK_EQUAL(motd.text(), "Welcome\nline2\n");
	BOOST_CHECK_EQUAL(con.received.size(), 2u);

	feed_ok(con, ":srv 376 nick :bye\r\n");
	motd = con.state().snapshot().motd();
	BOOST_CHECK(motd.current() == phase::done);
	BOOST_CHECK_EQUAL(motd.text(), "Welcome\nline2\nbye");

	std::size_t motd_events = 0;
	for (const auto& ev : con.received)
		motd_events += as<events::motd>(ev) ? 1 : 0;
	BOOST_CHECK_EQUAL(motd_events, 1u);
	BOOST_REQUIRE(as<events::motd>(con.received.back()));
	BOOST_CHECK_EQUAL(con.contexts.back().motd().text(), "Welcome\nline2\nbye");
}

BOOST_AUTO_TEST_CASE(motd_out_of_order)
{
	typedef ircengine::motd_state::phase phase;
	const auto out_of_order = ircengine::error::make_error_code(ircengine::error::motd_out_of_order);
	test_connection con;

	feed_ok(con, ":srv 372 nick :early\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 2u);
	auto error = as<events::protocol_error>(con.received[1]);
	BOOST_REQUIRE(error);
	BOOST_CHECK_EQUAL(error->code, out_of_order);
	BOOST_CHECK_EQUAL(error->line, ":srv 372 nick :early\r\n");
	BOOST_CHECK(con.state().snapshot().motd().current() == phase::empty);

	feed_ok(con, ":srv 375 nick :start\r\n");
	feed_ok(con, ":srv 375 nick :start again\r\n");
	BOOST_REQUIRE(as<events::protocol_error>(con.received.back()));
	auto motd = con.state().snapshot().motd();
	BOOST_CHECK(motd.current() == phase::building);
	BOOST_CHECK_EQUAL(motd.text(), "start\n");

	feed_ok(con, ":srv 376 nick :end\r\n");
	feed_ok(con, ":srv 376 nick :end again\r\n");
	BOOST_REQUIRE(as<events::protocol_error>(con.received.back()));
	BOOST_CHECK_EQUAL(con.state().snapshot().motd().text(), "start\nend");
}

BOOST_AUTO_TEST_CASE(motd_for_someone_else)
{
	test_connection con;
	feed_ok(con, ":srv 375 other :Welcome\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 1u);
	BOOST_CHECK(con.state().snapshot().motd().current() == ircengine::motd_state::phase::empty);
}

BOOST_AUTO_TEST_CASE(ping_answered_before_dispatch)
{
	test_connection con;
	feed_ok(con, "PING :token\r\n");
	BOOST_REQUIRE_EQUAL(con.sent.size(), 1u);
	BOOST_CHECK_EQUAL(con.sent[0], "PONG :token\r\n");
	BOOST_REQUIRE_EQUAL(con.log.size(), 2u);
	BOOST_CHECK_EQUAL(con.log[0], "send PONG :token\r\n");
	BOOST_CHECK_EQUAL(con.log[1], "event");
	BOOST_CHECK(as<events::raw_message>(con.received[0]));
}

BOOST_AUTO_TEST_CASE(ping_write_failure)
{
	test_connection con;
	con.fail_with = boost::asio::error::broken_pipe;
	auto ec = con.feed("PING :token\r\n");
	BOOST_CHECK_EQUAL(ec, boost::system::error_code(boost::asio::error::broken_pipe));
	BOOST_CHECK(con.received.empty());
}

BOOST_AUTO_TEST_CASE(malformed_line)
{
	test_connection con;
	feed_ok(con, "foo");
	BOOST_REQUIRE_EQUAL(con.received.size(), 1u);
	auto error = as<events::protocol_error>(con.received[0]);
	BOOST_REQUIRE(error);
	BOOST_CHECK_EQUAL(error->code, ircengine::error::make_error_code(ircengine::error::no_match));
	BOOST_CHECK_EQUAL(error->line, "foo");
}

BOOST_AUTO_TEST_CASE(promotion_failure_keeps_data)
{
	test_connection con;
	feed_ok(con, "NICK\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 3u);
	auto raw = as<events::raw_message>(con.received[0]);
	BOOST_REQUIRE(raw);
	BOOST_CHECK(ircengine::is_generic(raw->msg.command));
	auto error = as<events::protocol_error>(con.received[1]);
	BOOST_REQUIRE(error);
	BOOST_CHECK_EQUAL(error->code, ircengine::error::make_error_code(ircengine::error::missing_parameter));
	BOOST_CHECK(as<events::unhandled_message>(con.received[2]));
}

BOOST_AUTO_TEST_CASE(extra_parameters_stay_generic)
{
	test_connection con;
	feed_ok(con, ":srv 001 nick extra stuff :Welcome\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 3u);
	auto raw = as<events::raw_message>(con.received[0]);
	BOOST_REQUIRE(raw);
	BOOST_CHECK(ircengine::is_generic(raw->msg.command));
	BOOST_CHECK_EQUAL(ircengine::serialize(raw->msg), ":srv 001 nick extra stuff :Welcome\r\n");
	auto error = as<events::protocol_error>(con.received[1]);
	BOOST_REQUIRE(error);
	BOOST_CHECK_EQUAL(error->code, ircengine::error::make_error_code(ircengine::error::invalid));
	BOOST_CHECK(as<events::unhandled_message>(con.received[2]));
	BOOST_CHECK(con.state().status() == ircengine::connection_status::connecting);
}

BOOST_AUTO_TEST_CASE(error_and_unhandled)
{
	test_connection con;
	feed_ok(con, "ERROR :Closing Link: nick (Quit)\r\n");
	feed_ok(con, ":a!b@c PRIVMSG #chan :hi\r\n");
	BOOST_REQUIRE_EQUAL(con.received.size(), 4u);
	auto error = as<events::error_msg>(con.received[1]);
	BOOST_REQUIRE(error);
	BOOST_CHECK_EQUAL(error->text, "Closing Link: nick (Quit)");
	BOOST_CHECK(as<events::raw_message>(con.received[2]));
	BOOST_CHECK(as<events::unhandled_message>(con.received[3]));
}

BOOST_AUTO_TEST_SUITE_END()
