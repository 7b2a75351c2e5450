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
#include <vector>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>
#include <boost/utility/string_ref.hpp>
#include <boost/variant.hpp>
#include "../irc_ctype.hpp"
#include "../irc_proto.hpp"
#include "../message.hpp"
#include "inbound.hpp"

namespace
{
	namespace commands = ircengine::commands;
	namespace events = ircengine::events;

	class derive_events : public boost::static_visitor<>
	{
		ircengine::detail::connection_detail& con;
		const ircengine::message& msg;
		const std::string& line;
		std::vector<ircengine::event>& out;

		bool is_me(const std::string& target) const
		{
			return ircengine::locale::irc_iequals(target, con.nickname());
		}

		bool targets_me(const std::string& target) const
		{
			return target == "*" || is_me(target);
		}

		void welcome_text(const std::string& client, const std::string& text) const
		{
			if (targets_me(client))
				out.emplace_back(events::welcome_msg{ text });
		}

		template<class Count>
		void welcome_count(const std::string& client, Count count, const std::string& text) const
		{
			if (targets_me(client))
				out.emplace_back(events::welcome_msg{ boost::str(boost::format("%1% %2%") % count % text) });
		}

		void motd_step(const boost::system::error_code& ec) const
		{
			if (ec)
			{
				BOOST_LOG_TRIVIAL(warning) << "MOTD reply out of sequence: " << ec.message();
				out.emplace_back(events::protocol_error{ ec, line });
			}
		}

	public:
		derive_events(ircengine::detail::connection_detail& con, const ircengine::message& msg,
			const std::string& line, std::vector<ircengine::event>& out)
			:con(con), msg(msg), line(line), out(out)
		{}

		void operator()(const ircengine::generic_command&) const
		{
			out.emplace_back(events::unhandled_message{ msg });
		}

		void operator()(const commands::notice& c) const
		{
			if (targets_me(c.target))
				out.emplace_back(events::notice{ c.text });
		}

		void operator()(const commands::error_msg& c) const
		{
			out.emplace_back(events::error_msg{ c.text });
		}

		void operator()(const commands::ping&) const
		{
			// answered before dispatch
		}

		void operator()(const commands::welcome& c) const
		{
			if (is_me(c.client) && con.state().registered())
				out.emplace_back(events::status_change{});
			welcome_text(c.client, c.text);
		}

		void operator()(const commands::your_host& c) const { welcome_text(c.client, c.text); }
		void operator()(const commands::created& c) const { welcome_text(c.client, c.text); }
		void operator()(const commands::luser_client& c) const { welcome_text(c.client, c.text); }
		void operator()(const commands::luser_me& c) const { welcome_text(c.client, c.text); }
		void operator()(const commands::local_users& c) const { welcome_text(c.client, c.text); }
		void operator()(const commands::global_users& c) const { welcome_text(c.client, c.text); }

		void operator()(const commands::luser_op& c) const { welcome_count(c.client, c.operators, c.text); }
		void operator()(const commands::luser_unknown& c) const { welcome_count(c.client, c.connections, c.text); }
		void operator()(const commands::luser_channels& c) const { welcome_count(c.client, c.channels, c.text); }
		void operator()(const commands::host_hidden& c) const { welcome_count(c.client, c.host, c.text); }

		void operator()(const commands::isupport& c) const
		{
			welcome_count(c.client, boost::algorithm::join(c.tokens, ", "), c.text);
		}

		void operator()(const commands::my_info& c) const
		{
			if (is_me(c.client))
			{
				con.state().server(ircengine::server_info{
					c.server_name, c.server_version, c.user_modes, c.channel_modes, c.channel_mode_params });
			}
		}

		void operator()(const commands::motd_start& c) const
		{
			if (is_me(c.client))
				motd_step(con.state().motd_start(c.text));
		}

		void operator()(const commands::motd& c) const
		{
			if (is_me(c.client))
				motd_step(con.state().motd_line(c.text));
		}

		void operator()(const commands::end_of_motd& c) const
		{
			if (!is_me(c.client))
				return;
			auto ec = con.state().motd_end(c.text);
			motd_step(ec);
			if (!ec)
				out.emplace_back(events::motd{});
		}

		// registration and keepalive replies carry nothing for the handlers
		void operator()(const commands::pass&) const { out.emplace_back(events::unhandled_message{ msg }); }
		void operator()(const commands::nick&) const { out.emplace_back(events::unhandled_message{ msg }); }
		void operator()(const commands::user&) const { out.emplace_back(events::unhandled_message{ msg }); }
		void operator()(const commands::pong&) const { out.emplace_back(events::unhandled_message{ msg }); }
	};

	std::string printable(const std::string& line)
	{
		return boost::algorithm::trim_right_copy_if(line, [](char c) { return c == '\r' || c == '\n'; });
	}
}

namespace ircengine
{
	namespace detail
	{
		namespace inbound
		{
			boost::system::error_code handle_inbound_message(connection_detail& con, const std::string& line)
			{
				BOOST_LOG_TRIVIAL(debug) << ">> " << printable(line);

				boost::system::error_code ec;
				auto parsed = parse_generic(line, ec);
				if (!parsed)
				{
					BOOST_LOG_TRIVIAL(warning) << "Dropping malformed line \"" << printable(line) << "\": " << ec.message();
					con.dispatch(con.state().snapshot(), events::protocol_error{ ec, line });
					return{};
				}

				std::vector<event> derived;
				parsed->command = to_command(boost::get<generic_command>(parsed->command), ec);
				if (ec)
				{
					// keep the generic form so nothing on the line is lost
					BOOST_LOG_TRIVIAL(warning) << "Cannot promote \"" << printable(line) << "\": " << ec.message();
					derived.emplace_back(events::protocol_error{ ec, line });
				}

				if (auto ping = boost::get<commands::ping>(&parsed->command))
				{
					boost::system::error_code write_ec;
					proto::pong(con, ping->token, write_ec);
					if (write_ec)
						return write_ec;
				}

				boost::apply_visitor(derive_events(con, *parsed, line, derived), parsed->command);

				const auto ctx = con.state().snapshot();
				con.dispatch(ctx, events::raw_message{ *parsed });
				for (const auto& ev : derived)
					con.dispatch(ctx, ev);
				return{};
			}
		} // inbound
	}// detail
}// ircengine
