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

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
//#define BOOST_SPIRIT_DEBUG
#include <boost/algorithm/string/predicate.hpp>
#include <boost/fusion/include/std_pair.hpp>
#include <boost/optional.hpp>
#include <boost/spirit/include/qi.hpp>
#include <boost/system/system_error.hpp>
#include <boost/variant.hpp>
#include "error.hpp"
#include "message.hpp"

namespace qi = boost::spirit::qi;

namespace
{
	namespace error = ircengine::error;

	template <typename It>
	struct parser
	{
		parser()
		{
			special = qi::char_(" \r\n") | qi::char_('\0');
			eol = qi::char_("\r\n") | qi::char_('\0');

			tag_key = +(qi::char_ - special - qi::char_("=;"));
			tag_value = *(qi::char_ - special - ';');
			tag = tag_key >> -('=' >> tag_value);
			tags = '@' >> (tag % ';') >> ' ';

			prefix = ':' >> +(qi::char_ - special) >> ' ';

			// validated separately so a bad token is told apart from a bad line
			command = *(qi::char_ - special);

			middle = (qi::char_ - special - ':') >> *(qi::char_ - special);
			params = *(' ' >> middle);
			trailing = qi::lit(" :") >> *(qi::char_ - eol);

			BOOST_SPIRIT_DEBUG_NODE(tag);
			BOOST_SPIRIT_DEBUG_NODE(prefix);
			BOOST_SPIRIT_DEBUG_NODE(command);
			BOOST_SPIRIT_DEBUG_NODE(params);
			BOOST_SPIRIT_DEBUG_NODE(trailing);
		}

		qi::rule<It> special;
		qi::rule<It> eol;
		qi::rule<It, std::string()> tag_key;
		qi::rule<It, std::string()> tag_value;
		qi::rule<It, ircengine::tag()> tag;
		qi::rule<It, std::vector<ircengine::tag>()> tags;
		qi::rule<It, std::string()> prefix;
		qi::rule<It, std::string()> command;
		qi::rule<It, std::string()> middle;
		qi::rule<It, std::vector<std::string>()> params;
		qi::rule<It, std::string()> trailing;
	};

	typedef std::string::const_iterator iterator_type;

	const parser<iterator_type>& line_parser()
	{
		static const parser<iterator_type> p;
		return p;
	}

	bool valid_command(const std::string& token, ircengine::command_code& code)
	{
		if (token.size() == 3 && std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; }))
		{
			code = static_cast<std::uint16_t>(std::stoi(token));
			return true;
		}
		if (std::all_of(token.begin(), token.end(), [](char c) { return c >= 'A' && c <= 'Z'; }))
		{
			code = token;
			return true;
		}
		return false;
	}

	bool has_any(const std::string& value, const char* set, std::size_t set_len)
	{
		return value.find_first_of(set, 0, set_len) != std::string::npos;
	}

	// space, CR, LF and NUL
	bool has_special(const std::string& value)
	{
		return has_any(value, " \r\n\0", 4);
	}

	bool has_eol(const std::string& value)
	{
		return has_any(value, "\r\n\0", 3);
	}

	struct code_is_valid : boost::static_visitor<bool>
	{
		bool operator()(const std::string& text) const
		{
			return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
		}

		bool operator()(std::uint16_t numeric) const
		{
			return numeric <= 999;
		}
	};

	void write_tags(std::ostream& out, const std::vector<ircengine::tag>& tags, boost::system::error_code& ec)
	{
		if (tags.empty())
			return;
		out << '@';
		for (auto it = tags.cbegin(); it != tags.cend(); ++it)
		{
			if (it->first.empty() || has_special(it->first) || has_any(it->first, "=;", 2) ||
				(it->second && (has_special(*it->second) || has_any(*it->second, ";", 1))))
			{
				ec = error::invalid;
				return;
			}
			if (it != tags.cbegin())
				out << ';';
			out << it->first;
			if (it->second)
				out << '=' << *it->second;
		}
		out << ' ';
	}

	void write_command(std::ostream& out, const ircengine::generic_command& cmd, boost::system::error_code& ec)
	{
		if (!boost::apply_visitor(code_is_valid(), cmd.code))
		{
			ec = error::invalid;
			return;
		}
		out << ircengine::to_string(cmd.code);

		for (auto it = cmd.params.cbegin(); it != cmd.params.cend(); ++it)
		{
			const bool last = !cmd.trailing && std::next(it) == cmd.params.cend();
			const bool plain_middle = !it->empty() && it->front() != ':' && !has_special(*it);
			if (plain_middle)
			{
				out << ' ' << *it;
			}
			else if (last && !has_eol(*it))
			{
				// only the final parameter may carry spaces or a leading colon
				out << " :" << *it;
			}
			else
			{
				ec = error::invalid;
				return;
			}
		}

		if (cmd.trailing)
		{
			if (has_eol(*cmd.trailing))
			{
				ec = error::invalid;
				return;
			}
			out << " :" << *cmd.trailing;
		}
	}
}

namespace ircengine
{
	bool operator==(const message& lhs, const message& rhs)
	{
		return lhs.tags == rhs.tags && lhs.prefix == rhs.prefix && lhs.command == rhs.command;
	}

	bool operator!=(const message& lhs, const message& rhs)
	{
		return !(lhs == rhs);
	}

	boost::optional<message> parse_generic(const std::string& inbound, boost::system::error_code& ec)
	{
		ec.clear();
		// a message must end with a crlf
		if (!boost::ends_with(inbound, "\r\n"))
		{
			ec = error::no_match;
			return boost::none;
		}

		std::string::size_type body = 0;
		if (!inbound.empty() && inbound.front() == '@')
		{
			auto space = inbound.find(' ');
			body = space == std::string::npos ? inbound.size() : space + 1;
			if (body > rfc2812::max_tags_len)
			{
				ec = error::line_too_long;
				return boost::none;
			}
		}
		if (inbound.size() - body > rfc2812::max_message_len)
		{
			ec = error::line_too_long;
			return boost::none;
		}

		const auto& p = line_parser();
		auto first = inbound.cbegin();
		const auto last = inbound.cend();

		message m;
		if (first != last && *first == '@' && !qi::parse(first, last, p.tags, m.tags))
		{
			ec = error::no_match;
			return boost::none;
		}

		if (first != last && *first == ':')
		{
			std::string prefix;
			if (!qi::parse(first, last, p.prefix, prefix))
			{
				ec = error::no_match;
				return boost::none;
			}
			m.prefix = prefix;
		}

		std::string token;
		if (!qi::parse(first, last, p.command, token) || token.empty())
		{
			ec = error::no_command;
			return boost::none;
		}

		generic_command cmd;
		if (!valid_command(token, cmd.code))
		{
			ec = error::invalid;
			return boost::none;
		}

		if (!qi::parse(first, last, p.params, cmd.params))
		{
			ec = error::no_match;
			return boost::none;
		}

		std::string trailing;
		if (qi::parse(first, last, p.trailing, trailing))
			cmd.trailing = trailing;

		if (!qi::parse(first, last, qi::lit("\r\n")) || first != last)
		{
			ec = error::no_match;
			return boost::none;
		}

		m.command = std::move(cmd);
		return m;
	}

	boost::optional<message> parse(const std::string& inbound, boost::system::error_code& ec)
	{
		auto m = parse_generic(inbound, ec);
		if (!m)
			return boost::none;

		m->command = to_command(boost::get<generic_command>(m->command), ec);
		if (ec)
			return boost::none;
		return m;
	}

	message parse(const std::string& inbound)
	{
		boost::system::error_code ec;
		auto m = parse(inbound, ec);
		if (!m)
			throw boost::system::system_error(ec);
		return *m;
	}

	std::string serialize(const message& outbound, boost::system::error_code& ec)
	{
		ec.clear();
		std::ostringstream out;

		write_tags(out, outbound.tags, ec);
		if (ec)
			return{};
		const auto tags_len = static_cast<std::string::size_type>(out.tellp());

		if (outbound.prefix)
		{
			if (outbound.prefix->empty() || has_special(*outbound.prefix))
			{
				ec = error::invalid;
				return{};
			}
			out << ':' << *outbound.prefix << ' ';
		}

		write_command(out, to_generic(outbound.command), ec);
		if (ec)
			return{};
		out << "\r\n";

		auto line = out.str();
		if (tags_len > rfc2812::max_tags_len || line.size() - tags_len > rfc2812::max_message_len)
		{
			ec = error::line_too_long;
			return{};
		}
		return line;
	}

	std::string serialize(const message& outbound)
	{
		boost::system::error_code ec;
		auto line = serialize(outbound, ec);
		if (ec)
			throw boost::system::system_error(ec);
		return line;
	}

	std::string serialize(const ircengine::command& outbound, boost::system::error_code& ec)
	{
		return serialize(message{ {}, boost::none, outbound }, ec);
	}
} // namespace ircengine
