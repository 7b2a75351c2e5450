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

#ifndef IRCENGINE_MESSAGE_HPP
#define IRCENGINE_MESSAGE_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <utility>
#include <vector>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include "command.hpp"
#include "message_fwd.hpp"

namespace ircengine
{
	namespace rfc2812
	{
		/// Everything after the tag segment, CRLF included
		const std::string::size_type max_message_len = 512;

		/// '@', the tags and the separating space
		const std::string::size_type max_tags_len = 8191;
	}

	/// key and optional value, carried verbatim
	typedef std::pair<std::string, boost::optional<std::string> > tag;

	struct message
	{
		std::vector<tag> tags;
		boost::optional<std::string> prefix;
		ircengine::command command;
	};

	bool operator==(const message& lhs, const message& rhs);
	bool operator!=(const message& lhs, const message& rhs);

	/// Grammar only, the command is left as a generic_command.
	boost::optional<message> parse_generic(const std::string& inbound, boost::system::error_code& ec);

	/// Grammar followed by promotion of well-known commands.
	boost::optional<message> parse(const std::string& inbound, boost::system::error_code& ec);
	message parse(const std::string& inbound);

	/// Produce a CRLF terminated line. Fails with error::invalid rather than
	/// emit a line that would not parse back to the same message.
	std::string serialize(const message& outbound, boost::system::error_code& ec);
	std::string serialize(const message& outbound);

	/// A message without tags or prefix, the usual client to server form
	std::string serialize(const ircengine::command& outbound, boost::system::error_code& ec);
} // namespace ircengine

#endif // IRCENGINE_MESSAGE_HPP
