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

#ifndef IRCENGINE_CLIENT_CONFIG_HPP
#define IRCENGINE_CLIENT_CONFIG_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <cstdint>
#include <iosfwd>
#include <string>
#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include "transport.hpp"

namespace ircengine
{
	std::uint16_t default_port(connection_security security) noexcept;

	/// none, enforced or no_verify
	connection_security parse_security(const std::string& name, boost::system::error_code& ec);

	struct client_config
	{
		client_config();

		std::string host;
		boost::optional<std::uint16_t> port;
		connection_security security;
		std::string nickname;
		boost::optional<std::string> username;
		boost::optional<std::string> realname;
		boost::optional<std::string> password;
		std::string log_level;

		std::uint16_t server_port() const noexcept;
		const std::string& user_name() const noexcept;
		const std::string& real_name() const noexcept;
	};

	/// INI with [server] host, port, tls, password; [user] nickname,
	/// username, realname; [logging] level
	client_config load_config(std::istream& input, boost::system::error_code& ec);
	client_config load_config(std::istream& input);
	client_config load_config(const std::string& path, boost::system::error_code& ec);
	client_config load_config(const std::string& path);
} // namespace ircengine

#endif // IRCENGINE_CLIENT_CONFIG_HPP
