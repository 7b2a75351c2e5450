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

#include <istream>
#include <string>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/spirit/include/qi.hpp>
#include <boost/system/system_error.hpp>
#include "client_config.hpp"
#include "error.hpp"
#include "logging.hpp"

namespace
{
	std::uint16_t parse_port(const std::string& value)
	{
		namespace qi = boost::spirit::qi;
		std::uint16_t port = 0;
		auto first = value.cbegin();
		if (!qi::parse(first, value.cend(), qi::ushort_, port) || first != value.cend() || port == 0)
			throw boost::system::system_error(ircengine::error::invalid, "port " + value);
		return port;
	}

	std::string required(const boost::property_tree::ptree& tree, const char* path)
	{
		auto value = tree.get<std::string>(path);
		if (value.empty())
			throw boost::system::system_error(ircengine::error::invalid, path);
		return value;
	}

	ircengine::client_config from_tree(const boost::property_tree::ptree& tree)
	{
		ircengine::client_config config;
		config.host = required(tree, "server.host");
		if (auto tls = tree.get_optional<std::string>("server.tls"))
		{
			boost::system::error_code ec;
			config.security = ircengine::parse_security(*tls, ec);
			if (ec)
				throw boost::system::system_error(ec, "server.tls");
		}
		if (auto port = tree.get_optional<std::string>("server.port"))
			config.port = parse_port(*port);
		config.password = tree.get_optional<std::string>("server.password");

		config.nickname = required(tree, "user.nickname");
		config.username = tree.get_optional<std::string>("user.username");
		config.realname = tree.get_optional<std::string>("user.realname");

		config.log_level = tree.get<std::string>("logging.level", config.log_level);
		boost::system::error_code ec;
		ircengine::logging::parse_severity(config.log_level, ec);
		if (ec)
			throw boost::system::system_error(ec, "logging.level");
		return config;
	}

	template<class Loader>
	ircengine::client_config load_or_report(Loader load, boost::system::error_code& ec)
	{
		try
		{
			auto config = load();
			ec.clear();
			return config;
		}
		catch (const boost::property_tree::ptree_error& ex)
		{
			BOOST_LOG_TRIVIAL(warning) << "Bad configuration: " << ex.what();
			ec = ircengine::error::invalid;
		}
		catch (const boost::system::system_error& ex)
		{
			BOOST_LOG_TRIVIAL(warning) << "Bad configuration: " << ex.what();
			ec = ex.code();
		}
		return ircengine::client_config();
	}
}

namespace ircengine
{
	std::uint16_t default_port(connection_security security) noexcept
	{
		return security == connection_security::none ? 6667 : 6697;
	}

	connection_security parse_security(const std::string& name, boost::system::error_code& ec)
	{
		ec.clear();
		if (name == "none")
			return connection_security::none;
		if (name == "enforced")
			return connection_security::enforced;
		if (name == "no_verify")
			return connection_security::no_verify;
		ec = error::invalid;
		return connection_security::none;
	}

	client_config::client_config()
		:security(connection_security::none), log_level("info")
	{
	}

	std::uint16_t client_config::server_port() const noexcept
	{
		return port ? *port : default_port(security);
	}

	const std::string& client_config::user_name() const noexcept
	{
		return username ? *username : nickname;
	}

	const std::string& client_config::real_name() const noexcept
	{
		return realname ? *realname : nickname;
	}

	client_config load_config(std::istream& input)
	{
		boost::property_tree::ptree tree;
		boost::property_tree::read_ini(input, tree);
		return from_tree(tree);
	}

	client_config load_config(std::istream& input, boost::system::error_code& ec)
	{
		return load_or_report([&input] { return load_config(input); }, ec);
	}

	client_config load_config(const std::string& path)
	{
		boost::property_tree::ptree tree;
		boost::property_tree::read_ini(path, tree);
		return from_tree(tree);
	}

	client_config load_config(const std::string& path, boost::system::error_code& ec)
	{
		return load_or_report([&path] { return load_config(path); }, ec);
	}
} // namespace ircengine
