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
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <boost/program_options.hpp>
#include <boost/system/system_error.hpp>
#include <boost/variant.hpp>
#include "../ircengine/client.hpp"
#include "../ircengine/client_config.hpp"
#include "../ircengine/command.hpp"
#include "../ircengine/logging.hpp"
#include "../ircengine/message.hpp"

namespace
{
	namespace po = boost::program_options;
	namespace events = ircengine::events;

	class print_event : public boost::static_visitor<>
	{
		const ircengine::context& ctx;
	public:
		explicit print_event(const ircengine::context& ctx)
			:ctx(ctx)
		{}

		void operator()(const events::raw_message&) const {}

		void operator()(const events::status_change&) const
		{
			std::cout << "* status " << ircengine::to_string(ctx.status()) << std::endl;
		}

		void operator()(const events::welcome_msg& ev) const
		{
			std::cout << "* " << ev.text << std::endl;
		}

		void operator()(const events::error_msg& ev) const
		{
			std::cout << "! " << ev.text << std::endl;
		}

		void operator()(const events::notice& ev) const
		{
			std::cout << "- " << ev.text << std::endl;
		}

		void operator()(const events::motd&) const
		{
			std::cout << ctx.motd().text() << std::endl;
		}

		void operator()(const events::unhandled_message& ev) const
		{
			std::cout << "? " << ircengine::to_string(ircengine::to_generic(ev.msg.command).code) << std::endl;
		}

		void operator()(const events::protocol_error& ev) const
		{
			std::cerr << "protocol error: " << ev.code.message() << std::endl;
		}

		void operator()(const events::transport_error& ev) const
		{
			std::cerr << "connection error: " << ev.code.message() << std::endl;
		}
	};

	void apply_overrides(const po::variables_map& vm, ircengine::client_config& config)
	{
		if (vm.count("host"))
			config.host = vm["host"].as<std::string>();
		if (vm.count("tls"))
		{
			boost::system::error_code ec;
			config.security = ircengine::parse_security(vm["tls"].as<std::string>(), ec);
			if (ec)
				throw boost::system::system_error(ec, "--tls");
		}
		if (vm.count("port"))
			config.port = vm["port"].as<std::uint16_t>();
		if (vm.count("nick"))
			config.nickname = vm["nick"].as<std::string>();
		if (vm.count("log-level"))
			config.log_level = vm["log-level"].as<std::string>();
	}
}

int main(int argc, char* argv[])
{
	po::options_description desc("ircengine-cli options");
	desc.add_options()
		("help,h", "show this help")
		("config,c", po::value<std::string>(), "INI configuration file")
		("host", po::value<std::string>(), "server host name")
		("port", po::value<std::uint16_t>(), "server port")
		("tls", po::value<std::string>(), "none, enforced or no_verify")
		("nick", po::value<std::string>(), "nickname")
		("log-level", po::value<std::string>(), "debug, info, warning or error");

	po::variables_map vm;
	try
	{
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);
	}
	catch (const po::error& ex)
	{
		std::cerr << ex.what() << '\n' << desc << std::endl;
		return EXIT_FAILURE;
	}

	if (vm.count("help"))
	{
		std::cout << desc << std::endl;
		return EXIT_SUCCESS;
	}

	try
	{
		ircengine::client_config config;
		if (vm.count("config"))
			config = ircengine::load_config(vm["config"].as<std::string>());
		apply_overrides(vm, config);
		if (config.host.empty() || config.nickname.empty() || config.server_port() == 0)
		{
			std::cerr << "a host, a nickname and a non zero port are required\n" << desc << std::endl;
			return EXIT_FAILURE;
		}

		ircengine::logging::init(ircengine::logging::parse_severity(config.log_level));

		ircengine::client client(config);
		client.on_event().connect([](const ircengine::context& ctx, const ircengine::event& ev) {
			boost::apply_visitor(print_event(ctx), ev);
		});
		client.connect();
		client.wait();
	}
	catch (const std::exception& ex)
	{
		std::cerr << ex.what() << std::endl;
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
