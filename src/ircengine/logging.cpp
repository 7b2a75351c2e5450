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

#include <iostream>
#include <string>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/system/system_error.hpp>
#include "error.hpp"
#include "logging.hpp"

namespace ircengine
{
	namespace logging
	{
		void init(severity level)
		{
			namespace keywords = boost::log::keywords;
			boost::log::register_simple_formatter_factory<severity, char>("Severity");
			boost::log::add_common_attributes();

			auto core = boost::log::core::get();
			core->remove_all_sinks();
			boost::log::add_console_log(std::clog,
				keywords::format = "[%TimeStamp%] <%Severity%> %Message%",
				keywords::auto_flush = true);
			core->set_filter(boost::log::trivial::severity >= level);
		}

		severity parse_severity(const std::string& name, boost::system::error_code& ec)
		{
			ec.clear();
			if (name == "debug")
				return boost::log::trivial::debug;
			if (name == "info")
				return boost::log::trivial::info;
			if (name == "warning")
				return boost::log::trivial::warning;
			if (name == "error")
				return boost::log::trivial::error;
			ec = error::invalid;
			return boost::log::trivial::info;
		}

		severity parse_severity(const std::string& name)
		{
			boost::system::error_code ec;
			auto level = parse_severity(name, ec);
			if (ec)
				throw boost::system::system_error(ec, name);
			return level;
		}
	} // namespace logging
} // namespace ircengine
