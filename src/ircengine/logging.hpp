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

#ifndef IRCENGINE_LOGGING_HPP
#define IRCENGINE_LOGGING_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <boost/log/trivial.hpp>
#include <boost/system/error_code.hpp>

namespace ircengine
{
	namespace logging
	{
		typedef boost::log::trivial::severity_level severity;

		/// Replace every sink with a console sink showing records at or
		/// above level
		void init(severity level);

		/// debug, info, warning or error
		severity parse_severity(const std::string& name, boost::system::error_code& ec);
		severity parse_severity(const std::string& name);
	} // namespace logging
} // namespace ircengine

#endif // IRCENGINE_LOGGING_HPP
