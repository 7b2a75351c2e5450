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

#ifndef IRCENGINE_ERROR_HPP
#define IRCENGINE_ERROR_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <boost/system/error_code.hpp>

namespace ircengine
{
	namespace error
	{
		enum errc
		{
			/// The line does not conform to the wire grammar
			no_match = 1,

			/// The line has no command token
			no_command,

			/// Malformed command token or a value that cannot be put on the wire
			invalid,

			/// A well-known command is missing a required parameter
			missing_parameter,

			/// The line exceeds the protocol length limits
			line_too_long,

			/// A MOTD reply arrived out of sequence
			motd_out_of_order
		};

		const boost::system::error_category& get_category() noexcept;

		inline boost::system::error_code make_error_code(errc e) noexcept
		{
			return boost::system::error_code(static_cast<int>(e), get_category());
		}
	} // namespace error
} // namespace ircengine

namespace boost
{
	namespace system
	{
		template<> struct is_error_code_enum<ircengine::error::errc>
		{
			static const bool value = true;
		};
	} // namespace system
} // namespace boost

#endif // IRCENGINE_ERROR_HPP
