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
#include "error.hpp"

namespace
{
	class ircengine_category : public boost::system::error_category
	{
	public:
		const char* name() const noexcept override
		{
			return "ircengine";
		}

		std::string message(int value) const override
		{
			switch (static_cast<ircengine::error::errc>(value))
			{
			case ircengine::error::no_match:
				return "Line does not match the message grammar";
			case ircengine::error::no_command:
				return "Line is missing a command";
			case ircengine::error::invalid:
				return "Invalid command or parameter";
			case ircengine::error::missing_parameter:
				return "Command is missing a required parameter";
			case ircengine::error::line_too_long:
				return "Line exceeds the maximum message length";
			case ircengine::error::motd_out_of_order:
				return "MOTD reply received out of sequence";
			}
			return "ircengine error";
		}
	};
}

namespace ircengine
{
	namespace error
	{
		const boost::system::error_category& get_category() noexcept
		{
			static const ircengine_category instance;
			return instance;
		}
	} // namespace error
} // namespace ircengine
