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
#include <boost/utility/string_ref.hpp>
#include "irc_ctype.hpp"

namespace ircengine
{
	namespace locale
	{
		char irc_tolower(char c) noexcept
		{
			if (c >= 'A' && c <= '^')
				return static_cast<char>(c + ('a' - 'A'));
			return c;
		}

		bool irc_iequals(const boost::string_ref& lhs, const boost::string_ref& rhs) noexcept
		{
			return lhs.size() == rhs.size() &&
				std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char l, char r) {
				return irc_tolower(l) == irc_tolower(r);
			});
		}
	}
}
