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
#include <utility>
#include "context.hpp"

namespace ircengine
{
	const char* to_string(connection_status status) noexcept
	{
		switch (status)
		{
		case connection_status::connecting:
			return "connecting";
		case connection_status::connected:
			return "connected";
		case connection_status::disconnected:
			return "disconnected";
		}
		return "unknown";
	}

	motd_state::motd_state()
		:phase_(phase::empty)
	{}

	motd_state::phase motd_state::current() const noexcept
	{
		return phase_;
	}

	const std::string& motd_state::text() const noexcept
	{
		return text_;
	}

	bool motd_state::start(const std::string& line)
	{
		if (phase_ != phase::empty)
			return false;
		text_ = line + "\n";
		phase_ = phase::building;
		return true;
	}

	bool motd_state::append(const std::string& line)
	{
		if (phase_ != phase::building)
			return false;
		text_ += line;
		text_ += '\n';
		return true;
	}

	bool motd_state::finish(const std::string& line)
	{
		if (phase_ != phase::building)
			return false;
		text_ += line;
		phase_ = phase::done;
		return true;
	}

	bool operator==(const motd_state& lhs, const motd_state& rhs)
	{
		return lhs.current() == rhs.current() && lhs.text() == rhs.text();
	}

	context::context(connection_status status, motd_state motd, server_info server)
		:status_(status), motd_(std::move(motd)), server_(std::move(server))
	{}

	connection_status context::status() const noexcept
	{
		return status_;
	}

	const motd_state& context::motd() const noexcept
	{
		return motd_;
	}

	const server_info& context::server() const noexcept
	{
		return server_;
	}
} // namespace ircengine
