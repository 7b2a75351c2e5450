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

#ifndef IRCENGINE_CONTEXT_HPP
#define IRCENGINE_CONTEXT_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include <boost/optional.hpp>

namespace ircengine
{
	enum class connection_status
	{
		connecting,
		connected,
		disconnected
	};

	const char* to_string(connection_status status) noexcept;

	/// Message of the day as it is accumulated from RPL_MOTDSTART, RPL_MOTD
	/// and RPL_ENDOFMOTD. Every line but the last is followed by a newline.
	class motd_state
	{
	public:
		enum class phase
		{
			empty,
			building,
			done
		};

		motd_state();

		phase current() const noexcept;
		const std::string& text() const noexcept;

		/// Each transition returns false, leaving the state untouched, when
		/// it is not legal from the current phase.
		bool start(const std::string& line);
		bool append(const std::string& line);
		bool finish(const std::string& line);

	private:
		phase phase_;
		std::string text_;
	};

	bool operator==(const motd_state& lhs, const motd_state& rhs);

	/// Fields of RPL_MYINFO
	struct server_info
	{
		std::string server_name;
		std::string server_version;
		std::string user_modes;
		std::string channel_modes;
		boost::optional<std::string> channel_mode_params;
	};

	/// Snapshot of the connection handed to event handlers
	class context
	{
	public:
		context(connection_status status, motd_state motd, server_info server);

		connection_status status() const noexcept;
		const motd_state& motd() const noexcept;
		const server_info& server() const noexcept;

	private:
		connection_status status_;
		motd_state motd_;
		server_info server_;
	};
} // namespace ircengine

#endif // IRCENGINE_CONTEXT_HPP
