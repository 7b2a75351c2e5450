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

#include <mutex>
#include <string>
#include "../error.hpp"
#include "connection_state.hpp"

namespace ircengine
{
	namespace detail
	{
		connection_state::connection_state()
			:status_(connection_status::connecting)
		{}

		connection_status connection_state::status() const
		{
			std::lock_guard<std::mutex> lock(status_mutex_);
			return status_;
		}

		bool connection_state::status(connection_status next)
		{
			std::lock_guard<std::mutex> lock(status_mutex_);
			if (status_ == next)
				return false;
			status_ = next;
			return true;
		}

		bool connection_state::registered()
		{
			std::lock_guard<std::mutex> lock(status_mutex_);
			if (status_ != connection_status::connecting)
				return false;
			status_ = connection_status::connected;
			return true;
		}

		boost::system::error_code connection_state::motd_start(const std::string& line)
		{
			std::lock_guard<std::mutex> lock(motd_mutex_);
			if (!motd_.start(line))
				return error::motd_out_of_order;
			return{};
		}

		boost::system::error_code connection_state::motd_line(const std::string& line)
		{
			std::lock_guard<std::mutex> lock(motd_mutex_);
			if (!motd_.append(line))
				return error::motd_out_of_order;
			return{};
		}

		boost::system::error_code connection_state::motd_end(const std::string& line)
		{
			std::lock_guard<std::mutex> lock(motd_mutex_);
			if (!motd_.finish(line))
				return error::motd_out_of_order;
			return{};
		}

		void connection_state::server(const server_info& info)
		{
			std::lock_guard<std::mutex> lock(server_mutex_);
			server_ = info;
		}

		context connection_state::snapshot() const
		{
			std::unique_lock<std::mutex> status_lock(status_mutex_, std::defer_lock);
			std::unique_lock<std::mutex> motd_lock(motd_mutex_, std::defer_lock);
			std::unique_lock<std::mutex> server_lock(server_mutex_, std::defer_lock);
			std::lock(status_lock, motd_lock, server_lock);
			return context(status_, motd_, server_);
		}
	} // namespace detail
} // namespace ircengine
