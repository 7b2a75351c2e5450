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

#ifndef IRCENGINE_CONNECTION_STATE_HPP
#define IRCENGINE_CONNECTION_STATE_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <mutex>
#include <string>
#include <boost/system/error_code.hpp>
#include "../context.hpp"

namespace ircengine
{
	namespace detail
	{
		/// Mutable per connection facts. Each field has its own lock, held
		/// only for the duration of a single read-modify-write.
		class connection_state
		{
			connection_state(const connection_state&) = delete;
			connection_state& operator=(const connection_state&) = delete;

		public:
			connection_state();

			connection_status status() const;

			/// Returns true if the status actually changed
			bool status(connection_status next);

			/// Only moves connecting to connected
			bool registered();

			boost::system::error_code motd_start(const std::string& line);
			boost::system::error_code motd_line(const std::string& line);
			boost::system::error_code motd_end(const std::string& line);

			void server(const server_info& info);

			context snapshot() const;

		private:
			mutable std::mutex status_mutex_;
			connection_status status_;

			mutable std::mutex motd_mutex_;
			motd_state motd_;

			mutable std::mutex server_mutex_;
			server_info server_;
		};
	} // namespace detail
} // namespace ircengine

#endif // IRCENGINE_CONNECTION_STATE_HPP
