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

#ifndef IRCENGINE_CLIENT_HPP
#define IRCENGINE_CLIENT_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <memory>
#include <boost/system/error_code.hpp>
#include "client_config.hpp"
#include "command.hpp"
#include "context.hpp"
#include "event.hpp"
#include "message_fwd.hpp"
#include "transport.hpp"

namespace ircengine
{
	class client_impl;

	/// One registration with one server. Events are raised on the read
	/// loop thread; handlers connected to on_event run in connection order.
	/// Destroying the client disconnects and waits for the read loop, except
	/// from inside a handler, where the loop is left to finish on its own and
	/// raises nothing more.
	class client
	{
		client(const client&) = delete;
		client& operator=(const client&) = delete;

		std::shared_ptr<client_impl> p_impl;
	public:
		explicit client(client_config config);
		client(client&&) noexcept;
		~client();

		client& operator=(client&&) noexcept;
	public:
		event_signal& on_event() noexcept;

		/// Open the configured transport, register and start the read loop
		void connect(boost::system::error_code& ec);
		void connect();

		/// Register over an already opened transport and start the read loop
		void connect(std::unique_ptr<transport> duplex, boost::system::error_code& ec);

		void send(const ::ircengine::command& cmd, boost::system::error_code& ec);
		void send(const ::ircengine::command& cmd);
		void send(const message& msg, boost::system::error_code& ec);
		void send(const message& msg);

		/// Close the transport, the read loop ends with a final status_change
		void disconnect();

		/// Block until the read loop has ended
		void wait();

	public:
		context snapshot() const;
		const client_config& config() const noexcept;
	};
} // namespace ircengine

#endif // IRCENGINE_CLIENT_HPP
