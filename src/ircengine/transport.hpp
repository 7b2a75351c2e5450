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

#ifndef IRCENGINE_TRANSPORT_HPP
#define IRCENGINE_TRANSPORT_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <cstdint>
#include <memory>
#include <string>
#include <boost/system/error_code.hpp>
#include <boost/utility/string_ref_fwd.hpp>

namespace ircengine
{
	enum class connection_security
	{
		none,
		enforced,
		no_verify
	};

	/// A byte stream duplex. read_line is only ever called from one thread,
	/// write may be called from another one at the same time.
	class transport
	{
	public:
		virtual ~transport(){}

		/// Blocks until a CRLF terminated line is available. The line keeps
		/// its CRLF. End of stream is reported as boost::asio::error::eof.
		virtual std::string read_line(boost::system::error_code& ec) = 0;

		/// Blocks until all bytes have been accepted
		virtual void write(const boost::string_ref& bytes, boost::system::error_code& ec) = 0;

		/// Aborts pending reads and writes
		virtual void close() = 0;

		static std::unique_ptr<transport> connect(connection_security security, const std::string& host,
			std::uint16_t port, boost::system::error_code& ec);
	};
}

#endif // IRCENGINE_TRANSPORT_HPP
