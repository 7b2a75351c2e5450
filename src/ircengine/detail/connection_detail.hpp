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

#ifndef IRCENGINE_CONNECTION_DETAIL_HPP
#define IRCENGINE_CONNECTION_DETAIL_HPP

#ifdef _MSC_VER
#pragma once
#endif

#include <string>
#include "../connection.hpp"
#include "../context.hpp"
#include "../event.hpp"
#include "connection_state.hpp"

namespace ircengine
{
	namespace detail
	{
		struct connection_detail : public connection
		{
			virtual const std::string& nickname() const noexcept = 0;
			virtual connection_state& state() noexcept = 0;
			virtual void dispatch(const context& ctx, const event& ev) = 0;
		};
	}// detail
}// ircengine

#endif //IRCENGINE_CONNECTION_DETAIL_HPP
