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

#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/error.hpp>
#include <boost/log/trivial.hpp>
#include <boost/system/system_error.hpp>
#include <boost/utility/string_ref.hpp>
#include "client.hpp"
#include "irc_proto.hpp"
#include "message.hpp"
#include "detail/connection_detail.hpp"
#include "detail/connection_state.hpp"
#include "detail/inbound.hpp"

namespace
{
	std::string printable(const boost::string_ref& raw)
	{
		return boost::algorithm::trim_right_copy_if(raw.to_string(), [](char c) { return c == '\r' || c == '\n'; });
	}

	bool is_orderly_close(const boost::system::error_code& ec)
	{
		return ec == boost::asio::error::eof || ec == boost::asio::error::operation_aborted;
	}
}

namespace ircengine
{
	/// Shared with the read loop thread, which keeps it alive until the
	/// loop has ended
	class client_impl : public detail::connection_detail, public std::enable_shared_from_this<client_impl>
	{
		client_impl(const client_impl&) = delete;
		client_config config_;
		event_signal on_event_;
		detail::connection_state state_;
		// held for a whole write
		std::mutex write_mutex_;
		// held only to read or set p_transport
		mutable std::mutex transport_mutex_;
		std::unique_ptr<transport> p_transport;
		std::thread reader_;
	public:
		explicit client_impl(client_config config)
			:config_(std::move(config))
		{
		}

	public:
		void connect(std::unique_ptr<transport> duplex, boost::system::error_code& ec)
		{
			{
				std::lock_guard<std::mutex> lock(transport_mutex_);
				if (p_transport)
				{
					ec = boost::asio::error::already_connected;
					return;
				}
				p_transport = std::move(duplex);
			}
			ec.clear();
			this->dispatch(state_.snapshot(), events::status_change{});

			if (config_.password)
				proto::pass(*this, *config_.password, ec);
			if (!ec)
				proto::nick(*this, config_.nickname, ec);
			if (!ec)
				proto::user(*this, config_.user_name(), config_.real_name(), ec);
			if (ec)
			{
				p_transport->close();
				this->finish(ec);
				return;
			}

			auto self = this->shared_from_this();
			reader_ = std::thread([self] {
				self->run();
			});
		}

		void send(const boost::string_ref& raw, boost::system::error_code& ec) override final
		{
			BOOST_LOG_TRIVIAL(debug) << "<< " << printable(raw);
			auto duplex = this->current_transport();
			if (!duplex)
			{
				ec = boost::asio::error::not_connected;
				return;
			}
			std::lock_guard<std::mutex> lock(write_mutex_);
			duplex->write(raw, ec);
		}

		/// Does not wait for a pending write, closing aborts it
		void disconnect()
		{
			if (auto duplex = this->current_transport())
				duplex->close();
		}

		void wait()
		{
			if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id())
				reader_.join();
		}

		/// Called by the owning client. From an event handler the read loop
		/// cannot be joined; it is detached and no further events are raised.
		void shutdown()
		{
			this->disconnect();
			if (reader_.joinable() && reader_.get_id() == std::this_thread::get_id())
			{
				on_event_.disconnect_all_slots();
				reader_.detach();
				return;
			}
			this->wait();
		}

		event_signal& on_event() noexcept
		{
			return on_event_;
		}

		const client_config& config() const noexcept
		{
			return config_;
		}

		context snapshot() const
		{
			return state_.snapshot();
		}

	public:
		const std::string& nickname() const noexcept override final
		{
			return config_.nickname;
		}

		detail::connection_state& state() noexcept override final
		{
			return state_;
		}

		void dispatch(const context& ctx, const event& ev) override final
		{
			on_event_(ctx, ev);
		}

	private:
		transport* current_transport() const
		{
			std::lock_guard<std::mutex> lock(transport_mutex_);
			return p_transport.get();
		}

		void run()
		{
			boost::system::error_code ec;
			try
			{
				while (!ec)
				{
					auto line = p_transport->read_line(ec);
					if (!ec)
						ec = detail::inbound::handle_inbound_message(*this, line);
				}
			}
			catch (const std::exception& ex)
			{
				BOOST_LOG_TRIVIAL(error) << "Read loop stopped by an event handler: " << ex.what();
				p_transport->close();
			}

			try
			{
				this->finish(ec);
			}
			catch (const std::exception& ex)
			{
				BOOST_LOG_TRIVIAL(error) << "Event handler failed on disconnect: " << ex.what();
			}
		}

		void finish(const boost::system::error_code& ec)
		{
			if (ec && !is_orderly_close(ec))
			{
				BOOST_LOG_TRIVIAL(error) << "Connection to " << config_.host << " failed: " << ec.message();
				this->dispatch(state_.snapshot(), events::transport_error{ ec });
			}
			else
			{
				BOOST_LOG_TRIVIAL(info) << "Connection to " << config_.host << " closed";
			}
			if (state_.status(connection_status::disconnected))
				this->dispatch(state_.snapshot(), events::status_change{});
		}
	};

	client::client(client_config config)
		:p_impl(std::make_shared<client_impl>(std::move(config)))
	{
	}

	client::client(client&& other) noexcept
		:p_impl(std::move(other.p_impl))
	{
	}

	client::~client()
	{
		if (p_impl)
			p_impl->shutdown();
	}

	client& client::operator=(client&& other) noexcept
	{
		if (this != &other)
		{
			if (p_impl)
				p_impl->shutdown();
			p_impl = std::move(other.p_impl);
		}
		return *this;
	}

	event_signal& client::on_event() noexcept
	{
		return p_impl->on_event();
	}

	void client::connect(boost::system::error_code& ec)
	{
		const auto& config = p_impl->config();
		BOOST_LOG_TRIVIAL(info) << "Connecting to " << config.host << ':' << config.server_port();
		auto duplex = transport::connect(config.security, config.host, config.server_port(), ec);
		if (ec)
		{
			BOOST_LOG_TRIVIAL(error) << "Cannot connect to " << config.host << ": " << ec.message();
			return;
		}
		p_impl->connect(std::move(duplex), ec);
	}

	void client::connect()
	{
		boost::system::error_code ec;
		this->connect(ec);
		if (ec)
			throw boost::system::system_error(ec, p_impl->config().host);
	}

	void client::connect(std::unique_ptr<transport> duplex, boost::system::error_code& ec)
	{
		p_impl->connect(std::move(duplex), ec);
	}

	void client::send(const ::ircengine::command& cmd, boost::system::error_code& ec)
	{
		proto::send(*p_impl, cmd, ec);
	}

	void client::send(const ::ircengine::command& cmd)
	{
		boost::system::error_code ec;
		this->send(cmd, ec);
		if (ec)
			throw boost::system::system_error(ec);
	}

	void client::send(const message& msg, boost::system::error_code& ec)
	{
		auto line = serialize(msg, ec);
		if (ec)
			return;
		p_impl->send(line, ec);
	}

	void client::send(const message& msg)
	{
		boost::system::error_code ec;
		this->send(msg, ec);
		if (ec)
			throw boost::system::system_error(ec);
	}

	void client::disconnect()
	{
		p_impl->disconnect();
	}

	void client::wait()
	{
		p_impl->wait();
	}

	context client::snapshot() const
	{
		return p_impl->snapshot();
	}

	const client_config& client::config() const noexcept
	{
		return p_impl->config();
	}
} // namespace ircengine
