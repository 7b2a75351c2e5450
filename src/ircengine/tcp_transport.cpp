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
#define OPENSSL_NO_SSL2
#define OPENSSL_NO_SSL3
#include <cstdint>
#include <future>
#include <memory>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <boost/utility/string_ref.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include "message.hpp"
#include "transport.hpp"

namespace
{
	const std::size_t max_line_len = ircengine::rfc2812::max_tags_len + ircengine::rfc2812::max_message_len;

	struct context
	{
		virtual ~context(){}

		boost::asio::io_service io_service;
	};

	struct ssl_context : public context
	{
		explicit ssl_context(boost::asio::ssl::context::verify_mode mode)
			:ssl_ctx(boost::asio::ssl::context::sslv23_client)
		{
			ssl_ctx.set_options(
				boost::asio::ssl::context::default_workarounds |
				boost::asio::ssl::context::no_sslv2 |
				boost::asio::ssl::context::no_sslv3 |
				boost::asio::ssl::context::no_tlsv1 |
				boost::asio::ssl::context::no_tlsv1_1 |
				boost::asio::ssl::context::no_compression);
			ssl_ctx.set_verify_mode(mode);
			if (mode & boost::asio::ssl::verify_peer)
			{
				boost::system::error_code ec;
				ssl_ctx.set_default_verify_paths(ec);
				if (ec)
					BOOST_LOG_TRIVIAL(warning) << "Cannot load the default certificate store: " << ec.message();
			}
		}
		boost::asio::ssl::context ssl_ctx;
	};

	struct pending_write
	{
		std::string data;
		std::promise<boost::system::error_code> done;
	};

	template<class SocketType_>
	struct basic_transport : public ircengine::transport
	{
		template<class... Types_>
		basic_transport(context * ctx, Types_&& ... args)
			:ctx_(ctx),
			input_buffer_(max_line_len),
			socket_(ctx_->io_service, std::forward<Types_>(args)...),
			strand_(ctx_->io_service),
			work_(boost::asio::make_work_guard(ctx_->io_service))
		{
		}

		virtual ~basic_transport()
		{
			this->close();
			work_.reset();
			if (io_thread_.joinable())
				io_thread_.join();
		}

		void open(const std::string& host, std::uint16_t port, boost::system::error_code& ec)
		{
			boost::asio::ip::tcp::resolver resolver(ctx_->io_service);
			auto endpoints = resolver.resolve(host, std::to_string(port), ec);
			if (ec)
				return;
			boost::asio::connect(socket_.lowest_layer(), endpoints, ec);
			if (ec)
				return;

			boost::asio::ip::tcp::no_delay no_delay(true);
			socket_.lowest_layer().set_option(no_delay, ec);
			if (ec)
				return;
			boost::asio::socket_base::keep_alive option(true);
			socket_.lowest_layer().set_option(option, ec);
			if (ec)
				return;

			this->handshake(host, ec);
			if (ec)
				return;

			BOOST_LOG_TRIVIAL(info) << "Connected to " << host << ':' << port;
			io_thread_ = std::thread([this] {
				this->ctx_->io_service.run();
			});
		}

		/* Runs on the connecting thread before the io thread starts */
		virtual void handshake(const std::string& host, boost::system::error_code& ec) = 0;

		typedef std::promise<std::pair<boost::system::error_code, std::string> > read_promise;

		std::string read_line(boost::system::error_code& ec) override
		{
			read_promise done;
			auto result = done.get_future();
			boost::asio::post(strand_, [this, &done] {
				this->start_read(done, std::string());
			});
			auto value = result.get();
			ec = value.first;
			return std::move(value.second);
		}

		/// oversized holds the start of a line that did not fit in the buffer
		void start_read(read_promise& done, std::string oversized)
		{
			boost::asio::async_read_until(socket_, input_buffer_, "\r\n",
				boost::asio::bind_executor(strand_, [this, &done, oversized](const boost::system::error_code& error, std::size_t transferred) mutable {
				this->handle_read(error, transferred, done, std::move(oversized));
			}));
		}

		void handle_read(const boost::system::error_code& error, std::size_t transferred,
			read_promise& done, std::string oversized)
		{
			if (error == boost::asio::error::not_found)
			{
				// no CRLF within max_line_len, drop input up to the next one
				auto data = input_buffer_.data();
				const std::size_t keep = input_buffer_.size() > 0 && *(boost::asio::buffers_end(data) - 1) == '\r' ? 1 : 0;
				if (oversized.empty())
					oversized.assign(boost::asio::buffers_begin(data), boost::asio::buffers_end(data) - keep);
				input_buffer_.consume(input_buffer_.size() - keep);
				this->start_read(done, std::move(oversized));
				return;
			}

			std::string line;
			if (!error)
			{
				if (oversized.empty())
				{
					auto first = boost::asio::buffers_begin(input_buffer_.data());
					line.assign(first, first + transferred);
				}
				else
				{
					// still too long, the parser reports it and the next line is intact
					BOOST_LOG_TRIVIAL(debug) << "Discarded the tail of a line longer than " << max_line_len << " bytes";
					line = std::move(oversized);
					line += "\r\n";
				}
				input_buffer_.consume(transferred);
			}
			done.set_value(std::make_pair(error, std::move(line)));
		}

		void write(const boost::string_ref& bytes, boost::system::error_code& ec) override
		{
			auto pending = std::make_shared<pending_write>();
			pending->data = bytes.to_string();
			auto result = pending->done.get_future();
			boost::asio::post(strand_, [this, pending] {
				this->write_impl(pending);
			});
			ec = result.get();
		}

		void write_impl(const std::shared_ptr<pending_write>& pending)
		{
			this->outbound_queue_.push(pending);
			// return if we have a pending write
			if (this->outbound_queue_.size() > 1)
				return;
			this->start_write();
		}

		void start_write()
		{
			const std::string& message = this->outbound_queue_.front()->data;
			boost::asio::async_write(socket_,
				boost::asio::buffer(message),
				boost::asio::bind_executor(strand_, [this](const boost::system::error_code& error, std::size_t transferred) {
				this->handle_write(error, transferred);
			}));
		}

		void handle_write(const boost::system::error_code& error, std::size_t)
		{
			this->outbound_queue_.front()->done.set_value(error);
			this->outbound_queue_.pop();
			if (error)
			{
				// nothing queued behind a failed write can reach the peer
				while (!this->outbound_queue_.empty())
				{
					this->outbound_queue_.front()->done.set_value(error);
					this->outbound_queue_.pop();
				}
				return;
			}
			if (!this->outbound_queue_.empty())
				this->start_write();
		}

		void close() override
		{
			boost::asio::post(strand_, [this] {
				boost::system::error_code ec;
				socket_.lowest_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
				if (ec)
					BOOST_LOG_TRIVIAL(debug) << "Socket shutdown: " << ec.message();
				socket_.lowest_layer().close(ec);
				if (ec)
					BOOST_LOG_TRIVIAL(debug) << "Socket close: " << ec.message();
			});
		}

		std::unique_ptr<context> ctx_;
		boost::asio::streambuf input_buffer_;
		std::queue<std::shared_ptr<pending_write> > outbound_queue_;
		SocketType_ socket_;
		boost::asio::io_service::strand strand_;
		boost::asio::executor_work_guard<boost::asio::io_service::executor_type> work_;
		std::thread io_thread_;
	};

	struct ssl_transport : public basic_transport < boost::asio::ssl::stream<boost::asio::ip::tcp::socket> >
	{
		explicit ssl_transport(ssl_context * ctx, bool verify)
			:basic_transport(ctx, ctx->ssl_ctx), verify_(verify)
		{
		}

		void handshake(const std::string& host, boost::system::error_code& ec) override
		{
			// SNI, most networks serve several certificates from one address
			if (!SSL_set_tlsext_host_name(socket_.native_handle(), host.c_str()))
			{
				ec = boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category());
				return;
			}
			if (verify_)
			{
				socket_.set_verify_callback(boost::asio::ssl::rfc2818_verification(host), ec);
				if (ec)
					return;
			}
			socket_.handshake(boost::asio::ssl::stream_base::client, ec);
		}

		bool verify_;
	};

	struct tcp_transport : public basic_transport < boost::asio::ip::tcp::socket >
	{
		explicit tcp_transport(context * ctx)
			:basic_transport(ctx)
		{
		}

		void handshake(const std::string&, boost::system::error_code& ec) override
		{
			ec.clear();
		}
	};
}

namespace ircengine
{
	std::unique_ptr<transport> transport::connect(connection_security security, const std::string& host,
		std::uint16_t port, boost::system::error_code& ec)
	{
		if (security == connection_security::enforced || security == connection_security::no_verify)
		{
			const bool verify = security == connection_security::enforced;
			auto t = std::make_unique<ssl_transport>(
				new ssl_context(verify ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none), verify);
			t->open(host, port, ec);
			if (ec)
				return nullptr;
			return std::unique_ptr<transport>(std::move(t));
		}

		auto t = std::make_unique<tcp_transport>(new context());
		t->open(host, port, ec);
		if (ec)
			return nullptr;
		return std::unique_ptr<transport>(std::move(t));
	}
}
