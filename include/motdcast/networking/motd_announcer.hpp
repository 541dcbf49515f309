//
// motd_announcer.hpp
// ~~~~~~~~~~~~~~~~~~
//
// Copyright (c) 2015 Benjamin Schulz (beschulz at betabugs dot de)
// Copyright (c) 2026 The motdcast authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MOTDCAST_MOTD_ANNOUNCER_HPP_INCLUDED
#define MOTDCAST_MOTD_ANNOUNCER_HPP_INCLUDED

#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../version.hpp"

namespace motdcast {
namespace networking {

/// thrown by motd_announcer::start() when the announcer is already running
class already_running : public std::logic_error
{
  public:
	already_running()
		: std::logic_error("announcer is already running")
	{
	}
};

/*!
* class to announce a game server to the LAN the way a Minecraft client listens for it:
* a "[MOTD]text[/MOTD][AD]port[/AD]" datagram sent to 224.0.2.60:4445 once per interval.
*
* example:
* @code
* motd_announcer announcer("My Server", 25565);
*
* announcer.start();
* // ...
* announcer.stop();
* @endcode
*
* Every announcer owns its socket, its io_service and the thread running it, so announcers
* never interfere with each other.
*
* Note: Failed sends are counted and reported to std::clog, the next tick is sent anyway.
* */
class motd_announcer
{
  public:
	static unsigned short default_multicast_port()
	{
		return 4445;
	}

	static boost::asio::ip::address default_multicast_address()
	{
		return boost::asio::ip::address::from_string("224.0.2.60");
	}

	static std::chrono::steady_clock::duration default_interval()
	{
		return std::chrono::seconds(3);
	}

	/// the datagram body announcing motd on server_port
	static std::string format_message(const std::string& motd, const unsigned short server_port)
	{
		std::ostringstream os;
		os << "[MOTD]" << motd << "[/MOTD][AD]" << server_port << "[/AD]";
		return os.str();
	}

	/*!
	* announce motd for a server listening on server_port, once every interval.
	* Note, that it is not required, that a server actually listens on server_port.
	*
	* throws std::invalid_argument if interval is not positive and boost::system::system_error
	* if no socket could be opened.
	* */
	motd_announcer(
		const std::string& motd, ///< message of the day, surrounding whitespace is removed
		const unsigned short server_port, ///< the port where the game server listens on
		const std::chrono::steady_clock::duration interval = default_interval(), ///< time between two announcements
		const unsigned short multicast_port = default_multicast_port(), ///< the port this udp multicast sender sends to
		const boost::asio::ip::address& multicast_address = default_multicast_address() ///< clients only listen on 224.0.2.60
	)
		: endpoint_(multicast_address, multicast_port)
		, socket_(io_service_, endpoint_.protocol())
		, timer_(io_service_)
		, motd_(trim(motd))
		, server_port_(server_port)
		, interval_(interval)
		, message_(format_message(motd_, server_port_))
		, running_(false)
		, stopping_(false)
		, sent_count_(0)
		, failed_count_(0)
	{
		if (interval_ <= std::chrono::steady_clock::duration::zero())
		{
			throw std::invalid_argument("announcement interval must be positive");
		}

		if (endpoint_.address().is_multicast())
		{
			// clients on this very host have to see the announcement too
			socket_.set_option(boost::asio::ip::multicast::enable_loopback(true));
		}
	}

	motd_announcer(const motd_announcer&) = delete;
	motd_announcer& operator=(const motd_announcer&) = delete;

	~motd_announcer()
	{
		stop();
	}

	/*!
	* send the first announcement right away and one more every interval, on a thread of its own.
	* throws already_running, if the announcer has been started and not stopped since.
	* */
	void start()
	{
		std::lock_guard<std::mutex> lock(lifecycle_mutex_);

		if (running_)
		{
			throw already_running();
		}

		stopping_ = false;
		io_service_.reset();
		next_tick_ = std::chrono::steady_clock::now();
		io_service_.post(
			[this]()
			{
				this->write_message();
			});

		running_ = true;
		thread_ = std::thread(
			[this]()
			{
				io_service_.run();
			});
	}

	/*!
	* stop announcing. Blocks until the announcing thread has finished, no datagram is sent
	* after this returns. Does nothing if the announcer is not running.
	* */
	void stop()
	{
		std::lock_guard<std::mutex> lock(lifecycle_mutex_);

		if (!thread_.joinable())
		{
			return;
		}

		stopping_ = true;
		io_service_.stop();
		thread_.join();

		// flush the handlers abandoned by io_service::stop(), so a later start() begins with an empty queue
		boost::system::error_code ec;
		timer_.cancel(ec);
		if (ec)
			std::cerr << ec.message() << std::endl;
		socket_.cancel(ec);
		if (ec)
			std::cerr << ec.message() << std::endl;
		io_service_.reset();
		io_service_.poll();

		running_ = false;
	}

	bool is_running() const
	{
		return running_;
	}

	/// human readable snapshot of the announcer
	std::string describe() const
	{
		std::ostringstream os;
		os << "Minecraft MOTD Broadcaster " << MOTDCAST_VERSION_STRING << "\n"
			<< "Status: " << (is_running() ? "Running" : "Stopped") << "\n"
			<< "MOTD: " << motd_ << "\n"
			<< "Port: " << server_port_ << "\n"
			<< "Broadcast: " << endpoint_ << "\n"
			<< "Interval: " << interval_in_seconds() << "s";
		return os.str();
	}

	const std::string& motd() const
	{
		return motd_;
	}

	unsigned short server_port() const
	{
		return server_port_;
	}

	std::chrono::steady_clock::duration interval() const
	{
		return interval_;
	}

	double interval_in_seconds() const
	{
		return std::chrono::duration_cast<std::chrono::duration<double>>(interval_).count();
	}

	const boost::asio::ip::udp::endpoint& endpoint() const
	{
		return endpoint_;
	}

	/// the exact datagram body
	const std::string& message() const
	{
		return message_;
	}

	/// number of datagrams handed to the network since construction
	std::size_t sent_count() const
	{
		return sent_count_;
	}

	/// number of sends that failed since construction
	std::size_t failed_count() const
	{
		return failed_count_;
	}

	friend std::ostream& operator<<(std::ostream& os, const motd_announcer& announcer)
	{
		return os << announcer.describe();
	}

  private:
	static std::string trim(const std::string& s)
	{
		const char* whitespace = " \t\r\n\v\f";
		const std::string::size_type begin = s.find_first_not_of(whitespace);
		if (begin == std::string::npos)
			return std::string();
		const std::string::size_type end = s.find_last_not_of(whitespace);
		return s.substr(begin, end - begin + 1);
	}

	void handle_send_to(const boost::system::error_code& error)
	{
		if (error == boost::asio::error::operation_aborted)
		{
			return;
		}

		if (error)
		{
			++failed_count_;

			// report a run of identical failures only once
			if (error != last_error_)
			{
				std::clog << "announcing to " << endpoint_ << " failed: " << error.message() << std::endl;
			}
			last_error_ = error;
		}
		else
		{
			++sent_count_;
			last_error_.clear();
		}

		if (!stopping_)
		{
			schedule_next_tick();
		}
	}

	void handle_timeout(const boost::system::error_code& error)
	{
		if (stopping_ || error == boost::asio::error::operation_aborted)
		{
			return;
		}

		if (error)
		{
			std::cerr << error.message() << std::endl;
		}

		write_message();
	}

	void schedule_next_tick()
	{
		const auto now = std::chrono::steady_clock::now();

		// ticks are aligned to the start time. After a stall, skip the missed ones instead of bursting.
		next_tick_ += interval_;
		if (next_tick_ < now)
		{
			next_tick_ = now + interval_;
		}

		timer_.expires_at(next_tick_);
		timer_.async_wait(
			[this](const boost::system::error_code& error)
			{
				this->handle_timeout(error);
			});
	}

	void write_message()
	{
		if (stopping_)
		{
			return;
		}

		socket_.async_send_to(
			boost::asio::buffer(message_), endpoint_,
			[this](const boost::system::error_code& error, std::size_t /*bytes_transferred*/)
			{
				this->handle_send_to(error);
			}
		);
	}

  private:
	boost::asio::io_service io_service_;
	boost::asio::ip::udp::endpoint endpoint_;
	boost::asio::ip::udp::socket socket_;
	boost::asio::steady_timer timer_;
	const std::string motd_;
	const unsigned short server_port_;
	const std::chrono::steady_clock::duration interval_;
	const std::string message_;

	std::mutex lifecycle_mutex_;
	std::thread thread_;
	std::atomic<bool> running_;
	std::atomic<bool> stopping_;
	std::atomic<std::size_t> sent_count_;
	std::atomic<std::size_t> failed_count_;

	// only touched by the announcing thread
	std::chrono::steady_clock::time_point next_tick_;
	boost::system::error_code last_error_;
};

}
}

#endif /* MOTDCAST_MOTD_ANNOUNCER_HPP_INCLUDED */
