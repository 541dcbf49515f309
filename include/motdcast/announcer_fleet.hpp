//
// announcer_fleet.hpp
// ~~~~~~~~~~~~~~~~~~~
//
// Copyright (c) 2026 The motdcast authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MOTDCAST_ANNOUNCER_FLEET_HPP_INCLUDED
#define MOTDCAST_ANNOUNCER_FLEET_HPP_INCLUDED

#pragma once

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <boost/asio.hpp>

#include "config/broadcast_config.hpp"
#include "networking/motd_announcer.hpp"

namespace motdcast {

/// true, if the configuration file has just been created and the user should edit it first
inline bool should_wait_for_edit(const config::load_result& loaded, const bool force)
{
	return loaded.status == config::load_status::created && !force;
}

/*!
* one announcer per configured server.
*
* example:
* @code
* announcer_fleet fleet(config::load_config("mc_motd_config.json").servers);
*
* if (fleet.empty())
* 	return 1;
*
* fleet.start_all();
* // wait for a signal
* fleet.stop_all();
* @endcode
*
* Servers whose announcer can not be created or started are reported to the error stream
* and left out of the fleet, the others keep running.
* */
class announcer_fleet
{
  public:
	struct member
	{
		config::server_entry entry;
		std::unique_ptr<networking::motd_announcer> announcer;
	};

	typedef std::vector<member> members;

	announcer_fleet(
		const std::vector<config::server_entry>& servers, ///< usually load_result::servers
		std::ostream& errors = std::cerr, ///< where failing servers are reported
		const unsigned short multicast_port = networking::motd_announcer::default_multicast_port(), ///< passed on to every announcer
		const boost::asio::ip::address& multicast_address = networking::motd_announcer::default_multicast_address() ///< passed on to every announcer
	)
		: errors_(errors)
	{
		members_.reserve(servers.size());

		for (const auto& entry : servers)
		{
			member m;
			m.entry = entry;

			try
			{
				m.announcer.reset(new networking::motd_announcer(
					entry.motd, entry.port, config::to_duration(entry.interval),
					multicast_port, multicast_address));
			}
			catch (const boost::system::system_error& e)
			{
				report(entry, std::string("cannot create announcer: ") + e.what());
				continue;
			}
			catch (const std::invalid_argument& e)
			{
				report(entry, e.what());
				continue;
			}

			members_.push_back(std::move(m));
		}
	}

	announcer_fleet(const announcer_fleet&) = delete;
	announcer_fleet& operator=(const announcer_fleet&) = delete;

	~announcer_fleet()
	{
		stop_all();
	}

	/// start every announcer that is not running yet, returns how many are running afterwards
	std::size_t start_all()
	{
		for (auto i = members_.begin(); i != members_.end();)
		{
			if (i->announcer->is_running())
			{
				++i;
				continue;
			}

			try
			{
				i->announcer->start();
				++i;
			}
			catch (const std::system_error& e)
			{
				report(i->entry, std::string("cannot start announcer: ") + e.what());
				i = members_.erase(i);
			}
		}

		return members_.size();
	}

	/// stop every announcer, in configuration order
	void stop_all()
	{
		for (auto& m : members_)
		{
			m.announcer->stop();
		}
	}

	bool empty() const
	{
		return members_.empty();
	}

	std::size_t size() const
	{
		return members_.size();
	}

	const members& servers() const
	{
		return members_;
	}

	/// "<server name>: <reason>" for every server left out
	const std::vector<std::string>& failures() const
	{
		return failures_;
	}

  private:
	void report(const config::server_entry& entry, const std::string& reason)
	{
		failures_.push_back(entry.name + ": " + reason);
		errors_ << failures_.back() << std::endl;
	}

	std::ostream& errors_;
	members members_;
	std::vector<std::string> failures_;
};

}

#endif /* MOTDCAST_ANNOUNCER_FLEET_HPP_INCLUDED */
