//
// main.cpp
// ~~~~~~~~
//
// Copyright (c) 2026 The motdcast authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <motdcast/announcer_fleet.hpp>
#include <motdcast/config/broadcast_config.hpp>
#include <motdcast/version.hpp>

#include <csignal>
#include <iostream>
#include <string>
#include <getopt.h>

using namespace motdcast;

namespace {

void usage(const char* prog, std::ostream& os)
{
	os << "Usage: " << prog << " [-c <file>] [-f] [-V] [-h]\n\n"
		<< "Announces game servers to the LAN as Minecraft \"Open to LAN\" worlds.\n\n"
		<< "Options:\n"
		<< "  -c, --config <file>  Configuration file (default: mc_motd_config.json)\n"
		<< "  -f, --force          Start right away, even if the configuration file was just created\n"
		<< "  -V, --version        Print the version and exit\n"
		<< "  -h, --help           Show this help\n";
}

const std::string rule(60, '=');

void print_banner(const announcer_fleet& fleet)
{
	std::cout << "\n" << rule << "\n"
		<< "Minecraft MOTD Broadcaster " << MOTDCAST_VERSION_STRING << " - multi server mode\n"
		<< rule << "\n";

	for (const auto& server : fleet.servers())
	{
		const networking::motd_announcer& announcer = *server.announcer;
		std::cout << "\n" << server.entry.name << ":\n"
			<< "  MOTD: " << announcer.motd() << "\n"
			<< "  Port: " << announcer.server_port() << "\n"
			<< "  Broadcast: " << announcer.endpoint() << "\n"
			<< "  Interval: " << announcer.interval_in_seconds() << "s\n"
			<< "  Status: " << (announcer.is_running() ? "Running" : "Stopped") << "\n";
	}

	std::cout << "\n" << rule << "\n"
		<< "Announcing Minecraft servers to the LAN...\n"
		<< "Servers: " << fleet.size() << "\n"
		<< "Press Ctrl+C to stop all announcers." << std::endl;
}

}

int main(int argc, char* argv[])
{
	std::string config_path = "mc_motd_config.json";
	bool force = false;

	const option long_options[] = {
		{"config", required_argument, nullptr, 'c'},
		{"force", no_argument, nullptr, 'f'},
		{"version", no_argument, nullptr, 'V'},
		{"help", no_argument, nullptr, 'h'},
		{nullptr, 0, nullptr, 0}
	};

	int opt;
	while ((opt = ::getopt_long(argc, argv, "c:fVh", long_options, nullptr)) != -1)
	{
		switch (opt)
		{
			case 'c': config_path = optarg; break;
			case 'f': force = true; break;
			case 'V': std::cout << "motdcast " << MOTDCAST_VERSION_STRING << std::endl; return 0;
			case 'h': usage(argv[0], std::cout); return 0;
			default: usage(argv[0], std::cerr); return 1;
		}
	}

	if (optind < argc)
	{
		std::cerr << "unexpected argument: " << argv[optind] << "\n";
		usage(argv[0], std::cerr);
		return 1;
	}

	const config::load_result loaded = config::load_config(config_path);

	switch (loaded.status)
	{
		case config::load_status::loaded:
			break;

		case config::load_status::created:
			std::cout << "\nGenerated default configuration file: " << config_path << std::endl;
			if (should_wait_for_edit(loaded, force))
			{
				std::cout << "\nEdit the configuration file to set your MOTD and port, then start the program again.\n"
					<< "\nConfiguration:\n"
					<< config::to_document(loaded.config).dump(4) << "\n"
					<< "\nPress Enter to exit..." << std::endl;

				std::string line;
				std::getline(std::cin, line);
				return 0;
			}
			break;

		case config::load_status::create_failed:
		case config::load_status::fallback:
			std::cerr << "warning: " << loaded.message << std::endl;
			break;
	}

	const bool silent = loaded.config.silent;

	announcer_fleet fleet(loaded.servers);

	if (fleet.empty())
	{
		std::cerr << "no server to announce" << std::endl;
		return 1;
	}

	// catch the signals before any announcer runs
	boost::asio::io_service io_service;
	boost::asio::signal_set signals(io_service, SIGINT, SIGTERM);
	signals.async_wait(
		[silent](const boost::system::error_code& error, int /*signal_number*/)
		{
			if (error)
			{
				std::cerr << error.message() << std::endl;
			}
			else if (!silent)
			{
				std::cout << "\nStopping all announcers..." << std::endl;
			}
		});

	if (!silent)
	{
		for (const auto& server : fleet.servers())
		{
			if (server.entry.auto_motd)
				std::cout << server.entry.name << ": auto_motd is not supported, announcing the configured MOTD" << std::endl;
		}
	}

	if (fleet.start_all() == 0)
	{
		std::cerr << "no server to announce" << std::endl;
		return 1;
	}

	if (!silent)
	{
		print_banner(fleet);
	}

	io_service.run();

	fleet.stop_all();

	if (!silent)
	{
		std::cout << "All " << fleet.size() << " announcers stopped." << std::endl;
	}

	return 0;
}
