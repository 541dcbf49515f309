//
// broadcast_config.hpp
// ~~~~~~~~~~~~~~~~~~~~
//
// Copyright (c) 2026 The motdcast authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef MOTDCAST_BROADCAST_CONFIG_HPP_INCLUDED
#define MOTDCAST_BROADCAST_CONFIG_HPP_INCLUDED

#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <nlohmann/json.hpp>

namespace motdcast {
namespace config {

/// a configuration document that can not be read, parsed or written
class config_error : public std::runtime_error
{
  public:
	using std::runtime_error::runtime_error;
};

/// one announced server
struct server_entry
{
	std::string name;
	std::string motd;
	unsigned short port;
	double interval; ///< seconds between two announcements
	bool auto_motd;
};

/*!
* The settings file.
*
* example:
* @code
* {
*     "motd_count": 2,
*     "motd": "A Minecraft Server",
*     "base_port": 25565,
*     "interval": 3.0,
*     "auto_motd": false,
*     "silent": false
* }
* @endcode
*
* announces two servers on port 25565 and 25566. Instead of motd_count, a "servers" array
* of {"port", "name", "motd", "interval", "auto_motd"} objects lists every server
* explicitly, only "port" is required there.
* */
struct broadcast_config
{
	unsigned int motd_count = 1;
	std::string motd = "A Minecraft Server";
	unsigned short base_port = 25565;
	double interval = 3.0;
	bool auto_motd = false;
	bool silent = false;
	std::vector<server_entry> servers; ///< explicit list, takes precedence over motd_count if not empty
};

inline broadcast_config default_config()
{
	return broadcast_config();
}

/// the announcers to run for cfg
inline std::vector<server_entry> make_servers(const broadcast_config& cfg)
{
	if (!cfg.servers.empty())
	{
		return cfg.servers;
	}

	std::vector<server_entry> servers;
	servers.reserve(cfg.motd_count);

	for (unsigned int i = 0; i != cfg.motd_count; ++i)
	{
		server_entry entry;
		entry.name = "Server " + std::to_string(i + 1);
		entry.motd = cfg.motd;
		entry.port = static_cast<unsigned short>(cfg.base_port + i);
		entry.interval = cfg.interval;
		entry.auto_motd = cfg.auto_motd;
		servers.push_back(entry);
	}

	return servers;
}

inline std::chrono::steady_clock::duration to_duration(const double seconds)
{
	return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
		std::chrono::duration<double>(seconds));
}

namespace detail {

inline std::int64_t read_integer(const nlohmann::json& j, const std::string& key,
	const std::int64_t min, const std::int64_t max)
{
	const nlohmann::json& value = j.at(key);
	if (!value.is_number_integer())
		throw config_error("'" + key + "' must be an integer");

	const bool too_large = value.is_number_unsigned() &&
		value.get<std::uint64_t>() > static_cast<std::uint64_t>(max);
	const std::int64_t result = too_large ? max : value.get<std::int64_t>();

	if (too_large || result < min || result > max)
	{
		throw config_error("'" + key + "' must be between " + std::to_string(min) +
			" and " + std::to_string(max));
	}
	return result;
}

inline double read_interval(const nlohmann::json& j, const std::string& key)
{
	const nlohmann::json& value = j.at(key);
	if (!value.is_number())
		throw config_error("'" + key + "' must be a number");

	const double result = value.get<double>();
	if (!std::isfinite(result) || result <= 0.0)
		throw config_error("'" + key + "' must be a positive number of seconds");
	return result;
}

inline std::string read_string(const nlohmann::json& j, const std::string& key)
{
	const nlohmann::json& value = j.at(key);
	if (!value.is_string())
		throw config_error("'" + key + "' must be a string");
	return value.get<std::string>();
}

inline bool read_bool(const nlohmann::json& j, const std::string& key)
{
	const nlohmann::json& value = j.at(key);
	if (!value.is_boolean())
		throw config_error("'" + key + "' must be true or false");
	return value.get<bool>();
}

inline server_entry read_server(const nlohmann::json& j, const broadcast_config& defaults, const std::size_t index)
{
	if (!j.is_object())
		throw config_error("every element of 'servers' must be an object");
	if (!j.contains("port"))
		throw config_error("server " + std::to_string(index + 1) + " has no 'port'");

	server_entry entry;
	entry.name = j.contains("name") ? read_string(j, "name") : "Server " + std::to_string(index + 1);
	entry.motd = j.contains("motd") ? read_string(j, "motd") : defaults.motd;
	entry.port = static_cast<unsigned short>(read_integer(j, "port", 1, 65535));
	entry.interval = j.contains("interval") ? read_interval(j, "interval") : defaults.interval;
	entry.auto_motd = j.contains("auto_motd") ? read_bool(j, "auto_motd") : defaults.auto_motd;
	return entry;
}

inline bool file_exists(const std::string& path)
{
	struct stat st;
	return ::stat(path.c_str(), &st) == 0;
}

}

/*!
* merge the settings in j over cfg. Keys missing in j keep the value they have in cfg,
* unknown keys are ignored.
*
* throws config_error if j is not an object or a value has the wrong type or range.
* */
inline void from_json(const nlohmann::json& j, broadcast_config& cfg)
{
	if (!j.is_object())
		throw config_error("configuration must be a JSON object");

	if (j.contains("motd_count"))
		cfg.motd_count = static_cast<unsigned int>(detail::read_integer(j, "motd_count", 0, 65535));
	if (j.contains("motd"))
		cfg.motd = detail::read_string(j, "motd");
	if (j.contains("base_port"))
		cfg.base_port = static_cast<unsigned short>(detail::read_integer(j, "base_port", 1, 65535));
	if (j.contains("interval"))
		cfg.interval = detail::read_interval(j, "interval");
	if (j.contains("auto_motd"))
		cfg.auto_motd = detail::read_bool(j, "auto_motd");
	if (j.contains("silent"))
		cfg.silent = detail::read_bool(j, "silent");

	cfg.servers.clear();
	if (j.contains("servers"))
	{
		const nlohmann::json& servers = j.at("servers");
		if (!servers.is_array())
			throw config_error("'servers' must be an array");

		for (std::size_t i = 0; i != servers.size(); ++i)
		{
			cfg.servers.push_back(detail::read_server(servers[i], cfg, i));
		}
	}

	// an empty "servers" array falls back to generating from motd_count as well
	if (cfg.servers.empty() && cfg.motd_count > 0 && cfg.base_port + (cfg.motd_count - 1) > 65535u)
	{
		throw config_error("base_port " + std::to_string(cfg.base_port) + " leaves no room for " +
			std::to_string(cfg.motd_count) + " servers");
	}
}

/*!
* read one explicit server. Missing optional keys take the default settings, a missing
* name becomes "Server 1". throws config_error.
* */
inline void from_json(const nlohmann::json& j, server_entry& entry)
{
	entry = detail::read_server(j, default_config(), 0);
}

template <typename BasicJsonType>
void to_json(BasicJsonType& j, const server_entry& entry)
{
	j = BasicJsonType::object();
	j["name"] = entry.name;
	j["motd"] = entry.motd;
	j["port"] = entry.port;
	j["interval"] = entry.interval;
	j["auto_motd"] = entry.auto_motd;
}

/// writes "servers" only for an explicit list
template <typename BasicJsonType>
void to_json(BasicJsonType& j, const broadcast_config& cfg)
{
	j = BasicJsonType::object();
	j["motd_count"] = cfg.motd_count;
	j["motd"] = cfg.motd;
	j["base_port"] = cfg.base_port;
	j["interval"] = cfg.interval;
	j["auto_motd"] = cfg.auto_motd;
	j["silent"] = cfg.silent;

	if (!cfg.servers.empty())
	{
		j["servers"] = cfg.servers;
	}
}

/// the document written to disk, keys in the order a user reads them
inline nlohmann::ordered_json to_document(const broadcast_config& cfg)
{
	nlohmann::ordered_json j;
	to_json(j, cfg);
	return j;
}

/// parse a settings document, merged over the defaults. throws config_error.
inline broadcast_config read_config(std::istream& is)
{
	nlohmann::json j;
	try
	{
		j = nlohmann::json::parse(is);
	}
	catch (const nlohmann::json::parse_error& e)
	{
		throw config_error(e.what());
	}

	broadcast_config cfg = default_config();
	from_json(j, cfg);
	return cfg;
}

inline broadcast_config read_config(const std::string& path)
{
	std::ifstream file(path.c_str());
	if (!file)
		throw config_error("cannot open " + path);
	return read_config(file);
}

/// write cfg to path as indented JSON. throws config_error.
inline void save_config(const std::string& path, const broadcast_config& cfg)
{
	std::ofstream file(path.c_str());
	if (!file)
		throw config_error("cannot create " + path);

	file << to_document(cfg).dump(4) << '\n';

	if (!file)
		throw config_error("cannot write " + path);
}

enum class load_status
{
	loaded, ///< the file has been read
	created, ///< there was no file, one with the defaults has been written
	create_failed, ///< there was no file and none could be written, defaults are used
	fallback ///< the file could not be read or is invalid, defaults are used
};

struct load_result
{
	broadcast_config config;
	std::vector<server_entry> servers;
	load_status status = load_status::loaded;
	std::string message; ///< what happened, empty if status is loaded
};

/*!
* load the settings at path. Never throws: if there is no file, the defaults are written to
* path, if the file is broken, it is left alone and the defaults are used.
* */
inline load_result load_config(const std::string& path)
{
	load_result result;

	if (!detail::file_exists(path))
	{
		try
		{
			save_config(path, result.config);
			result.status = load_status::created;
			result.message = "created default configuration file " + path;
		}
		catch (const config_error& e)
		{
			result.status = load_status::create_failed;
			result.message = std::string("failed to create configuration file: ") + e.what() +
				", using default configuration";
		}

		result.servers = make_servers(result.config);
		return result;
	}

	try
	{
		result.config = read_config(path);
	}
	catch (const config_error& e)
	{
		result.config = default_config();
		result.status = load_status::fallback;
		result.message = "failed to read configuration file " + path + ": " + e.what() +
			", using default configuration";
	}

	result.servers = make_servers(result.config);
	return result;
}

inline const char* to_string(const load_status status)
{
	switch (status)
	{
		case load_status::loaded: return "loaded";
		case load_status::created: return "created";
		case load_status::create_failed: return "create_failed";
		case load_status::fallback: return "fallback";
	}
	return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, const load_status status)
{
	return os << to_string(status);
}

}
}

#endif /* MOTDCAST_BROADCAST_CONFIG_HPP_INCLUDED */
